#ifndef CHANNEL_HPP
#define CHANNEL_HPP

// Unreliable datagram transport between this endpoint and its single peer.
// Datagrams may be lost, duplicated, delayed or corrupted in transit.
class Channel {
public:
    virtual ~Channel() {}

    // send one datagram to the peer, return bytes sent or E_TRANSFER_ABORTED
    virtual int send_raw(const char *buf, int len) = 0;

    // recv one datagram with timeout in milliseconds (0 for no timeout)
    // return bytes received, 0 on timeout, E_TRANSFER_ABORTED once closed or on I/O error
    virtual int recv_raw(char *buf, int len, unsigned int timeout) = 0;

    // wake up blocked receivers and fail all further I/O
    virtual void close() = 0;

    virtual bool is_closed() const = 0;
};

#endif
