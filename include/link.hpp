#ifndef LINK_HPP
#define LINK_HPP
#include <atomic>
#include "channel.hpp"
#include "loss.hpp"
#include "protocol.hpp"

// Packet-level view of a Channel: filters, then encodes or decodes.
class PacketLink {
public:
    explicit PacketLink(Channel &channel);

    // either may be nullptr, filters are not owned
    void set_filters(PacketFilter *incoming, PacketFilter *outgoing) {
        this->incoming = incoming;
        this->outgoing = outgoing;
    }

    // send packet to peer, return datagram size or E_TRANSFER_ABORTED
    int send_packet(const DRTPPacket *packet);
    // recv a valid packet into packet (BUF_SIZE bytes) with timeout in milliseconds (0 for no timeout)
    // return datagram size, 0 on timeout, E_FILTERED_PACKET, E_CORRUPT_PACKET or E_TRANSFER_ABORTED
    int recv_packet(DRTPPacket *packet, unsigned int timeout = 0);

    void close() {
        channel.close();
    }
    bool is_closed() const {
        return channel.is_closed();
    }

    unsigned int get_packets_sent() const {
        return packets_sent;
    }
    unsigned int get_packets_recv() const {
        return packets_recv;
    }
    unsigned int get_packets_dropped() const {
        return packets_dropped;
    }
    unsigned int get_packets_corrupt() const {
        return packets_corrupt;
    }

private:
    Channel &channel;
    PacketFilter *incoming = nullptr;
    PacketFilter *outgoing = nullptr;
    std::atomic<unsigned int> packets_sent;
    std::atomic<unsigned int> packets_recv;
    std::atomic<unsigned int> packets_dropped;
    std::atomic<unsigned int> packets_corrupt;
};

#endif
