#ifndef UDP_HPP
#define UDP_HPP
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <atomic>
#include "channel.hpp"
#include "protocol.hpp"
#include "utils.hpp"

// longest a blocked recv waits before checking for close()
static const unsigned int POLL_SLICE = 100; // ms

class UDP : public Channel {
public:
    UDP();
    ~UDP();
    // bind local addr, port 0 picks an ephemeral port
    int bind(const char *ip, int port);
    // fix the peer, otherwise the source of the first SYN received becomes the peer
    int set_peer(const char *ip, int port);
    bool has_peer() const {
        return peer_set;
    }
    int get_port() const;

    int send_raw(const char *buf, int len) override;
    int recv_raw(char *buf, int len, unsigned int timeout) override;
    void close() override;
    bool is_closed() const override {
        return closed;
    }

private:
    int sock;
    struct sockaddr_in addr;
    struct sockaddr_in peer;
    std::atomic<bool> peer_set;
    std::atomic<bool> closed;
};

#endif
