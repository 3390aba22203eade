#include "udp.hpp"
#include <poll.h>
#include <chrono>
#include <cstddef>

// intact SYN datagram, the only one that may open a session
static bool is_syn(const char *buf, int len) {
    if (len < (int)HEADER_SIZE || DRTPChecksum(buf, len) != 0) {
        return false;
    }
    uint16_t flags;
    memcpy(&flags, buf + offsetof(DRTPHeader, flags), sizeof(flags));
    flags = ntohs(flags);
    return (flags & TYPE_SYN) && !(flags & TYPE_ACK);
}

UDP::UDP() : peer_set(false), closed(false) {
    // create socket
    sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        err("UDP::UDP(): Error creating socket");
        closed = true;
    }
    memset(&addr, 0, sizeof(addr));
    memset(&peer, 0, sizeof(peer));
}

UDP::~UDP() {
    if (sock >= 0) {
        ::close(sock);
    }
}

int UDP::bind(const char *ip, int port) {
    if (sock < 0) {
        return -1;
    }
    // set addr
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip, &addr.sin_addr) <= 0) {
        err("UDP::bind(): Error converting ip address");
        return -1;
    }
    // bind addr
    if (::bind(sock, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        err(("UDP::bind(): Error binding socket: " + std::string(strerror(errno))).c_str());
        return -1;
    }
    return 0;
}

int UDP::set_peer(const char *ip, int port) {
    memset(&peer, 0, sizeof(peer));
    peer.sin_family = AF_INET;
    peer.sin_port = htons(port);
    if (inet_pton(AF_INET, ip, &peer.sin_addr) <= 0) {
        err("UDP::set_peer(): Error converting ip address");
        return -1;
    }
    peer_set = true;
    return 0;
}

int UDP::get_port() const {
    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(sock, (struct sockaddr *)&bound, &len) < 0) {
        return -1;
    }
    return ntohs(bound.sin_port);
}

// send datagram to peer and return the number of bytes sent
int UDP::send_raw(const char *buf, int len) {
    if (closed) {
        return E_TRANSFER_ABORTED;
    }
    if (!peer_set) {
        err("UDP::send_raw(): No peer");
        return E_TRANSFER_ABORTED;
    }
    int ret = sendto(sock, buf, len, 0, (struct sockaddr *)&peer, sizeof(peer));
    if (ret < 0) {
        err(("UDP::send_raw(): Error sending packet: " + std::string(strerror(errno))).c_str());
        return E_TRANSFER_ABORTED;
    }
    return ret;
}

// recv datagram from peer with timeout in milliseconds (0 for no timeout)
int UDP::recv_raw(char *buf, int len, unsigned int timeout) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout);
    while (true) {
        if (closed) {
            return E_TRANSFER_ABORTED;
        }
        int slice = POLL_SLICE;
        if (timeout > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                return 0;
            }
            if (remaining < slice) {
                slice = remaining;
            }
        }
        struct pollfd pfd;
        pfd.fd = sock;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, slice);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            err(("UDP::recv_raw(): Error polling socket: " + std::string(strerror(errno))).c_str());
            return E_TRANSFER_ABORTED;
        }
        if (ready == 0) {
            continue;
        }

        struct sockaddr_in from;
        socklen_t from_len = sizeof(from);
        int ret = recvfrom(sock, buf, len, 0, (struct sockaddr *)&from, &from_len);
        if (ret < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            err(("UDP::recv_raw(): Error receiving packet: " + std::string(strerror(errno))).c_str());
            return E_TRANSFER_ABORTED;
        }
        if (ret == 0) {
            continue;
        }
        if (!peer_set) {
            if (!is_syn(buf, ret)) {
                debug("UDP::recv_raw(): Ignore datagram before SYN");
                continue;
            }
            peer = from;
            peer_set = true;
        } else if (from.sin_addr.s_addr != peer.sin_addr.s_addr || from.sin_port != peer.sin_port) {
            debug("UDP::recv_raw(): Ignore datagram from unknown peer");
            continue;
        }
        return ret;
    }
}

void UDP::close() {
    closed = true;
}
