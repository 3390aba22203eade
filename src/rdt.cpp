#include "rdt.hpp"
#include <cstring>

RDTSender::RDTSender(Channel &channel, unsigned int window_size, unsigned int timeout, unsigned int max_retries)
    : misses(0), link(channel), state(CLOSED), N(window_size), arq_timeout(timeout),
      max_retries(max_retries), timer(timeout), max_in_flight(0), retransmissions(0) {
    if (N == 0) {
        err("RDTSender::RDTSender(): Window size must be positive, using 1");
        N = 1;
    }
}

RDTSender::~RDTSender() {
    {
        std::unique_lock<std::mutex> lck(window_mtx);
        if (state != CLOSED_FINAL && state != CLOSED) {
            fail();
        }
    }
    join_threads();
    for (auto packet : send_buffer) {
        DRTPFreePacket(packet);
    }
}

int RDTSender::connect(const SessionInfo &info) {
    // if already connected
    if (state != CLOSED) {
        err("RDTSender::connect(): Already connected");
        return E_TRANSFER_ABORTED;
    }
    SessionInfo syn_info = info;
    syn_info.window = N;
    DRTPPacket *packet = DRTPAllocPacket(MSS);
    int len = DRTPEncodeSessionInfo(syn_info, packet->payload, MSS);
    if (len < 0) {
        err("RDTSender::connect(): File name too long");
        DRTPFreePacket(packet);
        return E_TRANSFER_ABORTED;
    }
    DRTPHeaderEncode(&packet->header, TYPE_SYN, isn, 0, len);

    // retry until SYN+ACK received
    DRTPPacket *recv_packet = DRTPAllocPacket(MSS);
    int ret = E_HANDSHAKE_TIMEOUT;
    for (unsigned int i = 0; i < max_retries && ret == E_HANDSHAKE_TIMEOUT; i++) {
        // send SYN
        if (link.send_packet(packet) < 0) {
            ret = E_TRANSFER_ABORTED;
            break;
        }
        state = SYN_SENT;
        log("RDTSender::connect(): SYN sent");
        // recv SYN+ACK until this attempt times out
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(arq_timeout);
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                log("RDTSender::connect(): Timeout, retry");
                break;
            }
            int size = link.recv_packet(recv_packet, remaining);
            if (size == E_TRANSFER_ABORTED) {
                ret = E_TRANSFER_ABORTED;
                break;
            }
            // check if SYN+ACK for our SYN
            if (size > 0
                && recv_packet->header.flags & TYPE_SYN
                && recv_packet->header.flags & TYPE_ACK
                && recv_packet->header.ack == isn) {
                log("RDTSender::connect(): SYN+ACK received, connection established");
                ret = 0;
                break;
            }
        }
    }
    DRTPFreePacket(packet);
    DRTPFreePacket(recv_packet);

    if (ret != 0) {
        state = ret == E_TRANSFER_ABORTED ? ABORTED : CLOSED;
        err(("RDTSender::connect(): " + std::string(DRTPErrorStr(ret))).c_str());
        return ret;
    }

    base = isn + 1;
    next_seq = isn + 1;
    state = ESTABLISHED;
    recv_thread = std::thread(&RDTSender::recv_ack_go_back_n, this);
    timer_thread = std::thread(&RDTSender::timer_go_back_n, this);
    return 0;
}

int RDTSender::terminate() {
    int ret = 0;
    {
        std::unique_lock<std::mutex> lck(window_mtx);
        if (state == CLOSED || state == SYN_SENT) {
            err("RDTSender::terminate(): Not connected");
            return E_TRANSFER_ABORTED;
        }
        if (state == ESTABLISHED) {
            // FIN takes a slot in the window like any segment
            window_cv.wait(lck, [this] { return next_seq - base < N || state == ABORTED; });
            if (state != ABORTED) {
                state = FIN_WAIT;
                log(("RDTSender::terminate(): FIN sent, seq=" + std::to_string(next_seq)).c_str());
                if (send_segment(TYPE_FIN, nullptr, 0) >= 0) {
                    window_cv.wait(lck, [this] { return base == next_seq || state == ABORTED; });
                }
            }
        }
        if (state == ABORTED) {
            ret = E_TRANSFER_ABORTED;
        } else {
            state = CLOSED_FINAL;
            timer.stop();
            log("RDTSender::terminate(): FIN acknowledged, connection closed");
        }
        timer_cv.notify_all();
    }
    join_threads();
    return ret;
}

int RDTSender::send_data(const char *data, int len) {
    if (len < 0 || len > (int)MSS) {
        err("RDTSender::send_data(): Segment larger than MSS");
        return E_TRANSFER_ABORTED;
    }
    std::unique_lock<std::mutex> lck(window_mtx);
    // wait until window is not full
    window_cv.wait(lck, [this] { return next_seq - base < N || state != ESTABLISHED; });
    if (state != ESTABLISHED) {
        if (state != ABORTED) {
            err("RDTSender::send_data(): Not connected");
        }
        return E_TRANSFER_ABORTED;
    }
    return send_segment(TYPE_DATA, data, len);
}

void RDTSender::abort() {
    {
        std::unique_lock<std::mutex> lck(window_mtx);
        if (state != CLOSED_FINAL) {
            fail();
        }
    }
    link.close();
}

// window_mtx must be held
int RDTSender::send_segment(uint16_t flags, const char *data, int len) {
    DRTPPacket *packet = DRTPAllocPacket(len);
    DRTPHeaderEncode(&packet->header, flags, next_seq, 0, len);
    if (len > 0) {
        memcpy(packet->payload, data, len);
    }
    send_buffer.push_back(packet);
    next_seq++;
    if (next_seq - base > max_in_flight) {
        max_in_flight = next_seq - base;
    }
    debug(("RDTSender::send_data(): packet seq=" + std::to_string(packet->header.seq)
        + " sent, sliding window=" + window_str()).c_str());
    if (link.send_packet(packet) < 0) {
        fail();
        return E_TRANSFER_ABORTED;
    }

    // start timer
    if (!timer.running()) {
        timer.start();
        timer_cv.notify_one();
    }
    return len;
}

void RDTSender::recv_ack_go_back_n() {
    // thread that receives ack and updates base
    DRTPPacket *packet = DRTPAllocPacket(MSS);
    while (state != CLOSED_FINAL && state != ABORTED) {
        // bounded wait so a finished session is noticed
        int len = link.recv_packet(packet, arq_timeout);
        if (len == E_TRANSFER_ABORTED) {
            std::unique_lock<std::mutex> lck(window_mtx);
            if (state != CLOSED_FINAL) {
                err("RDTSender::recv_ack_go_back_n(): Channel closed");
                fail();
            }
            break;
        }
        if (len <= 0 || !(packet->header.flags & TYPE_ACK)) {
            continue;
        }
        // fetch lock
        std::unique_lock<std::mutex> lck(window_mtx);
        uint32_t ack = packet->header.ack;
        if (ack < base || ack >= next_seq) {
            debug(("RDTSender::recv_ack_go_back_n(): Ignore duplicate ACK " + std::to_string(ack)).c_str());
            continue;
        }
        // pop buffer
        while (base <= ack) {
            DRTPFreePacket(send_buffer.front());
            send_buffer.pop_front();
            base++;
        }
        if (send_buffer.empty()) {
            timer.stop();
        } else {
            timer.restart();
        }
        debug(("RDTSender::recv_ack_go_back_n(): ACK " + std::to_string(ack)
            + ", slide window to " + window_str()).c_str());
        timer_cv.notify_one();
        window_cv.notify_all();
    }
    DRTPFreePacket(packet);
}

void RDTSender::timer_go_back_n() {
    std::unique_lock<std::mutex> lck(window_mtx);
    while (state != CLOSED_FINAL && state != ABORTED) {
        // wait for timer to be started
        if (!timer.running()) {
            timer_cv.wait(lck);
            continue;
        }
        timer_cv.wait_until(lck, timer.deadline());
        // an ACK may have stopped or restarted the timer meanwhile
        if (!timer.expired() || send_buffer.empty()) {
            continue;
        }
        misses++;
        log(("RDTSender::timer_go_back_n(): RTO occurred, retransmit window " + window_str()).c_str());
        for (auto packet : send_buffer) {
            debug(("RDTSender::timer_go_back_n(): retransmitting packet seq=" + std::to_string(packet->header.seq)).c_str());
            retransmissions++;
            if (link.send_packet(packet) < 0) {
                fail();
                return;
            }
        }
        timer.restart();
    }
}

// window_mtx must be held
void RDTSender::fail() {
    state = ABORTED;
    timer.stop();
    window_cv.notify_all();
    timer_cv.notify_all();
}

void RDTSender::join_threads() {
    if (recv_thread.joinable()) recv_thread.join();
    if (timer_thread.joinable()) timer_thread.join();
}

std::string RDTSender::window_str() const {
    std::string s = "[";
    for (uint32_t seq = base; seq < next_seq; seq++) {
        if (seq != base) s += ", ";
        s += std::to_string(seq);
    }
    return s + "]";
}

RDTReceiver::RDTReceiver(Channel &channel, unsigned int idle_timeout)
    : link(channel), state(CLOSED), idle_timeout(idle_timeout), expected_seq(1), duplicate_acks(0) {
    info.window = 0;
    info.file_size = 0;
    packet = DRTPAllocPacket(MSS);
}

RDTReceiver::~RDTReceiver() {
    DRTPFreePacket(packet);
}

int RDTReceiver::startup() {
    if (state != CLOSED) {
        err("RDTReceiver::startup(): Already started");
        return E_TRANSFER_ABORTED;
    }
    state = LISTEN;
    log("RDTReceiver::startup(): Waiting for SYN");
    while (state == LISTEN) {
        int size = link.recv_packet(packet, 0);
        if (size == E_TRANSFER_ABORTED) {
            state = ABORTED;
            return E_TRANSFER_ABORTED;
        }
        // check if SYN and not corrupted
        if (size <= 0 || !(packet->header.flags & TYPE_SYN) || packet->header.flags & TYPE_ACK) {
            continue;
        }
        if (DRTPDecodeSessionInfo(packet->payload, packet->header.len, &info) < 0) {
            debug("RDTReceiver::startup(): Malformed SYN");
            continue;
        }
        isn = packet->header.seq;
        expected_seq = isn + 1;
        log(("RDTReceiver::startup(): SYN received, window=" + std::to_string(info.window)
            + " file=" + info.file_name
            + " size=" + std::to_string(info.file_size)).c_str());
        // send SYN+ACK
        if (send_ack(TYPE_SYN | TYPE_ACK, isn) < 0) {
            state = ABORTED;
            return E_TRANSFER_ABORTED;
        }
        log("RDTReceiver::startup(): SYN+ACK sent, connection established");
        state = ESTABLISHED;
    }
    return 0;
}

int RDTReceiver::recv_data(char *data, int len) {
    if (state == FIN_WAIT || state == CLOSED_FINAL) {
        return E_PASSIVE_CLOSE;
    }
    if (state != ESTABLISHED) {
        if (state != ABORTED) {
            err("RDTReceiver::recv_data(): Not connected");
        }
        return E_TRANSFER_ABORTED;
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(idle_timeout);
    while (true) {
        unsigned int wait = 0;
        if (idle_timeout > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                err("RDTReceiver::recv_data(): Client inactive, giving up");
                state = ABORTED;
                return E_TRANSFER_ABORTED;
            }
            wait = remaining;
        }
        int size = link.recv_packet(packet, wait);
        if (size == E_TRANSFER_ABORTED) {
            state = ABORTED;
            return E_TRANSFER_ABORTED;
        }
        if (size == 0) {
            continue;
        }
        // the client is alive, even if this datagram was corrupted or filtered
        deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(idle_timeout);
        if (size < 0) {
            continue;
        }

        uint16_t flags = packet->header.flags;
        uint32_t seq = packet->header.seq;
        if (flags & TYPE_SYN) {
            // our SYN+ACK was lost
            if (send_ack(TYPE_SYN | TYPE_ACK, isn) < 0) {
                state = ABORTED;
                return E_TRANSFER_ABORTED;
            }
            continue;
        }
        if (!(flags & (TYPE_DATA | TYPE_FIN))) {
            continue;
        }
        if (seq != expected_seq) {
            // out of order or duplicate, discard and repeat the cumulative ACK
            duplicate_acks++;
            log(("RDTReceiver::recv_data(): out-of-order packet seq=" + std::to_string(seq)
                + " discarded, ACK " + std::to_string(expected_seq - 1)).c_str());
            if (send_ack(TYPE_ACK, expected_seq - 1) < 0) {
                state = ABORTED;
                return E_TRANSFER_ABORTED;
            }
            continue;
        }
        if (flags & TYPE_FIN) {
            // everything before the FIN has been delivered
            expected_seq++;
            state = FIN_WAIT;
            log(("RDTReceiver::recv_data(): FIN received, seq=" + std::to_string(seq)).c_str());
            if (send_ack(TYPE_FIN | TYPE_ACK, seq) < 0) {
                state = ABORTED;
                return E_TRANSFER_ABORTED;
            }
            return E_PASSIVE_CLOSE;
        }
        if (packet->header.len > len) {
            err("RDTReceiver::recv_data(): Buffer too small");
            state = ABORTED;
            return E_TRANSFER_ABORTED;
        }
        memcpy(data, packet->payload, packet->header.len);
        expected_seq++;
        debug(("RDTReceiver::recv_data(): packet seq=" + std::to_string(seq) + " received").c_str());
        if (send_ack(TYPE_ACK, seq) < 0) {
            state = ABORTED;
            return E_TRANSFER_ABORTED;
        }
        if (packet->header.len > 0) {
            return packet->header.len;
        }
    }
}

int RDTReceiver::close(unsigned int linger) {
    if (state == ABORTED) {
        return E_TRANSFER_ABORTED;
    }
    if (state != FIN_WAIT) {
        state = CLOSED_FINAL;
        return 0;
    }
    // the FIN+ACK may be lost, answer retransmissions for a while
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(linger);
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            break;
        }
        int size = link.recv_packet(packet, remaining);
        if (size == E_TRANSFER_ABORTED) {
            break;
        }
        if (size <= 0) {
            continue;
        }
        if (packet->header.flags & TYPE_FIN && packet->header.seq == expected_seq - 1) {
            debug("RDTReceiver::close(): Repeat FIN+ACK");
            if (send_ack(TYPE_FIN | TYPE_ACK, packet->header.seq) < 0) {
                break;
            }
        } else if (packet->header.flags & TYPE_DATA) {
            if (send_ack(TYPE_ACK, expected_seq - 1) < 0) {
                break;
            }
        }
    }
    state = CLOSED_FINAL;
    log("RDTReceiver::close(): Connection closed");
    return 0;
}

int RDTReceiver::send_ack(uint16_t flags, uint32_t ack) {
    DRTPPacket ack_packet;
    DRTPHeaderEncode(&ack_packet.header, flags, 0, ack, 0);
    return link.send_packet(&ack_packet);
}
