#ifndef RDT_HPP
#define RDT_HPP
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>
#include <chrono>
#include <thread>
#include <condition_variable>
#include "protocol.hpp"
#include "utils.hpp"
#include "channel.hpp"
#include "link.hpp"
#include "loss.hpp"
#include "timer.hpp"

static const unsigned int DEFAULT_WINDOW = 3;
static const unsigned int DEFAULT_TIMEOUT = 500; // ms
static const unsigned int MAX_RETRIES = 10;

// Go-Back-N sender (client role)
class RDTSender {
public:
    enum State {
        CLOSED,
        SYN_SENT,
        ESTABLISHED,
        FIN_WAIT,
        CLOSED_FINAL,
        ABORTED
    };

    RDTSender(Channel &channel, unsigned int window_size = DEFAULT_WINDOW,
        unsigned int timeout = DEFAULT_TIMEOUT, unsigned int max_retries = MAX_RETRIES);
    ~RDTSender();

    // SYN carrying info (window is filled in), then wait for SYN+ACK
    // return 0 or E_HANDSHAKE_TIMEOUT / E_TRANSFER_ABORTED
    int connect(const SessionInfo &info);
    // send FIN through the window and wait until everything is acknowledged
    int terminate();
    // queue one segment of up to MSS bytes, blocks while the window is full
    int send_data(const char *data, int len);
    // close the channel, any blocked call returns E_TRANSFER_ABORTED
    void abort();

    void set_filters(PacketFilter *incoming, PacketFilter *outgoing) {
        link.set_filters(incoming, outgoing);
    }

    // timer expiries
    std::atomic<unsigned int> misses;
    unsigned int get_packets_sent() const {
        return link.get_packets_sent();
    }
    unsigned int get_packets_recv() const {
        return link.get_packets_recv();
    }
    unsigned int get_retransmissions() const {
        return retransmissions;
    }
    unsigned int get_window_size() const {
        return N;
    }
    unsigned int get_max_in_flight() const {
        return max_in_flight;
    }
    uint32_t get_base() {
        std::unique_lock<std::mutex> lck(window_mtx);
        return base;
    }
    uint32_t get_next_seq() {
        std::unique_lock<std::mutex> lck(window_mtx);
        return next_seq;
    }
    State get_state() const {
        return state;
    }

private:
    PacketLink link;
    std::atomic<State> state;
    unsigned int N;
    unsigned int arq_timeout;
    unsigned int max_retries;
    const uint32_t isn = 0;

    // window [base, next_seq), guarded by window_mtx together with timer
    uint32_t base = 1;
    uint32_t next_seq = 1;
    std::deque<DRTPPacket *> send_buffer;
    RetransmitTimer timer;
    std::atomic<unsigned int> max_in_flight;
    std::atomic<unsigned int> retransmissions;

    std::mutex window_mtx;
    std::condition_variable window_cv;
    std::condition_variable timer_cv;
    std::thread timer_thread;
    std::thread recv_thread;

    int send_segment(uint16_t flags, const char *data, int len);
    void recv_ack_go_back_n();
    void timer_go_back_n();
    void fail();
    void join_threads();
    std::string window_str() const;
};

// in-order receiver (server role)
class RDTReceiver {
public:
    enum State {
        CLOSED,
        LISTEN,
        ESTABLISHED,
        FIN_WAIT,
        CLOSED_FINAL,
        ABORTED
    };

    // idle_timeout in milliseconds, 0 waits forever for the client
    explicit RDTReceiver(Channel &channel, unsigned int idle_timeout = 0);
    ~RDTReceiver();

    // wait for SYN and answer SYN+ACK
    int startup();
    // next in-order payload: bytes copied, E_PASSIVE_CLOSE after FIN, or E_TRANSFER_ABORTED
    int recv_data(char *data, int len);
    // linger for retransmitted FINs, then close
    int close(unsigned int linger = 0);

    void set_filters(PacketFilter *incoming, PacketFilter *outgoing) {
        link.set_filters(incoming, outgoing);
    }

    const SessionInfo &get_session_info() const {
        return info;
    }
    uint32_t get_expected_seq() const {
        return expected_seq;
    }
    unsigned int get_duplicate_acks() const {
        return duplicate_acks;
    }
    unsigned int get_packets_dropped() const {
        return link.get_packets_dropped();
    }
    unsigned int get_packets_corrupt() const {
        return link.get_packets_corrupt();
    }
    State get_state() const {
        return state;
    }

private:
    PacketLink link;
    std::atomic<State> state;
    unsigned int idle_timeout;
    SessionInfo info;
    uint32_t isn = 0;
    std::atomic<uint32_t> expected_seq;
    std::atomic<unsigned int> duplicate_acks;
    DRTPPacket *packet;

    int send_ack(uint16_t flags, uint32_t ack);
};

#endif
