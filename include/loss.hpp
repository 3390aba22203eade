#ifndef LOSS_HPP
#define LOSS_HPP
#include <cstdint>
#include <atomic>

// Predicate over raw datagrams, applied before checksum validation.
// A dropped datagram is indistinguishable from one lost in the network.
class PacketFilter {
public:
    virtual ~PacketFilter() {}
    virtual bool drop(const char *buf, int len) = 0;
};

// Drops the first DATA or FIN datagram carrying target_seq, or with
// MATCH_ACK the first pure ACK acknowledging target_seq.
// One-shot: retransmitted copies of the same segment pass through.
class LossInjector : public PacketFilter {
public:
    enum Match {
        MATCH_SEQ,
        MATCH_ACK
    };

    explicit LossInjector(uint32_t target_seq, Match match = MATCH_SEQ);

    bool drop(const char *buf, int len) override;

    bool fired() const {
        return has_fired;
    }
    uint32_t target() const {
        return target_seq;
    }

private:
    uint32_t target_seq;
    Match match;
    std::atomic<bool> has_fired;
};

#endif
