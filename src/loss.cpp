#include "loss.hpp"
#include "protocol.hpp"
#include "utils.hpp"
#include <cstddef>
#include <cstring>
#include <arpa/inet.h>

LossInjector::LossInjector(uint32_t target_seq, Match match)
    : target_seq(target_seq), match(match), has_fired(false) {
}

bool LossInjector::drop(const char *buf, int len) {
    if (has_fired || len < (int)HEADER_SIZE) {
        return false;
    }
    // peek at the raw header, the datagram is not validated yet
    uint32_t seq;
    uint32_t ack;
    uint16_t flags;
    memcpy(&seq, buf + offsetof(DRTPHeader, seq), sizeof(seq));
    memcpy(&ack, buf + offsetof(DRTPHeader, ack), sizeof(ack));
    memcpy(&flags, buf + offsetof(DRTPHeader, flags), sizeof(flags));
    seq = ntohl(seq);
    ack = ntohl(ack);
    flags = ntohs(flags);
    if (match == MATCH_ACK) {
        if (flags != TYPE_ACK || ack != target_seq) {
            return false;
        }
    } else if (!(flags & (TYPE_DATA | TYPE_FIN)) || seq != target_seq) {
        return false;
    }
    bool expected = false;
    if (!has_fired.compare_exchange_strong(expected, true)) {
        return false;
    }
    if (match == MATCH_ACK) {
        log(("LossInjector: Discard ACK " + std::to_string(ack)).c_str());
    } else {
        log(("LossInjector: Discard packet seq=" + std::to_string(seq)).c_str());
    }
    return true;
}
