#include "protocol.hpp"
#include <cstddef>
#include <cstring>
#include <arpa/inet.h>

const int E_PASSIVE_CLOSE = -2;
const int E_CORRUPT_PACKET = -3;
const int E_HANDSHAKE_TIMEOUT = -4;
const int E_TRANSFER_ABORTED = -5;
const int E_IO_ERROR = -6;
const int E_INCOMPLETE = -7;
const int E_FILTERED_PACKET = -8;

const char *DRTPErrorStr(int code) {
    if (code >= 0) return "success";
    if (code == E_PASSIVE_CLOSE) return "connection closed by peer";
    if (code == E_CORRUPT_PACKET) return "corrupt packet";
    if (code == E_HANDSHAKE_TIMEOUT) return "handshake timed out";
    if (code == E_TRANSFER_ABORTED) return "transfer aborted";
    if (code == E_IO_ERROR) return "file I/O error";
    if (code == E_INCOMPLETE) return "incomplete transfer";
    if (code == E_FILTERED_PACKET) return "packet filtered";
    return "unknown error";
}

// encode header
void DRTPHeaderEncode(DRTPHeader *header, uint16_t flags, uint32_t seq, uint32_t ack, uint16_t len) {
    header->seq = seq;
    header->ack = ack;
    header->flags = flags;
    header->len = len;
    header->checksum = 0;
}

DRTPPacket *DRTPAllocPacket(uint16_t len) {
    DRTPPacket *packet = reinterpret_cast<DRTPPacket *>(new char[HEADER_SIZE + len]);
    DRTPHeaderEncode(&packet->header, 0, 0, 0, len);
    return packet;
}

void DRTPFreePacket(DRTPPacket *packet) {
    delete[] reinterpret_cast<char *>(packet);
}

uint16_t DRTPChecksum(const char *buf, int len) {
    const unsigned char *ptr = reinterpret_cast<const unsigned char *>(buf);
    uint32_t sum = 0;
    for (int i = 0; i + 1 < len; i += 2) {
        sum += (ptr[i] << 8) | ptr[i + 1];
    }
    // pad odd byte with zero
    if (len % 2) {
        sum += ptr[len - 1] << 8;
    }
    while (sum >> 16) {
        sum = (sum & 0xffff) + (sum >> 16);
    }
    return ~sum & 0xffff;
}

int DRTPSerialize(const DRTPPacket *packet, char *buf, int size) {
    int total = HEADER_SIZE + packet->header.len;
    if (packet->header.len > MSS || size < total) {
        return -1;
    }
    uint32_t seq = htonl(packet->header.seq);
    uint32_t ack = htonl(packet->header.ack);
    uint16_t flags = htons(packet->header.flags);
    uint16_t zero = 0;
    uint16_t len = htons(packet->header.len);
    memcpy(buf + offsetof(DRTPHeader, seq), &seq, sizeof(seq));
    memcpy(buf + offsetof(DRTPHeader, ack), &ack, sizeof(ack));
    memcpy(buf + offsetof(DRTPHeader, flags), &flags, sizeof(flags));
    memcpy(buf + offsetof(DRTPHeader, checksum), &zero, sizeof(zero));
    memcpy(buf + offsetof(DRTPHeader, len), &len, sizeof(len));
    memcpy(buf + HEADER_SIZE, packet->payload, packet->header.len);

    uint16_t checksum = htons(DRTPChecksum(buf, total));
    memcpy(buf + offsetof(DRTPHeader, checksum), &checksum, sizeof(checksum));
    return total;
}

int DRTPDeserialize(const char *buf, int size, DRTPPacket *packet) {
    if (size < (int)HEADER_SIZE || size > (int)BUF_SIZE) {
        return E_CORRUPT_PACKET;
    }
    uint32_t seq, ack;
    uint16_t flags, checksum, len;
    memcpy(&seq, buf + offsetof(DRTPHeader, seq), sizeof(seq));
    memcpy(&ack, buf + offsetof(DRTPHeader, ack), sizeof(ack));
    memcpy(&flags, buf + offsetof(DRTPHeader, flags), sizeof(flags));
    memcpy(&checksum, buf + offsetof(DRTPHeader, checksum), sizeof(checksum));
    memcpy(&len, buf + offsetof(DRTPHeader, len), sizeof(len));
    len = ntohs(len);
    // declared length must match what actually arrived
    if (len > MSS || size != (int)HEADER_SIZE + len) {
        return E_CORRUPT_PACKET;
    }
    // checksum over the whole datagram, stored checksum included, folds to zero
    if (DRTPChecksum(buf, size) != 0) {
        return E_CORRUPT_PACKET;
    }
    packet->header.seq = ntohl(seq);
    packet->header.ack = ntohl(ack);
    packet->header.flags = ntohs(flags);
    packet->header.checksum = ntohs(checksum);
    packet->header.len = len;
    memcpy(packet->payload, buf + HEADER_SIZE, len);
    return size;
}

// window (32) | file size (64) | file name
int DRTPEncodeSessionInfo(const SessionInfo &info, char *buf, int size) {
    int name_len = info.file_name.size();
    int total = 12 + name_len;
    if (size < total) {
        return -1;
    }
    uint32_t window = htonl(info.window);
    uint32_t size_hi = htonl((uint32_t)(info.file_size >> 32));
    uint32_t size_lo = htonl((uint32_t)(info.file_size & 0xffffffff));
    memcpy(buf, &window, 4);
    memcpy(buf + 4, &size_hi, 4);
    memcpy(buf + 8, &size_lo, 4);
    memcpy(buf + 12, info.file_name.data(), name_len);
    return total;
}

int DRTPDecodeSessionInfo(const char *buf, int size, SessionInfo *info) {
    if (size < 12) {
        return E_CORRUPT_PACKET;
    }
    uint32_t window, size_hi, size_lo;
    memcpy(&window, buf, 4);
    memcpy(&size_hi, buf + 4, 4);
    memcpy(&size_lo, buf + 8, 4);
    info->window = ntohl(window);
    info->file_size = ((uint64_t)ntohl(size_hi) << 32) | ntohl(size_lo);
    info->file_name.assign(buf + 12, size - 12);
    return size;
}
