#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP
#include <cstdint>
#include <string>

//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                     Sequence Number (32)                      |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                  Acknowledgment Number (32)                   |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |           Flags (16)          |          Checksum (16)        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |           Length (16)         |          Payload ...          |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// DRTP Header (all fields big-endian on the wire)
// Flags: 16 bits
//   ...  12  13  14  15
// +-----+---+---+---+----+
// | Rsv |SYN|ACK|FIN|DATA|
// +-----+---+---+---+----+
// Length: 16 bits (excluding header)
// Checksum: 16 bits, one's complement over header and payload

#pragma pack(1)
typedef struct {
    uint32_t seq;
    uint32_t ack;
    uint16_t flags;
    uint16_t checksum;
    uint16_t len;
} DRTPHeader;

// in-memory packet, header kept in host byte order
typedef struct {
    DRTPHeader header;
    char payload[0];
} DRTPPacket;
#pragma pack()

const uint16_t TYPE_SYN = 1 << 3;
const uint16_t TYPE_ACK = 1 << 2;
const uint16_t TYPE_FIN = 1 << 1;
const uint16_t TYPE_DATA = 1 << 0;

// largest datagram on the wire
static const unsigned int BUF_SIZE = 1000;
static const unsigned int HEADER_SIZE = sizeof(DRTPHeader);
static const unsigned int MSS = BUF_SIZE - HEADER_SIZE;

// error codes, returned as negative ints
extern const int E_PASSIVE_CLOSE;
extern const int E_CORRUPT_PACKET;
extern const int E_HANDSHAKE_TIMEOUT;
extern const int E_TRANSFER_ABORTED;
extern const int E_IO_ERROR;
extern const int E_INCOMPLETE;
extern const int E_FILTERED_PACKET;

const char *DRTPErrorStr(int code);

// transfer metadata carried by SYN
struct SessionInfo {
    uint32_t window;
    uint64_t file_size;
    std::string file_name;
};

// encode header
void DRTPHeaderEncode(DRTPHeader *header, uint16_t flags, uint32_t seq, uint32_t ack, uint16_t len);

// allocate a packet with room for len payload bytes, free with DRTPFreePacket
DRTPPacket *DRTPAllocPacket(uint16_t len);
void DRTPFreePacket(DRTPPacket *packet);

// one's complement checksum of buf
uint16_t DRTPChecksum(const char *buf, int len);

// write wire form of packet to buf, return datagram size or -1 if buf is too small
int DRTPSerialize(const DRTPPacket *packet, char *buf, int size);

// parse and validate a datagram into packet (which must hold BUF_SIZE bytes)
// return datagram size or E_CORRUPT_PACKET
int DRTPDeserialize(const char *buf, int size, DRTPPacket *packet);

// SYN payload
int DRTPEncodeSessionInfo(const SessionInfo &info, char *buf, int size);
int DRTPDecodeSessionInfo(const char *buf, int size, SessionInfo *info);

#endif
