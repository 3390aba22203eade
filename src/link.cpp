#include "link.hpp"
#include "utils.hpp"

PacketLink::PacketLink(Channel &channel)
    : channel(channel), packets_sent(0), packets_recv(0), packets_dropped(0), packets_corrupt(0) {
}

int PacketLink::send_packet(const DRTPPacket *packet) {
    char buffer[BUF_SIZE];
    int size = DRTPSerialize(packet, buffer, BUF_SIZE);
    if (size < 0) {
        err("PacketLink::send_packet(): Packet too large");
        return E_TRANSFER_ABORTED;
    }
    packets_sent++;
    if (outgoing && outgoing->drop(buffer, size)) {
        packets_dropped++;
        debug(get_debug_str("PacketLink::send_packet(): Filtered packet", packet).c_str());
        return size;
    }
    int ret = channel.send_raw(buffer, size);
    if (ret < 0) {
        return E_TRANSFER_ABORTED;
    }
    debug(get_debug_str("PacketLink::send_packet(): Sent packet", packet).c_str());
    return ret;
}

int PacketLink::recv_packet(DRTPPacket *packet, unsigned int timeout) {
    char buffer[BUF_SIZE];
    int ret = channel.recv_raw(buffer, BUF_SIZE, timeout);
    if (ret <= 0) {
        return ret;
    }
    packets_recv++;
    if (incoming && incoming->drop(buffer, ret)) {
        packets_dropped++;
        return E_FILTERED_PACKET;
    }
    if (DRTPDeserialize(buffer, ret, packet) < 0) {
        packets_corrupt++;
        debug("PacketLink::recv_packet(): Drop corrupt packet");
        return E_CORRUPT_PACKET;
    }
    debug(get_debug_str("PacketLink::recv_packet(): Recv packet", packet).c_str());
    return ret;
}
