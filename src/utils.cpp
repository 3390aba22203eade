#include "utils.hpp"
#include <ctime>
#include <fstream>
#include <iterator>
#include <algorithm>

// "hh:mm:ss.uuuuuu" local time
static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    struct tm parts;
    localtime_r(&now_c, &parts);
    long us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    char buf[32];
    snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%06ld", parts.tm_hour, parts.tm_min, parts.tm_sec, us);
    return buf;
}

// green, [LOG] prefix
void log(const char *msg) {
    printf("\033[32m[%s] [LOG] %s\033[0m\n", timestamp().c_str(), msg);
    fflush(stdout);
}

// red, [ERR] prefix, to stderr
void err(const char *msg) {
    fprintf(stderr, "\033[31m[%s] [ERR] %s\033[0m\n", timestamp().c_str(), msg);
}

// only in DRTP_DEBUG builds
void debug(const char *msg) {
    #ifdef DRTP_DEBUG
    printf("[%s] [DBG] %s\n", timestamp().c_str(), msg);
    #else
    (void)msg;
    #endif
}

static const char *flags_name(uint16_t flags) {
    switch (flags) {
        case TYPE_ACK: return "ACK";
        case TYPE_SYN: return "SYN";
        case TYPE_FIN: return "FIN";
        case TYPE_DATA: return "DAT";
        case TYPE_SYN | TYPE_ACK: return "SYN+ACK";
        case TYPE_FIN | TYPE_ACK: return "FIN+ACK";
        default: return "UNK";
    }
}

// "prefix DAT len=986 seq=4 ack=0 sum=51966"
std::string get_debug_str(const char *prefix, const DRTPPacket *packet) {
    char buf[96];
    snprintf(buf, sizeof(buf), " %s len=%u seq=%u ack=%u sum=%u", flags_name(packet->header.flags),
        (unsigned)packet->header.len, (unsigned)packet->header.seq,
        (unsigned)packet->header.ack, (unsigned)packet->header.checksum);
    return prefix + std::string(buf);
}

bool compare_files(const char *file1, const char *file2) {
    std::ifstream f1(file1, std::ios::binary | std::ios::ate);
    std::ifstream f2(file2, std::ios::binary | std::ios::ate);

    if (f1.fail() || f2.fail()) {
        return false;
    }

    if (f1.tellg() != f2.tellg()) {
        return false;
    }

    f1.seekg(0, std::ios::beg);
    f2.seekg(0, std::ios::beg);

    return std::equal(std::istreambuf_iterator<char>(f1.rdbuf()),
        std::istreambuf_iterator<char>(),
        std::istreambuf_iterator<char>(f2.rdbuf()));
}

std::string get_throughput_str(unsigned long long bytes, std::chrono::steady_clock::duration elapsed) {
    double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds <= 0) {
        return "inf";
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f", bytes * 8.0 / 1000000.0 / seconds);
    return buf;
}
