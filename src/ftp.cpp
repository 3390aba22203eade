#include "ftp.hpp"
#include <fstream>
#include <cstdio>
#include <unistd.h>

FileChunker::FileChunker(std::istream &in, unsigned int chunk_size)
    : in(in), chunk_size(chunk_size) {
}

int FileChunker::next(char *data) {
    if (eof) {
        return 0;
    }
    in.read(data, chunk_size);
    int len = in.gcount();
    if (in.bad()) {
        err("FileChunker::next(): Error reading stream");
        return E_IO_ERROR;
    }
    if (in.eof()) {
        eof = true;
    }
    if (len > 0) {
        bytes_read += len;
        chunks++;
    }
    return len;
}

FileAssembler::FileAssembler(std::ostream &out) : out(out) {
}

int FileAssembler::append(const char *data, int len) {
    out.write(data, len);
    if (!out) {
        err("FileAssembler::append(): Error writing stream");
        return E_IO_ERROR;
    }
    bytes_written += len;
    return len;
}

int FileAssembler::finalize() {
    out.flush();
    if (!out) {
        err("FileAssembler::finalize(): Error flushing stream");
        return E_IO_ERROR;
    }
    return 0;
}

FTPSender::FTPSender(Channel &channel, unsigned int window_size, unsigned int timeout, unsigned int max_retries)
    : sender(channel, window_size, timeout, max_retries) {
        log(("FTPSender: Window size " + std::to_string(sender.get_window_size()) + ", timeout " + std::to_string(timeout) + "ms").c_str());
}

FTPSender::~FTPSender() {
    log("FTPSender: Terminated");
}

int FTPSender::send_file(const char *filename) {
    // open the file
    std::ifstream in(filename, std::ios::binary | std::ios::ate);
    if (!in) {
        err(("FTPSender: Error opening file " + std::string(filename)).c_str());
        return E_IO_ERROR;
    }
    uint64_t size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string name = filename;
    size_t slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    return send_stream(in, name, size);
}

int FTPSender::send_stream(std::istream &in, const std::string &name, uint64_t size) {
    SessionInfo info;
    info.window = sender.get_window_size();
    info.file_size = size;
    info.file_name = name;
    int ret = sender.connect(info);
    if (ret < 0) {
        return ret;
    }
    log("FTPSender: Connected");

    // send file
    FileChunker chunker(in);
    char data[MSS];
    int len;
    auto start = std::chrono::steady_clock::now();
    while ((len = chunker.next(data)) > 0) {
        ret = sender.send_data(data, len);
        if (ret < 0) {
            err(("FTPSender: " + std::string(DRTPErrorStr(ret))).c_str());
            return ret;
        }
    }
    if (len < 0 || chunker.get_bytes_read() != size) {
        err("FTPSender: File changed while sending, aborting");
        sender.abort();
        return E_IO_ERROR;
    }

    log("FTPSender: EOF reached");

    ret = sender.terminate();
    if (ret < 0) {
        err(("FTPSender: " + std::string(DRTPErrorStr(ret))).c_str());
        return ret;
    }
    auto end = std::chrono::steady_clock::now();

    // total length
    log(("FTPSender: File size: " + std::to_string(chunker.get_bytes_read()) + " Bytes in "
        + std::to_string(chunker.get_chunks()) + " segments").c_str());

    // time elapsed
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    log(("FTPSender: Time elapsed: " + std::to_string((float)elapsed.count() / 1000.0) + " s").c_str());

    // throughput
    log(("FTPSender: Throughput: " + get_throughput_str(chunker.get_bytes_read(), end - start) + " Mbps").c_str());

    // timeouts and retransmitted segments
    log(("FTPSender: Timeouts: " + std::to_string(sender.misses) + ", retransmitted packets: "
        + std::to_string(sender.get_retransmissions()) + " of " + std::to_string(sender.get_packets_sent())).c_str());
    return 0;
}

FTPReceiver::FTPReceiver(Channel &channel, unsigned int idle_timeout, unsigned int linger)
    : receiver(channel, idle_timeout), linger(linger) {
        log("FTPReceiver: Initialized");
}

FTPReceiver::~FTPReceiver() {
    log("FTPReceiver: Terminated");
}

int FTPReceiver::receive_file(const std::string &output) {
    int ret = receiver.startup();
    if (ret < 0) {
        return ret;
    }
    log("FTPReceiver: Connected");

    if (output.empty()) {
        output_path = unique_name(safe_name(receiver.get_session_info().file_name));
    } else {
        output_path = output;
    }
    // only a complete transfer is moved into place
    std::string part_path = output_path + ".part";
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        err(("FTPReceiver: Error opening file " + part_path).c_str());
        return E_IO_ERROR;
    }
    ret = transfer(out);
    out.close();
    if (ret == 0 && out.fail()) {
        ret = E_IO_ERROR;
    }
    if (ret == 0 && std::rename(part_path.c_str(), output_path.c_str()) != 0) {
        err(("FTPReceiver: Error renaming " + part_path).c_str());
        ret = E_IO_ERROR;
    }
    if (ret < 0) {
        std::remove(part_path.c_str());
        return ret;
    }
    log(("FTPReceiver: Saved " + output_path).c_str());
    receiver.close(linger);
    return 0;
}

int FTPReceiver::receive_stream(std::ostream &out) {
    int ret = receiver.startup();
    if (ret < 0) {
        return ret;
    }
    log("FTPReceiver: Connected");
    ret = transfer(out);
    if (ret < 0) {
        return ret;
    }
    receiver.close(linger);
    return 0;
}

int FTPReceiver::transfer(std::ostream &out) {
    // loop to recv file
    FileAssembler assembler(out);
    char data[MSS];
    int len;
    auto start = std::chrono::steady_clock::now();
    while ((len = receiver.recv_data(data, MSS)) > 0) {
        if (assembler.append(data, len) < 0) {
            return E_IO_ERROR;
        }
    }
    if (len != E_PASSIVE_CLOSE) {
        err(("FTPReceiver: " + std::string(DRTPErrorStr(len))).c_str());
        return len;
    }
    log("FTPReceiver: Connection closed");
    if (assembler.finalize() < 0) {
        return E_IO_ERROR;
    }
    auto end = std::chrono::steady_clock::now();

    // total length
    log(("FTPReceiver: File size: " + std::to_string(assembler.get_bytes_written()) + " Bytes").c_str());

    // time elapsed
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    log(("FTPReceiver: Time elapsed: " + std::to_string((float)elapsed.count() / 1000.0) + " s").c_str());

    // throughput
    log(("FTPReceiver: Throughput: " + get_throughput_str(assembler.get_bytes_written(), end - start) + " Mbps").c_str());

    uint64_t expected = receiver.get_session_info().file_size;
    if (assembler.get_bytes_written() != expected) {
        err(("FTPReceiver: Expected " + std::to_string(expected) + " Bytes, received "
            + std::to_string(assembler.get_bytes_written())).c_str());
        return E_INCOMPLETE;
    }
    return 0;
}

std::string FTPReceiver::safe_name(const std::string &name) {
    std::string base = name;
    size_t slash = base.find_last_of('/');
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }
    if (base.empty() || base == "." || base == "..") {
        return "received_file";
    }
    return base;
}

std::string FTPReceiver::unique_name(const std::string &name) {
    if (access(name.c_str(), F_OK) != 0) {
        return name;
    }
    // "photo.jpg" -> "photo(0).jpg", "photo(1).jpg", ...
    std::string stem = name;
    std::string ext;
    size_t dot = name.find_last_of('.');
    size_t slash = name.find_last_of('/');
    if (dot != std::string::npos && dot > 0 && (slash == std::string::npos || dot > slash + 1)) {
        stem = name.substr(0, dot);
        ext = name.substr(dot);
    }
    for (int copy = 0; ; copy++) {
        std::string candidate = stem + "(" + std::to_string(copy) + ")" + ext;
        if (access(candidate.c_str(), F_OK) != 0) {
            return candidate;
        }
    }
}
