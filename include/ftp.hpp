#ifndef FTP_HPP
#define FTP_HPP
#include <istream>
#include <ostream>
#include <string>
#include "rdt.hpp"

// Splits a byte stream into segments of at most chunk_size bytes.
// Reads the stream once, front to back.
class FileChunker {
public:
    explicit FileChunker(std::istream &in, unsigned int chunk_size = MSS);

    // copy the next segment into data, return its length, 0 at end of stream or E_IO_ERROR
    int next(char *data);

    unsigned long long get_bytes_read() const {
        return bytes_read;
    }
    unsigned int get_chunks() const {
        return chunks;
    }

private:
    std::istream &in;
    unsigned int chunk_size;
    bool eof = false;
    unsigned long long bytes_read = 0;
    unsigned int chunks = 0;
};

// Appends in-order payloads to the destination.
class FileAssembler {
public:
    explicit FileAssembler(std::ostream &out);

    int append(const char *data, int len);
    int finalize();

    unsigned long long get_bytes_written() const {
        return bytes_written;
    }

private:
    std::ostream &out;
    unsigned long long bytes_written = 0;
};

class FTPSender {
public:
    FTPSender(Channel &channel, unsigned int window_size = DEFAULT_WINDOW,
        unsigned int timeout = DEFAULT_TIMEOUT, unsigned int max_retries = MAX_RETRIES);

    ~FTPSender();

    int send_file(const char *filename);
    int send_stream(std::istream &in, const std::string &name, uint64_t size);

    RDTSender &get_sender() {
        return sender;
    }

private:
    RDTSender sender;
};

class FTPReceiver {
public:
    FTPReceiver(Channel &channel, unsigned int idle_timeout = 0, unsigned int linger = 0);

    ~FTPReceiver();

    // write to output, or to the file name announced by the client when output is empty
    int receive_file(const std::string &output);
    int receive_stream(std::ostream &out);

    const std::string &get_output_path() const {
        return output_path;
    }
    RDTReceiver &get_receiver() {
        return receiver;
    }

    // name, or name with a "(n)" suffix before the extension if name exists
    static std::string unique_name(const std::string &name);
    // strip directories from a client supplied name
    static std::string safe_name(const std::string &name);

private:
    RDTReceiver receiver;
    unsigned int linger;
    std::string output_path;

    int transfer(std::ostream &out);
};

#endif
