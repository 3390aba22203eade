#include "config.hpp"
#include <getopt.h>
#include <sys/stat.h>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>

// strict base 10 conversion, rejects trailing garbage
static bool parse_number(const char *arg, long long &value) {
    if (arg == nullptr || *arg == '\0') {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    value = strtoll(arg, &end, 10);
    return errno == 0 && *end == '\0';
}

int parse_args(int argc, char *argv[], AppConfig &config, std::string &error) {
    struct option long_options[] = {
        {"server", no_argument, 0, 's'},
        {"client", no_argument, 0, 'c'},
        {"ip", required_argument, 0, 'i'},
        {"port", required_argument, 0, 'p'},
        {"file", required_argument, 0, 'f'},
        {"window", required_argument, 0, 'w'},
        {"discard", required_argument, 0, 'd'},
        {"discard-ack", required_argument, 0, 'a'},
        {"timeout", required_argument, 0, 't'},
        {"retries", required_argument, 0, 'r'},
        {"output", required_argument, 0, 'o'},
        {"idle", required_argument, 0, 'l'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    // restart getopt scanning, parse_args may run more than once per process
    optind = 0;
    opterr = 0;
    int opt;
    int option_index = 0;
    long long value;
    while ((opt = getopt_long(argc, argv, "sci:p:f:w:d:a:t:r:o:l:h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 's':
                config.server = true;
                break;
            case 'c':
                config.client = true;
                break;
            case 'i':
                config.ip = optarg;
                break;
            case 'p':
                if (!parse_number(optarg, value)) {
                    error = "Invalid port: " + std::string(optarg);
                    return -1;
                }
                config.port = value;
                break;
            case 'f':
                config.file = optarg;
                break;
            case 'o':
                config.output = optarg;
                break;
            case 'w':
                if (!parse_number(optarg, value)) {
                    error = "Invalid window size: " + std::string(optarg);
                    return -1;
                }
                config.window = value;
                break;
            case 'd':
                if (!parse_number(optarg, value)) {
                    error = "Invalid discard sequence number: " + std::string(optarg);
                    return -1;
                }
                config.discard = value;
                break;
            case 'a':
                if (!parse_number(optarg, value)) {
                    error = "Invalid discard ACK number: " + std::string(optarg);
                    return -1;
                }
                config.discard_ack = value;
                break;
            case 't':
                if (!parse_number(optarg, value)) {
                    error = "Invalid timeout: " + std::string(optarg);
                    return -1;
                }
                config.timeout = value;
                break;
            case 'r':
                if (!parse_number(optarg, value)) {
                    error = "Invalid retry count: " + std::string(optarg);
                    return -1;
                }
                config.retries = value;
                break;
            case 'l':
                if (!parse_number(optarg, value)) {
                    error = "Invalid idle timeout: " + std::string(optarg);
                    return -1;
                }
                config.idle_timeout = value;
                break;
            case 'h':
                config.help = true;
                break;
            default:
                error = "Unknown or incomplete option";
                return -1;
        }
    }
    if (optind < argc) {
        error = "Unexpected argument: " + std::string(argv[optind]);
        return -1;
    }
    return 0;
}

int validate_config(const AppConfig &config, std::string &error) {
    if (config.server && config.client) {
        error = "You cannot enable both the server and the client at the same time";
        return -1;
    }
    if (!config.server && !config.client) {
        error = "Enable either server (-s) or client (-c)";
        return -1;
    }
    struct in_addr addr;
    if (inet_pton(AF_INET, config.ip.c_str(), &addr) != 1) {
        error = "Invalid IP. Format example: 127.0.0.1";
        return -1;
    }
    if (config.port < 1024 || config.port > 65535) {
        error = "Invalid port. Must be in range [1024,65535]";
        return -1;
    }
    if (config.timeout <= 0) {
        error = "Timeout must be > 0 ms";
        return -1;
    }
    if (config.retries <= 0) {
        error = "Retry count must be > 0";
        return -1;
    }
    if (config.idle_timeout < 0) {
        error = "Idle timeout must be >= 0 ms";
        return -1;
    }
    if (config.discard < -1 || config.discard > 0xffffffffLL) {
        error = "Discard sequence number out of range";
        return -1;
    }
    if (config.discard_ack < -1 || config.discard_ack > 0xffffffffLL) {
        error = "Discard ACK number out of range";
        return -1;
    }
    if (config.client) {
        if (config.window < 1) {
            error = "Sliding window size must be > 0";
            return -1;
        }
        if (config.file.empty()) {
            error = "A file path must be provided (use -f)";
            return -1;
        }
        struct stat st;
        if (stat(config.file.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            error = "File not found. Please provide a valid file path";
            return -1;
        }
        if ((unsigned long long)st.st_size > MAX_FILE_SIZE) {
            error = "File must be smaller than 60 MB";
            return -1;
        }
    }
    return 0;
}

std::string usage(const char *prog) {
    return "Usage: " + std::string(prog) + " (-s | -c) [-i <ip>] [-p <port>]\n"
        "  -s, --server          receive a file\n"
        "  -c, --client          send a file\n"
        "  -i, --ip <ip>         IPv4 address (default 127.0.0.1)\n"
        "  -p, --port <port>     port in [1024,65535] (default 8080)\n"
        "  -f, --file <path>     file to send (client)\n"
        "  -w, --window <n>      sliding window size (default 3)\n"
        "  -d, --discard <seq>   drop this sequence number once (server, for testing)\n"
        "  -a, --discard-ack <n> withhold the ACK for this sequence number once (server, for testing)\n"
        "  -t, --timeout <ms>    retransmission timeout (default 500)\n"
        "  -r, --retries <n>     handshake attempts (default 10)\n"
        "  -o, --output <path>   output file (server, default: name sent by the client)\n"
        "  -l, --idle <ms>       give up on a silent client, 0 waits forever (default 5000)\n";
}
