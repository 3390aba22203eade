#ifndef CONFIG_HPP
#define CONFIG_HPP
#include <string>
#include "rdt.hpp"

static const char *const DEFAULT_IP = "127.0.0.1";
static const int DEFAULT_PORT = 8080;
static const unsigned int DEFAULT_IDLE_TIMEOUT = 5000; // ms
static const unsigned long long MAX_FILE_SIZE = 60000000; // bytes

struct AppConfig {
    bool server = false;
    bool client = false;
    bool help = false;
    std::string ip = DEFAULT_IP;
    int port = DEFAULT_PORT;
    std::string file;
    std::string output;
    int window = DEFAULT_WINDOW;
    // sequence number dropped once by the server, -1 for none
    long long discard = -1;
    // ACK number the server withholds once, -1 for none
    long long discard_ack = -1;
    int timeout = DEFAULT_TIMEOUT;
    int retries = MAX_RETRIES;
    int idle_timeout = DEFAULT_IDLE_TIMEOUT;
};

// fill config from the command line, return 0 or -1 with a message in error
int parse_args(int argc, char *argv[], AppConfig &config, std::string &error);

// check ranges and the client's file, return 0 or -1 with a message in error
int validate_config(const AppConfig &config, std::string &error);

std::string usage(const char *prog);

#endif
