#include "utils.hpp"
#include "protocol.hpp"
#include "udp.hpp"
#include "loss.hpp"
#include "rdt.hpp"
#include "ftp.hpp"
#include "config.hpp"
#include <memory>

static const int EXIT_USAGE = 1;
static const int EXIT_HANDSHAKE = 2;
static const int EXIT_ABORTED = 3;
static const int EXIT_IO = 4;

static int exit_status(int ret) {
    if (ret >= 0) return 0;
    if (ret == E_HANDSHAKE_TIMEOUT) return EXIT_HANDSHAKE;
    if (ret == E_TRANSFER_ABORTED) return EXIT_ABORTED;
    return EXIT_IO;
}

static int run_server(const AppConfig &config) {
    UDP udp;
    if (udp.bind(config.ip.c_str(), config.port) < 0) {
        err(("The given IP/port is not available: " + config.ip + ":" + std::to_string(config.port)).c_str());
        return EXIT_USAGE;
    }
    log(("Server listening on " + config.ip + ":" + std::to_string(config.port)).c_str());

    FTPReceiver receiver(udp, config.idle_timeout, 4 * config.timeout);
    std::unique_ptr<LossInjector> injector;
    std::unique_ptr<LossInjector> ack_injector;
    if (config.discard >= 0) {
        injector.reset(new LossInjector(config.discard));
        log(("Server will discard packet seq=" + std::to_string(config.discard) + " once").c_str());
    }
    if (config.discard_ack >= 0) {
        ack_injector.reset(new LossInjector(config.discard_ack, LossInjector::MATCH_ACK));
        log(("Server will withhold ACK " + std::to_string(config.discard_ack) + " once").c_str());
    }
    receiver.get_receiver().set_filters(injector.get(), ack_injector.get());
    int ret = receiver.receive_file(config.output);
    if (ret < 0) {
        err(("Server: " + std::string(DRTPErrorStr(ret))).c_str());
    }
    return exit_status(ret);
}

static int run_client(const AppConfig &config) {
    UDP udp;
    if (udp.set_peer(config.ip.c_str(), config.port) < 0) {
        return EXIT_USAGE;
    }
    log(("Client sending " + config.file + " to " + config.ip + ":" + std::to_string(config.port)).c_str());

    FTPSender sender(udp, config.window, config.timeout, config.retries);
    int ret = sender.send_file(config.file.c_str());
    if (ret < 0) {
        err(("Client: " + std::string(DRTPErrorStr(ret))).c_str());
    }
    return exit_status(ret);
}

int main(int argc, char *argv[]) {
    AppConfig config;
    std::string error;
    if (parse_args(argc, argv, config, error) < 0) {
        std::cerr << "Error: " << error << std::endl << usage(argv[0]);
        return EXIT_USAGE;
    }
    if (config.help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    if (validate_config(config, error) < 0) {
        std::cerr << "Error: " << error << std::endl << usage(argv[0]);
        return EXIT_USAGE;
    }

    log("Welcome to DRTP!");
    if (config.server) {
        return run_server(config);
    }
    return run_client(config);
}
