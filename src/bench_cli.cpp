#include "utils.hpp"
#include "protocol.hpp"
#include "udp.hpp"
#include "loss.hpp"
#include "rdt.hpp"
#include "ftp.hpp"
#include <getopt.h>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <fstream>
#include <thread>
#include <vector>

// one loopback transfer, return throughput in Mbps or a negative value on failure
static float run_once(const std::string &file, int port, unsigned int window,
    unsigned int timeout, long long discard) {
    std::string recv_file = file + ".recv";
    int receiver_ret = 0;
    int sender_ret = 0;
    float throughput = -1;

    UDP server_udp;
    if (server_udp.bind("127.0.0.1", port) < 0) {
        return -1;
    }

    // receiver thread
    std::thread receiver_thread([&]() {
        FTPReceiver receiver(server_udp, 0, 0);
        LossInjector injector(discard < 0 ? 0 : discard);
        if (discard >= 0) {
            receiver.get_receiver().set_filters(&injector, nullptr);
        }
        receiver_ret = receiver.receive_file(recv_file);
    });

    // sender thread
    std::thread sender_thread([&]() {
        UDP client_udp;
        client_udp.set_peer("127.0.0.1", port);
        FTPSender sender(client_udp, window, timeout);
        auto start = std::chrono::steady_clock::now();
        sender_ret = sender.send_file(file.c_str());
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (sender_ret < 0) {
            // let the receiver give up as well
            server_udp.close();
            return;
        }
        std::ifstream in(file, std::ios::binary | std::ios::ate);
        double seconds = std::chrono::duration<double>(elapsed).count();
        throughput = seconds > 0 ? in.tellg() * 8.0 / 1000000.0 / seconds : 0;
    });

    // wait for threads to finish
    sender_thread.join();
    receiver_thread.join();

    // compare files
    bool same = receiver_ret == 0 && compare_files(file.c_str(), recv_file.c_str());
    std::remove(recv_file.c_str());
    if (sender_ret < 0 || !same) {
        return -1;
    }
    return throughput;
}

int main(int argc, char *argv[]) {
    int port = 8099;
    std::string windows = "1,2,3,4,5,8,16,32";
    int timeout = DEFAULT_TIMEOUT;
    long long discard = -1;
    std::string file;

    struct option long_options[] = {
        {"file", required_argument, 0, 'f'},
        {"port", required_argument, 0, 'p'},
        {"windows", required_argument, 0, 'w'},
        {"timeout", required_argument, 0, 't'},
        {"discard", required_argument, 0, 'd'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "f:p:w:t:d:", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'f':
                file = optarg;
                break;
            case 'p':
                port = std::atoi(optarg);
                break;
            case 'w':
                windows = optarg;
                break;
            case 't':
                timeout = std::atoi(optarg);
                break;
            case 'd':
                discard = std::atoll(optarg);
                break;
            default:
                std::cerr << "Usage: " << argv[0] << " --file <file> [--port <port>] [--windows <n,n,...>] [--timeout <ms>] [--discard <seq>]" << std::endl;
                return 1;
        }
    }

    if (file.empty() || timeout <= 0) {
        std::cerr << "Error: Missing required argument --file." << std::endl;
        return 1;
    }

    std::vector<unsigned int> Ns;
    std::stringstream ss(windows);
    std::string item;
    while (std::getline(ss, item, ',')) {
        int n = std::atoi(item.c_str());
        if (n < 1) {
            std::cerr << "Error: Invalid window size " << item << std::endl;
            return 1;
        }
        Ns.push_back(n);
    }

    std::vector<float> results;
    int failures = 0;
    for (unsigned int n : Ns) {
        float throughput = run_once(file, port, n, timeout, discard);
        if (throughput < 0) {
            err(("File: " + file + " N = " + std::to_string(n) + ": Test failed!").c_str());
            failures++;
        } else {
            log(("File: " + file + " N = " + std::to_string(n) + ": Test passed! Throughput: "
                + std::to_string(throughput) + " Mbps").c_str());
        }
        results.push_back(throughput);
    }

    // print results
    log(("File: " + file + " Timeout = " + std::to_string(timeout) + " ms").c_str());
    for (size_t i = 0; i < Ns.size(); i++) {
        log(("  N = " + std::to_string(Ns[i]) + ": "
            + (results[i] < 0 ? std::string("failed") : std::to_string(results[i]) + " Mbps")).c_str());
    }
    return failures == 0 ? 0 : 1;
}
