#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>
#include "config.hpp"

namespace {

int parse(std::vector<std::string> args, AppConfig &config, std::string &error) {
    std::vector<char *> argv;
    for (auto &arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return parse_args(argv.size() - 1, argv.data(), config, error);
}

std::string temp_file(const std::string &content) {
    char tmpl[] = "/tmp/drtp_config_XXXXXX";
    int fd = mkstemp(tmpl);
    EXPECT_GE(fd, 0);
    ::close(fd);
    std::ofstream out(tmpl, std::ios::binary | std::ios::trunc);
    out << content;
    return tmpl;
}

AppConfig client_config(const std::string &file) {
    AppConfig config;
    config.client = true;
    config.file = file;
    return config;
}

} // namespace

TEST(ParseArgs, Defaults) {
    AppConfig config;
    std::string error;
    ASSERT_EQ(parse({"drtp", "-s"}, config, error), 0);
    EXPECT_TRUE(config.server);
    EXPECT_FALSE(config.client);
    EXPECT_EQ(config.ip, "127.0.0.1");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.window, 3);
    EXPECT_EQ(config.discard, -1);
    EXPECT_EQ(config.timeout, 500);
    EXPECT_EQ(config.retries, 10);
    EXPECT_EQ(config.idle_timeout, 5000);
    EXPECT_TRUE(config.output.empty());
}

TEST(ParseArgs, ShortAndLongOptions) {
    AppConfig config;
    std::string error;
    ASSERT_EQ(parse({"drtp", "--client", "--ip", "10.0.0.2", "-p", "9000", "-f", "a.bin",
        "--window", "5", "-t", "250", "-r", "4"}, config, error), 0);
    EXPECT_TRUE(config.client);
    EXPECT_EQ(config.ip, "10.0.0.2");
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.file, "a.bin");
    EXPECT_EQ(config.window, 5);
    EXPECT_EQ(config.timeout, 250);
    EXPECT_EQ(config.retries, 4);

    AppConfig server;
    ASSERT_EQ(parse({"drtp", "-s", "-d", "8", "-o", "copy.jpg", "--idle", "0"}, server, error), 0);
    EXPECT_EQ(server.discard, 8);
    EXPECT_EQ(server.output, "copy.jpg");
    EXPECT_EQ(server.idle_timeout, 0);
    EXPECT_EQ(server.discard_ack, -1);

    AppConfig acks;
    ASSERT_EQ(parse({"drtp", "-s", "--discard-ack", "3"}, acks, error), 0);
    EXPECT_EQ(acks.discard_ack, 3);
    EXPECT_EQ(parse({"drtp", "-s", "-a", "two"}, acks, error), -1);
}

TEST(ParseArgs, RejectsBadNumbers) {
    AppConfig config;
    std::string error;
    EXPECT_EQ(parse({"drtp", "-s", "-p", "80x"}, config, error), -1);
    EXPECT_NE(error.find("port"), std::string::npos);
    EXPECT_EQ(parse({"drtp", "-c", "-w", ""}, config, error), -1);
    EXPECT_EQ(parse({"drtp", "-c", "-t", "fast"}, config, error), -1);
}

TEST(ParseArgs, RejectsUnknownAndStrayArguments) {
    AppConfig config;
    std::string error;
    EXPECT_EQ(parse({"drtp", "-s", "-x"}, config, error), -1);
    EXPECT_EQ(parse({"drtp", "-s", "-p"}, config, error), -1);
    EXPECT_EQ(parse({"drtp", "-s", "stray"}, config, error), -1);
    EXPECT_NE(error.find("stray"), std::string::npos);
}

TEST(ParseArgs, Help) {
    AppConfig config;
    std::string error;
    ASSERT_EQ(parse({"drtp", "--help"}, config, error), 0);
    EXPECT_TRUE(config.help);
    EXPECT_NE(usage("drtp").find("--window"), std::string::npos);
}

TEST(ValidateConfig, RoleIsRequiredAndExclusive) {
    std::string error;
    AppConfig neither;
    EXPECT_EQ(validate_config(neither, error), -1);

    AppConfig both;
    both.server = true;
    both.client = true;
    EXPECT_EQ(validate_config(both, error), -1);
    EXPECT_NE(error.find("both"), std::string::npos);

    AppConfig server;
    server.server = true;
    EXPECT_EQ(validate_config(server, error), 0);
}

TEST(ValidateConfig, AddressAndPort) {
    std::string error;
    AppConfig config;
    config.server = true;
    config.ip = "300.1.1.1";
    EXPECT_EQ(validate_config(config, error), -1);
    config.ip = "localhost";
    EXPECT_EQ(validate_config(config, error), -1);
    config.ip = "10.0.0.1";
    EXPECT_EQ(validate_config(config, error), 0);

    config.port = 1023;
    EXPECT_EQ(validate_config(config, error), -1);
    config.port = 65536;
    EXPECT_EQ(validate_config(config, error), -1);
    config.port = 1024;
    EXPECT_EQ(validate_config(config, error), 0);
    config.port = 65535;
    EXPECT_EQ(validate_config(config, error), 0);
}

TEST(ValidateConfig, Ranges) {
    std::string error;
    AppConfig config;
    config.server = true;
    config.timeout = 0;
    EXPECT_EQ(validate_config(config, error), -1);
    config.timeout = 500;
    config.retries = 0;
    EXPECT_EQ(validate_config(config, error), -1);
    config.retries = 10;
    config.idle_timeout = -1;
    EXPECT_EQ(validate_config(config, error), -1);
    config.idle_timeout = 0;
    config.discard = -2;
    EXPECT_EQ(validate_config(config, error), -1);
    config.discard = 0x100000000LL;
    EXPECT_EQ(validate_config(config, error), -1);
    config.discard = 0;
    EXPECT_EQ(validate_config(config, error), 0);
    config.discard_ack = -2;
    EXPECT_EQ(validate_config(config, error), -1);
    config.discard_ack = 2;
    EXPECT_EQ(validate_config(config, error), 0);
}

TEST(ValidateConfig, ClientFile) {
    std::string error;
    std::string file = temp_file("payload");

    AppConfig ok = client_config(file);
    EXPECT_EQ(validate_config(ok, error), 0);

    AppConfig no_window = client_config(file);
    no_window.window = 0;
    EXPECT_EQ(validate_config(no_window, error), -1);

    AppConfig no_file = client_config("");
    EXPECT_EQ(validate_config(no_file, error), -1);

    AppConfig missing = client_config(file + ".missing");
    EXPECT_EQ(validate_config(missing, error), -1);

    AppConfig directory = client_config("/tmp");
    EXPECT_EQ(validate_config(directory, error), -1);

    // the server never reads a file
    AppConfig server;
    server.server = true;
    server.window = 0;
    server.file = file + ".missing";
    EXPECT_EQ(validate_config(server, error), 0);

    std::remove(file.c_str());
}

TEST(ValidateConfig, ClientFileTooLarge) {
    std::string error;
    std::string file = temp_file("");
    ASSERT_EQ(truncate(file.c_str(), MAX_FILE_SIZE + 1), 0);
    AppConfig config = client_config(file);
    EXPECT_EQ(validate_config(config, error), -1);
    ASSERT_EQ(truncate(file.c_str(), MAX_FILE_SIZE), 0);
    EXPECT_EQ(validate_config(config, error), 0);
    std::remove(file.c_str());
}
