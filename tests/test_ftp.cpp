#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "ftp.hpp"
#include "memory_channel.hpp"

namespace {

bool exists(const std::string &path) {
    return access(path.c_str(), F_OK) == 0;
}

std::string read_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_file(const std::string &path, const std::string &content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// runs each test inside a fresh directory
class FTPFiles : public ::testing::Test {
protected:
    void SetUp() override {
        char cwd[4096];
        ASSERT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
        old_cwd = cwd;
        char tmpl[] = "/tmp/drtp_ftp_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir = tmpl;
        ASSERT_EQ(chdir(dir.c_str()), 0);
    }

    void TearDown() override {
        EXPECT_EQ(chdir(old_cwd.c_str()), 0);
        std::string cmd = "rm -rf " + dir;
        EXPECT_EQ(std::system(cmd.c_str()), 0);
    }

    std::string old_cwd;
    std::string dir;
};

// drive a receiver from a raw client: SYN, the given segments, then FIN
void play_client(PacketLink &peer, const std::string &name, uint64_t size,
    const std::vector<std::string> &segments) {
    SessionInfo info;
    info.window = 3;
    info.file_size = size;
    info.file_name = name;
    char buf[MSS];
    int len = DRTPEncodeSessionInfo(info, buf, MSS);
    ASSERT_GT(len, 0);
    send_frame(peer, TYPE_SYN, 0, 0, std::string(buf, len));

    PacketBuffer buffer;
    ASSERT_TRUE(recv_frame(peer, buffer, 1000));
    ASSERT_EQ(buffer->header.flags, TYPE_SYN | TYPE_ACK);
    uint32_t seq = 1;
    for (const std::string &segment : segments) {
        send_frame(peer, TYPE_DATA, seq, 0, segment);
        ASSERT_TRUE(recv_frame(peer, buffer, 1000));
        ASSERT_EQ(buffer->header.ack, seq);
        seq++;
    }
    send_frame(peer, TYPE_FIN, seq, 0);
    ASSERT_TRUE(recv_frame(peer, buffer, 1000));
    EXPECT_EQ(buffer->header.flags, TYPE_FIN | TYPE_ACK);
}

} // namespace

TEST(FileChunker, ExactMultiple) {
    std::istringstream in("abcdefgh");
    FileChunker chunker(in, 4);
    char data[4];
    EXPECT_EQ(chunker.next(data), 4);
    EXPECT_EQ(std::string(data, 4), "abcd");
    EXPECT_EQ(chunker.next(data), 4);
    EXPECT_EQ(std::string(data, 4), "efgh");
    EXPECT_EQ(chunker.next(data), 0);
    EXPECT_EQ(chunker.next(data), 0);
    EXPECT_EQ(chunker.get_bytes_read(), 8u);
    EXPECT_EQ(chunker.get_chunks(), 2u);
}

TEST(FileChunker, ShortTail) {
    std::istringstream in("0123456789");
    FileChunker chunker(in, 4);
    char data[4];
    EXPECT_EQ(chunker.next(data), 4);
    EXPECT_EQ(chunker.next(data), 4);
    EXPECT_EQ(chunker.next(data), 2);
    EXPECT_EQ(std::string(data, 2), "89");
    EXPECT_EQ(chunker.next(data), 0);
    EXPECT_EQ(chunker.get_chunks(), 3u);
}

TEST(FileChunker, EmptyStream) {
    std::istringstream in("");
    FileChunker chunker(in);
    char data[MSS];
    EXPECT_EQ(chunker.next(data), 0);
    EXPECT_EQ(chunker.get_chunks(), 0u);
}

TEST(FileChunker, BrokenStream) {
    std::istream in(nullptr);
    FileChunker chunker(in);
    char data[MSS];
    EXPECT_EQ(chunker.next(data), E_IO_ERROR);
}

TEST(FileAssembler, AppendsInOrder) {
    std::ostringstream out;
    FileAssembler assembler(out);
    EXPECT_EQ(assembler.append("hello ", 6), 6);
    EXPECT_EQ(assembler.append("world", 5), 5);
    EXPECT_EQ(assembler.finalize(), 0);
    EXPECT_EQ(out.str(), "hello world");
    EXPECT_EQ(assembler.get_bytes_written(), 11u);
}

TEST(FileAssembler, BrokenStream) {
    std::ostream out(nullptr);
    FileAssembler assembler(out);
    EXPECT_EQ(assembler.append("x", 1), E_IO_ERROR);
    EXPECT_EQ(assembler.get_bytes_written(), 0u);
}

TEST(FTPReceiverNames, SafeName) {
    EXPECT_EQ(FTPReceiver::safe_name("photo.jpg"), "photo.jpg");
    EXPECT_EQ(FTPReceiver::safe_name("/etc/passwd"), "passwd");
    EXPECT_EQ(FTPReceiver::safe_name("../../x.bin"), "x.bin");
    EXPECT_EQ(FTPReceiver::safe_name(""), "received_file");
    EXPECT_EQ(FTPReceiver::safe_name("dir/"), "received_file");
    EXPECT_EQ(FTPReceiver::safe_name(".."), "received_file");
}

TEST_F(FTPFiles, UniqueNameAddsCopyNumber) {
    EXPECT_EQ(FTPReceiver::unique_name("photo.jpg"), "photo.jpg");
    write_file("photo.jpg", "a");
    EXPECT_EQ(FTPReceiver::unique_name("photo.jpg"), "photo(0).jpg");
    write_file("photo(0).jpg", "b");
    EXPECT_EQ(FTPReceiver::unique_name("photo.jpg"), "photo(1).jpg");

    write_file("README", "c");
    EXPECT_EQ(FTPReceiver::unique_name("README"), "README(0)");
    write_file(".hidden", "d");
    EXPECT_EQ(FTPReceiver::unique_name(".hidden"), ".hidden(0)");
}

TEST_F(FTPFiles, SavesUnderAnnouncedName) {
    write_file("photo.jpg", "older");
    MemoryChannel client, server;
    MemoryChannel::wire(client, server);
    PacketLink peer(client);
    FTPReceiver receiver(server);

    int ret = 1;
    std::thread r([&] { ret = receiver.receive_file(""); });
    play_client(peer, "../photo.jpg", 11, {"hello ", "world"});
    r.join();

    EXPECT_EQ(ret, 0);
    EXPECT_EQ(receiver.get_output_path(), "photo(0).jpg");
    EXPECT_EQ(read_file("photo(0).jpg"), "hello world");
    EXPECT_EQ(read_file("photo.jpg"), "older");
    EXPECT_FALSE(exists("photo(0).jpg.part"));
}

TEST_F(FTPFiles, ExplicitOutputPath) {
    MemoryChannel client, server;
    MemoryChannel::wire(client, server);
    PacketLink peer(client);
    FTPReceiver receiver(server);

    int ret = 1;
    std::thread r([&] { ret = receiver.receive_file("out.bin"); });
    play_client(peer, "ignored.bin", 3, {"abc"});
    r.join();

    EXPECT_EQ(ret, 0);
    EXPECT_EQ(read_file("out.bin"), "abc");
    EXPECT_FALSE(exists("ignored.bin"));
}

TEST_F(FTPFiles, ShortTransferLeavesNoFile) {
    MemoryChannel client, server;
    MemoryChannel::wire(client, server);
    PacketLink peer(client);
    FTPReceiver receiver(server);

    int ret = 0;
    std::thread r([&] { ret = receiver.receive_file("out.bin"); });
    // announces ten bytes, closes after three
    play_client(peer, "out.bin", 10, {"abc"});
    r.join();

    EXPECT_EQ(ret, E_INCOMPLETE);
    EXPECT_FALSE(exists("out.bin"));
    EXPECT_FALSE(exists("out.bin.part"));
}

TEST_F(FTPFiles, IdleClientLeavesNoFile) {
    MemoryChannel client, server;
    MemoryChannel::wire(client, server);
    PacketLink peer(client);
    FTPReceiver receiver(server, 100);

    int ret = 0;
    std::thread r([&] { ret = receiver.receive_file("out.bin"); });
    SessionInfo info;
    info.window = 3;
    info.file_size = 5;
    info.file_name = "out.bin";
    char buf[MSS];
    int len = DRTPEncodeSessionInfo(info, buf, MSS);
    send_frame(peer, TYPE_SYN, 0, 0, std::string(buf, len));
    r.join();

    EXPECT_EQ(ret, E_TRANSFER_ABORTED);
    EXPECT_FALSE(exists("out.bin"));
    EXPECT_FALSE(exists("out.bin.part"));
}

TEST(FTPSender, MissingFile) {
    MemoryChannel client, server;
    MemoryChannel::wire(client, server);
    FTPSender sender(client);
    EXPECT_EQ(sender.send_file("/nonexistent/drtp/file.bin"), E_IO_ERROR);
    EXPECT_TRUE(client.sent_frames().empty());
}

TEST(FTPSender, StreamShorterThanAnnouncedAborts) {
    MemoryChannel client, server;
    MemoryChannel::wire(client, server);
    PacketLink peer(server);
    FTPSender sender(client, 3, 100);

    std::istringstream in("abc");
    int ret = 0;
    std::thread s([&] { ret = sender.send_stream(in, "short.bin", 10); });
    PacketBuffer buffer;
    ASSERT_TRUE(recv_frame(peer, buffer, 1000));
    ASSERT_TRUE(buffer->header.flags & TYPE_SYN);
    send_frame(peer, TYPE_SYN | TYPE_ACK, 0, buffer->header.seq);
    s.join();

    EXPECT_EQ(ret, E_IO_ERROR);
    EXPECT_EQ(sender.get_sender().get_state(), RDTSender::ABORTED);
}
