#include <gtest/gtest.h>

#include "../server/server_app.hpp"
#include "../client/restore_client.hpp"
#include "../common/snapshot_format.hpp"
#include "../common/protocol_io.hpp"
#include "test_util.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

// Poll 'cond' for up to 'limit'
bool eventually(const std::function<bool()>& cond,
                std::chrono::milliseconds limit = std::chrono::milliseconds(2000))
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

class IntegrationTest : public ::testing::Test {
protected:
    platform::Guard              guard_;
    testutil::TempDir            dir_{"integration"};
    std::unique_ptr<ServerApp>   app_;
    std::thread                  server_thread_;

    void SetUp() override { platform::ignore_sigpipe(); }

    void start(u64 max_bytes = 0, int idle_timeout_s = 5) {
        ServerConfig cfg;
        cfg.state_dir          = dir_.str();
        cfg.listen_ip          = "127.0.0.1";
        cfg.listen_port        = 0;
        cfg.idle_timeout_s     = idle_timeout_s;
        cfg.max_snapshot_bytes = max_bytes;
        app_ = std::make_unique<ServerApp>(cfg);
        app_->listen();
        server_thread_ = std::thread([this]() { app_->run(); });
    }

    void stop_server() {
        if (!app_) return;
        app_->stop();
        if (server_thread_.joinable()) server_thread_.join();
    }

    void TearDown() override {
        stop_server();
        app_.reset();
    }

    std::string snapshot_file(const std::string& name, const std::vector<u8>& image) {
        std::string path = dir_.file(name);
        testutil::write_file(path, image);
        return path;
    }

    RestoreResult restore_file(const std::string& path) {
        file_io::ByteSource src = file_io::ByteSource::open_file(path);
        TcpRestoreStream stream("127.0.0.1", app_->port(), 5);
        RestoreClient client;
        return client.run(src, stream);
    }

    TcpSocket raw_connect() {
        TcpSocket s;
        s.connect("127.0.0.1", app_->port());
        s.set_recv_timeout_ms(5000);
        return s;
    }

    static RestoreResult read_result(TcpSocket& s) {
        FrameHeader hdr{};
        std::vector<u8> payload;
        if (!s.read_frame(hdr, payload)) {
            throw std::runtime_error("no RESULT frame");
        }
        EXPECT_EQ(hdr.msg_type, (u16)MsgType::MT_RESTORE_RESULT);
        return proto::decode_result(payload);
    }

    size_t staged_files() const {
        return testutil::count_files(dir_.path() / ".staging");
    }
};

} // namespace

TEST_F(IntegrationTest, RestoresSnapshotOverLoopback)
{
    start();
    ASSERT_NE(app_->port(), 0);

    std::vector<u8> payload = testutil::sequential_bytes(300000);
    std::vector<u8> image = snapshot::build(payload.data(), payload.size(), CompressAlgo::ZSTD);
    RestoreResult r = restore_file(snapshot_file("upload.snap", image));

    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(app_->store().current(), image);
    EXPECT_EQ(app_->store().generation(), 1u);
    EXPECT_TRUE(eventually([&]() { return staged_files() == 0; }));
}

TEST_F(IntegrationTest, InvalidUploadKeepsPriorState)
{
    start();
    std::vector<u8> prior = snapshot::build("prior state");
    ASSERT_TRUE(restore_file(snapshot_file("prior.snap", prior)).ok());

    RestoreResult r = restore_file(snapshot_file("junk.snap", testutil::bytes("AAAABBBBCCCC")));
    EXPECT_EQ(r.status, RestoreStatus::ERR_INVALID_SNAPSHOT);
    EXPECT_EQ(app_->store().current(), prior);
}

TEST_F(IntegrationTest, EmptyUploadIsReportedInvalid)
{
    start();
    RestoreResult r = restore_file(snapshot_file("empty.snap", {}));
    EXPECT_EQ(r.status, RestoreStatus::ERR_INVALID_SNAPSHOT);
    EXPECT_FALSE(app_->store().has_state());
}

TEST_F(IntegrationTest, DisconnectBeforeEndDiscardsUpload)
{
    start();
    std::vector<u8> prior = snapshot::build("prior state");
    ASSERT_TRUE(restore_file(snapshot_file("prior.snap", prior)).ok());

    std::vector<u8> image = snapshot::build("never committed");
    {
        TcpSocket s = raw_connect();
        s.write_frame(MsgType::MT_RESTORE_OPEN, SNAPCP_PROTOCOL_VERSION, nullptr, 0);
        s.write_frame(MsgType::MT_RESTORE_CHUNK, 0, image.data(), (u32)image.size());
        ASSERT_TRUE(eventually([&]() { return staged_files() == 1; }));
        // Full image sent, but no END: closing is an abort
    }

    EXPECT_TRUE(eventually([&]() { return staged_files() == 0; }));
    EXPECT_EQ(app_->store().current(), prior);
    EXPECT_EQ(app_->store().generation(), 1u);
}

TEST_F(IntegrationTest, IdleSessionIsAbortedAndDiscarded)
{
    start(0, 1);
    TcpSocket s = raw_connect();
    s.write_frame(MsgType::MT_RESTORE_OPEN, SNAPCP_PROTOCOL_VERSION, nullptr, 0);
    s.write_frame(MsgType::MT_RESTORE_CHUNK, 0, "abc", 3);
    ASSERT_TRUE(eventually([&]() { return staged_files() == 1; }));

    // No further input: the server gives up after one second
    EXPECT_TRUE(eventually([&]() { return staged_files() == 0; },
                           std::chrono::milliseconds(4000)));
    EXPECT_FALSE(app_->store().has_state());
    EXPECT_EQ(app_->store().generation(), 0u);

    // An abort gets no RESULT, only the closed connection
    FrameHeader hdr{};
    std::vector<u8> payload;
    EXPECT_FALSE(s.read_frame(hdr, payload));
}

TEST_F(IntegrationTest, ChunkBeforeOpenGetsProtocolError)
{
    start();
    TcpSocket s = raw_connect();
    s.write_frame(MsgType::MT_RESTORE_CHUNK, 0, "data", 4);

    RestoreResult r = read_result(s);
    EXPECT_EQ(r.status, RestoreStatus::ERR_PROTOCOL);
    EXPECT_FALSE(app_->store().has_state());
}

TEST_F(IntegrationTest, DuplicateOpenGetsProtocolError)
{
    start();
    TcpSocket s = raw_connect();
    s.write_frame(MsgType::MT_RESTORE_OPEN, SNAPCP_PROTOCOL_VERSION, nullptr, 0);
    s.write_frame(MsgType::MT_RESTORE_OPEN, SNAPCP_PROTOCOL_VERSION, nullptr, 0);

    RestoreResult r = read_result(s);
    EXPECT_EQ(r.status, RestoreStatus::ERR_PROTOCOL);
    EXPECT_NE(r.message.find("duplicate open"), std::string::npos);
    EXPECT_TRUE(eventually([&]() { return staged_files() == 0; }));
}

TEST_F(IntegrationTest, UnknownVersionGetsProtocolError)
{
    start();
    TcpSocket s = raw_connect();
    s.write_frame(MsgType::MT_RESTORE_OPEN, 99, nullptr, 0);

    RestoreResult r = read_result(s);
    EXPECT_EQ(r.status, RestoreStatus::ERR_PROTOCOL);
}

TEST_F(IntegrationTest, UnknownMessageTypeGetsProtocolError)
{
    start();
    TcpSocket s = raw_connect();
    s.write_frame(MsgType::MT_RESTORE_OPEN, SNAPCP_PROTOCOL_VERSION, nullptr, 0);
    s.write_frame(static_cast<MsgType>(0x7f), 0, nullptr, 0);

    RestoreResult r = read_result(s);
    EXPECT_EQ(r.status, RestoreStatus::ERR_PROTOCOL);
    EXPECT_EQ(r.message, "unexpected message type 127");
}

TEST_F(IntegrationTest, OversizedUploadIsRejected)
{
    start(4096);
    std::vector<u8> payload = testutil::sequential_bytes(64 * 1024);
    std::vector<u8> image = snapshot::build(payload.data(), payload.size());

    RestoreResult r = restore_file(snapshot_file("big.snap", image));
    EXPECT_EQ(r.status, RestoreStatus::ERR_TOO_LARGE);
    EXPECT_FALSE(app_->store().has_state());
}

TEST_F(IntegrationTest, ConcurrentRestoresCommitOneAtATime)
{
    start();
    constexpr int kClients = 4;
    std::vector<std::vector<u8>> images;
    std::vector<std::string> paths;
    for (int i = 0; i < kClients; ++i) {
        std::vector<u8> payload = testutil::sequential_bytes(50000 + (size_t)i * 1000);
        payload[0] = (u8)i;
        images.push_back(snapshot::build(payload.data(), payload.size()));
        paths.push_back(snapshot_file("client" + std::to_string(i) + ".snap", images.back()));
    }

    std::atomic<int> ok_count{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&, i]() {
            if (restore_file(paths[(size_t)i]).ok()) ok_count.fetch_add(1);
        });
    }
    for (auto& t : clients) t.join();

    EXPECT_EQ(ok_count.load(), kClients);
    std::vector<u8> final_state = app_->store().current();
    bool matches_one = false;
    for (const auto& img : images) matches_one = matches_one || img == final_state;
    EXPECT_TRUE(matches_one);
}

TEST_F(IntegrationTest, StopCutsOffInFlightSession)
{
    start(0, 0);
    TcpSocket s = raw_connect();
    s.write_frame(MsgType::MT_RESTORE_OPEN, SNAPCP_PROTOCOL_VERSION, nullptr, 0);
    s.write_frame(MsgType::MT_RESTORE_CHUNK, 0, "partial", 7);
    ASSERT_TRUE(eventually([&]() { return staged_files() == 1; }));

    stop_server();
    EXPECT_EQ(staged_files(), 0u);
    EXPECT_FALSE(app_->store().has_state());
}

TEST(TcpSocketTest, DiscardInputDropsUntilPeerCloses)
{
    platform::Guard guard;
    TcpSocket listener;
    listener.bind_and_listen("127.0.0.1", 0);

    std::thread writer([port = listener.local_port()]() {
        TcpSocket c;
        c.connect("127.0.0.1", port);
        std::vector<u8> junk = testutil::sequential_bytes(50000);
        c.send_all(junk.data(), junk.size());
    });

    TcpSocket server_side = listener.accept();
    size_t dropped = server_side.discard_input(5000);
    writer.join();
    EXPECT_EQ(dropped, 50000u);
}
