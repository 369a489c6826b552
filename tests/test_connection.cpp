#include "fake_daemon.hpp"
#include "nipc_frame.hpp"
#include "nipc_ipc.hpp"

#include "nipc_client.hpp"

#include <cstring>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace nipc::ipc;
using nipc::test::FakeDaemon;
using nlohmann::json;

namespace {

    class ConnectionTest : public ::testing::Test {
      protected:
        void SetUp() override {
            conn.adopt(daemon.release_client_fd());
            conn.set_log_sink([this](const LogEntry& e) { logs.push_back(e); });
        }

        FakeDaemon daemon;
        Connection conn;
        std::vector<LogEntry> logs;
    };

} // namespace

TEST_F(ConnectionTest, PingReturnsPong) {
    daemon.send_envelope("ping", "pong");

    IpcResult r = conn.execute(Command::ping());
    ASSERT_TRUE(r.ok) << r.error.to_string();
    EXPECT_EQ(r.data, "pong");
    EXPECT_EQ(conn.state(), Connection::State::Resolved);
    EXPECT_TRUE(conn.is_open());

    EXPECT_EQ(daemon.read_request(), json::parse(R"({"kind":"ping","data":"ping"})"));
}

TEST_F(ConnectionTest, ResultWithoutLogs) {
    daemon.send_envelope("query-network-state", {{"interfaces", json::array()}});

    IpcResult r = conn.execute(Command::query());
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.data, json({{"interfaces", json::array()}}));
    EXPECT_TRUE(logs.empty());
}

TEST_F(ConnectionTest, LogsAreDeliveredInOrderBeforeResult) {
    daemon.send_log("daemon", "info", "first");
    daemon.send_log("plugin_nm", "debug", "second");
    daemon.send_log("daemon", "error", "third");
    daemon.send_envelope("apply-network-state", nullptr);

    IpcResult r = conn.execute(Command::apply(json::object(), ApplyOptions::with_verify(true)));
    ASSERT_TRUE(r.ok) << r.error.to_string();
    EXPECT_TRUE(r.data.is_null());

    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs[0].message, "first");
    EXPECT_EQ(logs[1].source, "plugin_nm");
    EXPECT_EQ(logs[1].level, DaemonLogLevel::Debug);
    EXPECT_EQ(logs[2].level, DaemonLogLevel::Error);
}

TEST_F(ConnectionTest, ApplySendsOrderedPair) {
    daemon.send_envelope("apply-network-state", nullptr);
    json state = {{"interfaces", json::array({{{"name", "eth0"}, {"mtu", 1500}}})}};

    IpcResult r = conn.execute(Command::apply(state, ApplyOptions::with_verify(false)));
    ASSERT_TRUE(r.ok);

    json req = daemon.read_request();
    EXPECT_EQ(req["kind"], "apply-network-state");
    EXPECT_EQ(req["data"]["apply-network-state"], json::array({state, {{"version", 1}, {"no-verify", true}}}));
}

TEST_F(ConnectionTest, ErrorFrameStopsReadingAndKeepsConnection) {
    daemon.send_log("daemon", "info", "before");
    daemon.send_error("invalid-argument", "bad mtu");
    daemon.send_envelope("query-network-state", "must stay unread");

    IpcResult r = conn.execute(Command::query());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::Validation);
    EXPECT_EQ(r.error.kind, "invalid-argument");
    EXPECT_EQ(r.error.msg, "bad mtu");
    EXPECT_EQ(logs.size(), 1u);
    EXPECT_EQ(conn.state(), Connection::State::Failed);
    ASSERT_TRUE(conn.is_open());

    // 다음 프레임은 아직 소켓에 남아 있어야 한다
    std::vector<uint8_t> frame;
    std::string err;
    FrameLimits limits;
    limits.read_timeout_ms = 1000;
    ASSERT_EQ(read_frame(daemon.client_fd_number(), frame, err, limits), FrameStatus::Ok) << err;
    EXPECT_EQ(json::parse(frame.begin(), frame.end())["data"], "must stay unread");
}

TEST_F(ConnectionTest, GenericDaemonErrorIsProtocol) {
    daemon.send_error("plugin-failure", "nm crashed");

    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::Protocol);
    EXPECT_EQ(r.error.kind, "plugin-failure");
}

TEST_F(ConnectionTest, PeerCloseInsideHeaderIsTransportError) {
    daemon.send_raw({0x00, 0x00});
    daemon.shutdown_write();

    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::FrameIo);
    EXPECT_EQ(r.error.kind, "connection-closed");
    EXPECT_FALSE(conn.is_open());
}

TEST_F(ConnectionTest, UndecodableFrameIsMalformed) {
    daemon.send_frame("{this is not json");

    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::MalformedEnvelope);
    EXPECT_FALSE(conn.is_open());
}

TEST_F(ConnectionTest, EmptyFrameIsMalformedNotClosed) {
    daemon.send_frame("");

    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::MalformedEnvelope);
}

TEST_F(ConnectionTest, UnknownLogLevelAborts) {
    daemon.send_log("daemon", "verbose", "?");
    daemon.send_envelope("ping", "pong");

    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::UnknownLogLevel);
    EXPECT_TRUE(logs.empty());
    EXPECT_FALSE(conn.is_open());
}

TEST_F(ConnectionTest, MalformedErrorEnvelopeAborts) {
    daemon.send_envelope("error", "not an object");

    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::MalformedEnvelope);
    EXPECT_FALSE(conn.is_open());
}

TEST_F(ConnectionTest, UnknownKindIsResultByDefault) {
    daemon.send_envelope("something-new", {{"x", 1}});

    IpcResult r = conn.execute(Command::ping());
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.data["x"], 1);
}

TEST_F(ConnectionTest, StrictModeRejectsUnexpectedKind) {
    ConnectionOptions opt;
    opt.strict_kinds = true;
    opt.accepted_kinds = {"pong"};
    conn.set_options(opt);

    daemon.send_envelope("something-new", 1);
    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::UnexpectedKind);
    EXPECT_EQ(r.error.kind, "something-new");
    EXPECT_TRUE(conn.is_open());

    daemon.send_envelope("pong", "pong");
    r = conn.execute(Command::ping());
    EXPECT_TRUE(r.ok);

    daemon.send_envelope("ping", "pong");
    r = conn.execute(Command::ping());
    EXPECT_TRUE(r.ok);
}

TEST_F(ConnectionTest, ReadTimeoutIsTransportError) {
    ConnectionOptions opt;
    opt.limits.read_timeout_ms = 20;
    conn.set_options(opt);

    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::FrameIo);
    EXPECT_EQ(r.error.kind, "timeout");
}

TEST_F(ConnectionTest, ExecuteAfterFailureIsNotConnected) {
    daemon.hang_up();
    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);

    r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::FrameIo);
    EXPECT_EQ(r.error.kind, "not-connected");
}

TEST_F(ConnectionTest, SequentialRequestsOnOneConnection) {
    daemon.send_envelope("ping", "pong");
    daemon.send_log("daemon", "info", "saving");
    daemon.send_envelope("query-network-state", {{"ok", true}});

    ASSERT_TRUE(conn.execute(Command::ping()).ok);
    IpcResult r = conn.execute(Command::query(QueryOptions::saved()));
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.data["ok"], true);
    EXPECT_EQ(logs.size(), 1u);

    daemon.read_request();
    json q = daemon.read_request();
    EXPECT_EQ(q["data"]["query-network-state"]["kind"], "saved-network-state");
}

TEST(ConnectionOpen, MissingSocketIsConnectError) {
    Connection conn;
    IpcResult r = conn.open("/nonexistent/nipc-test.sock");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::FrameIo);
    EXPECT_EQ(r.error.kind, "connect");
    EXPECT_FALSE(conn.is_open());
}

TEST(ConnectionOpen, NotConnectedBeforeOpen) {
    Connection conn;
    IpcResult r = conn.execute(Command::ping());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.kind, "not-connected");
}

namespace {

    // '@' 추상 이름으로 listen 하고 요청 하나에 응답 하나를 돌려주는 데몬
    class ListeningDaemon {
      public:
        explicit ListeningDaemon(json reply) : reply_(std::move(reply)) {
            path_ = "@nipc-test-" + std::to_string(::getpid());
            listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            std::memcpy(addr.sun_path + 1, path_.c_str() + 1, path_.size() - 1);
            socklen_t len = static_cast<socklen_t>(sizeof(addr.sun_family) + path_.size());
            if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), len) != 0 || ::listen(listen_fd_, 1) != 0) {
                ::close(listen_fd_);
                listen_fd_ = -1;
                return;
            }
            worker_ = std::thread([this] { serve_one(); });
        }

        ~ListeningDaemon() {
            if (worker_.joinable()) worker_.join();
            if (listen_fd_ >= 0) ::close(listen_fd_);
        }

        bool ok() const { return listen_fd_ >= 0; }
        const std::string& path() const { return path_; }
        json request() {
            if (worker_.joinable()) worker_.join();
            return request_;
        }

      private:
        void serve_one() {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) return;
            std::vector<uint8_t> frame;
            std::string err;
            FrameLimits limits;
            limits.read_timeout_ms = 2000;
            if (read_frame(fd, frame, err, limits) == FrameStatus::Ok) {
                request_ = json::parse(frame.begin(), frame.end(), nullptr, false);
                write_frame(fd, reply_.dump(), err);
            }
            ::close(fd);
        }

        json reply_;
        json request_;
        std::string path_;
        int listen_fd_{-1};
        std::thread worker_;
    };

} // namespace

TEST(ConnectionOpen, AbstractSocketShowHelper) {
    ListeningDaemon d(json::parse(R"({"kind":"query-network-state","data":{"interfaces":[]}})"));
    ASSERT_TRUE(d.ok());

    IpcResult r = show(d.path());
    ASSERT_TRUE(r.ok) << r.error.to_string();
    EXPECT_EQ(r.data, json::parse(R"({"interfaces":[]})"));
    EXPECT_EQ(d.request()["data"]["query-network-state"]["kind"], "running-network-state");
}

TEST(ConnectionOpen, ApplyHelperSendsVerifyFlag) {
    ListeningDaemon d(json::parse(R"({"kind":"error","data":{"kind":"invalid-argument","msg":"no such iface"}})"));
    ASSERT_TRUE(d.ok());

    IpcResult r = apply(json::parse(R"({"interfaces":[]})"), false, d.path());
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.error.category, IpcErrorCategory::Validation);
    EXPECT_EQ(d.request()["data"]["apply-network-state"][1]["no-verify"], true);
}
