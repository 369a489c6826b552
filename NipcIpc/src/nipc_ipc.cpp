/**
 * @file nipc_ipc.cpp
 * ### 파일 설명(한글)
 * Connection 구현: AF_UNIX 연결, 요청 프레임 송신, 응답 프레임 역다중화 루프.
 */
#include "nipc_ipc.hpp"
#include "nipc_frame.hpp"
#include "nipc_ipc_internal.hpp"
#include "nipc_log.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace nipc {
    namespace ipc {
        using internal::preview_for_log;
        using internal::truncate_for_log;

        Connection::Connection(ConnectionOptions opt) : opt_(std::move(opt)), sink_(forward_to_logger) {
        }

        Connection::~Connection() {
            close();
        }

        Connection::Connection(Connection&& other) noexcept
            : fd_(other.fd_), opt_(std::move(other.opt_)), sink_(std::move(other.sink_)), state_(other.state_) {
            other.fd_ = -1;
            other.state_ = State::Idle;
        }

        Connection& Connection::operator=(Connection&& other) noexcept {
            if (this != &other) {
                close();
                fd_ = other.fd_;
                opt_ = std::move(other.opt_);
                sink_ = std::move(other.sink_);
                state_ = other.state_;
                other.fd_ = -1;
                other.state_ = State::Idle;
            }
            return *this;
        }

        IpcResult Connection::open(const std::string& socket_path) {
            close();

            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            socklen_t addr_len = sizeof(addr);
            // '@'로 시작하면 Linux abstract namespace
            const bool is_abstract = !socket_path.empty() && socket_path[0] == '@';
            const size_t name_len = is_abstract ? socket_path.size() - 1 : socket_path.size();
            if (socket_path.empty() || name_len >= sizeof(addr.sun_path) - 1) {
                return IpcResult::failure(IpcErrorCategory::FrameIo, "connect",
                                          "invalid socket path '" + socket_path + "'");
            }
            if (is_abstract) {
                addr.sun_path[0] = '\0';
                std::memcpy(addr.sun_path + 1, socket_path.c_str() + 1, name_len);
                addr_len = static_cast<socklen_t>(sizeof(addr.sun_family) + 1 + name_len);
            } else {
                std::memcpy(addr.sun_path, socket_path.c_str(), name_len);
            }

            int s = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
            if (s < 0) {
                const int e = errno;
                return IpcResult::failure(IpcErrorCategory::FrameIo, "connect",
                                          std::string("socket(AF_UNIX) failed: ") + std::strerror(e));
            }
            if (::connect(s, reinterpret_cast<sockaddr*>(&addr), addr_len) < 0) {
                const int e = errno;
                ::close(s);
                NIPC_LOG_WRN("IPC", "connect %s failed: %s", socket_path.c_str(), std::strerror(e));
                return IpcResult::failure(IpcErrorCategory::FrameIo, "connect",
                                          "failed to connect " + socket_path + ": " + std::strerror(e));
            }

            fd_ = s;
            state_ = State::Idle;
            NIPC_LOG_DBG("IPC", "connected to %s fd=%d", socket_path.c_str(), fd_);
            return IpcResult::success(nullptr);
        }

        void Connection::adopt(int fd) {
            close();
            fd_ = fd;
            state_ = State::Idle;
        }

        void Connection::close() {
            if (fd_ >= 0) {
                ::close(fd_);
                NIPC_LOG_DBG("IPC", "closed fd=%d", fd_);
                fd_ = -1;
            }
        }

        void Connection::set_log_sink(LogSink sink) {
            sink_ = std::move(sink);
        }

        IpcResult Connection::execute(const Command& cmd) {
            return execute(cmd.to_envelope());
        }

        IpcResult Connection::execute(const Envelope& request) {
            state_ = State::Idle;
            if (fd_ < 0) {
                return fail(IpcError(IpcErrorCategory::FrameIo, "not-connected", "connection is not open"));
            }

            IpcResult sent = send_request(request);
            if (!sent.ok) return sent;

            state_ = State::AwaitingFrame;
            return await_reply(request.kind);
        }

        IpcResult Connection::send_request(const Envelope& request) {
            std::string payload;
            std::string err;
            if (!encode_envelope(request, payload, err)) {
                // 아직 아무것도 보내지 않았으므로 연결은 유지
                state_ = State::Failed;
                NIPC_LOG_WRN("IPC", "request encode failed kind=%s: %s", request.kind.c_str(), err.c_str());
                return IpcResult::failure(IpcErrorCategory::MalformedEnvelope, "encode", err);
            }

            NIPC_LOG_FLOW("OUT kind=%s msg=%s", request.kind.c_str(), preview_for_log(request.to_json()).c_str());

            FrameStatus st;
            {
                std::lock_guard<std::mutex> lk(send_mtx_);
                st = write_frame(fd_, payload, err);
            }
            if (st != FrameStatus::Ok) {
                return fail(IpcError(IpcErrorCategory::FrameIo, frame_status_name(st), err));
            }
            NIPC_LOG_DBG("IPC", "sent kind=%s size=%zu", request.kind.c_str(), payload.size());
            return IpcResult::success(nullptr);
        }

        IpcResult Connection::await_reply(const std::string& request_kind) {
            std::vector<uint8_t> frame;
            std::string err;
            size_t log_frames = 0;

            while (true) {
                FrameStatus st = read_frame(fd_, frame, err, opt_.limits);
                if (st != FrameStatus::Ok) {
                    return fail(IpcError(IpcErrorCategory::FrameIo, frame_status_name(st), err));
                }

                Envelope env;
                if (!decode_envelope(frame.data(), frame.size(), env, err)) {
                    std::string raw(frame.begin(), frame.end());
                    NIPC_LOG_FLOW("IN <undecodable size=%zu> %s", frame.size(), truncate_for_log(raw, 256).c_str());
                    return fail(IpcError(IpcErrorCategory::MalformedEnvelope, "decode", err));
                }
                NIPC_LOG_FLOW("IN kind=%s msg=%s", env.kind.c_str(), preview_for_log(env.data).c_str());

                switch (env.type()) {
                case EnvelopeType::Log: {
                    LogEntry entry;
                    IpcError lerr;
                    if (!log_entry_from_envelope(env.data, entry, lerr)) return fail(std::move(lerr));
                    state_ = State::LogReceived;
                    ++log_frames;
                    if (sink_) sink_(entry);
                    state_ = State::AwaitingFrame;
                    break;
                }
                case EnvelopeType::Error: {
                    IpcError derr = error_from_envelope(env.data);
                    if (!derr.is_daemon_error()) return fail(std::move(derr));
                    state_ = State::Failed;
                    NIPC_LOG_DBG("IPC", "request kind=%s failed after %zu log frames: %s", request_kind.c_str(),
                                 log_frames, derr.to_string().c_str());
                    return IpcResult::failure(std::move(derr));
                }
                case EnvelopeType::Result:
                    if (!kind_accepted(request_kind, env.kind)) {
                        state_ = State::Failed;
                        NIPC_LOG_WRN("IPC", "strict mode rejected reply kind=%s for request kind=%s",
                                     env.kind.c_str(), request_kind.c_str());
                        return IpcResult::failure(IpcErrorCategory::UnexpectedKind, env.kind,
                                                  "unexpected reply kind '" + env.kind + "' for request '" +
                                                      request_kind + "'");
                    }
                    state_ = State::Resolved;
                    NIPC_LOG_DBG("IPC", "request kind=%s resolved kind=%s after %zu log frames", request_kind.c_str(),
                                 env.kind.c_str(), log_frames);
                    return IpcResult::success(std::move(env.data));
                }
            }
        }

        bool Connection::kind_accepted(const std::string& request_kind, const std::string& reply_kind) const {
            if (!opt_.strict_kinds) return true;
            return reply_kind == request_kind || opt_.accepted_kinds.count(reply_kind) > 0;
        }

        IpcResult Connection::fail(IpcError e) {
            state_ = State::Failed;
            NIPC_LOG_WRN("IPC", "request aborted: %s", e.to_string().c_str());
            // 남은 응답 프레임과의 동기가 깨졌으므로 연결 폐기
            close();
            return IpcResult::failure(std::move(e));
        }

    } // namespace ipc
} // namespace nipc
