/**
 * @file nipc_ipc.hpp
 * ### 파일 설명(한글)
 * 데몬과의 AF_UNIX 스트림 연결 하나를 소유하고 동기식 요청/응답을 수행한다.
 * * execute()는 요청 프레임을 보낸 뒤 종료 프레임(결과 또는 error)이 올 때까지 블록하며,
 *   그 사이의 "log" 프레임은 sink로 넘긴다.
 * * 한 연결에는 한 번에 하나의 요청만 진행할 수 있다(파이프라이닝 없음).
 */
#pragma once
#include "nipc_commands.hpp"
#include "nipc_daemon_log.hpp"
#include "nipc_envelope.hpp"
#include "nipc_error.hpp"
#include "nipc_ipc_types.hpp"
#include <mutex>
#include <string>

namespace nipc {
    namespace ipc {

        /** @brief 소켓을 독점 소유하는 연결. 소멸 시 항상 소켓을 닫는다. */
        class Connection {
          public:
            /// 요청 단위 상태
            enum class State { Idle, AwaitingFrame, LogReceived, Resolved, Failed };

            explicit Connection(ConnectionOptions opt = ConnectionOptions{});
            ~Connection();
            Connection(const Connection&) = delete;
            Connection& operator=(const Connection&) = delete;
            Connection(Connection&& other) noexcept;
            Connection& operator=(Connection&& other) noexcept;

            /**
             * @brief socket_path에 연결(재시도 없음)
             * @return 실패 시 FrameIo(kind="connect")
             */
            IpcResult open(const std::string& socket_path);

            /// 이미 연결된 스트림 fd의 소유권을 넘겨받는다(socketpair, 상속 fd 등)
            void adopt(int fd);

            void close();
            bool is_open() const { return fd_ >= 0; }

            /// 기본값은 forward_to_logger. 빈 함수를 넘기면 log 프레임은 버려진다.
            void set_log_sink(LogSink sink);

            const ConnectionOptions& options() const { return opt_; }
            void set_options(const ConnectionOptions& opt) { opt_ = opt; }

            State state() const { return state_; }

            IpcResult execute(const Command& cmd);

            /**
             * @brief 임의의 요청 envelope을 보내고 종료 프레임까지 수신
             * @details 전송/해석 실패 시 연결을 닫는다(남은 프레임과 동기가 깨지므로).
             *          데몬 오류와 UnexpectedKind는 종료 프레임을 다 읽은 상태라 연결을 유지한다.
             */
            IpcResult execute(const Envelope& request);

          private:
            IpcResult send_request(const Envelope& request);
            IpcResult await_reply(const std::string& request_kind);
            IpcResult fail(IpcError e);
            bool kind_accepted(const std::string& request_kind, const std::string& reply_kind) const;

            int fd_{-1};
            ConnectionOptions opt_;
            LogSink sink_;
            State state_{State::Idle};
            std::mutex send_mtx_;
        };

    } // namespace ipc
} // namespace nipc
