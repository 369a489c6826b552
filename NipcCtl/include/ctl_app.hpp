/**
 * @file ctl_app.hpp
 * ### 파일 설명(한글)
 * nipc CLI 본체. 파싱된 서브커맨드를 Client 호출로 옮기고 결과를 출력/종료 코드로 변환한다.
 */
#pragma once
#include <iosfwd>
#include <string>

#include "nipc_client.hpp"

namespace nipc {
    namespace ctl {

        // 프로세스 종료 코드
        enum ExitCode : int {
            kExitOk = 0,
            kExitUsage = 1,     ///< 인자/설정 오류
            kExitTransport = 2, ///< 전송 또는 해석 실패
            kExitDaemon = 3,    ///< 데몬이 보고한 오류
            kExitInternal = 4   ///< 알 수 없는 로그 레벨, 예상 밖 kind
        };

        enum class Subcommand { None, Ping, Show, Apply };

        struct CtlRequest {
            Subcommand cmd{Subcommand::None};
            ipc::StateKind show_kind{ipc::StateKind::Running};
            std::string apply_source; ///< 파일 경로 또는 "-"(stdin)
            bool verify_change{true};
        };

        /// 명령행 전체. 설정 파일 값보다 우선한다.
        struct CliArgs {
            std::string config_path{"nipc_config.json"};
            bool config_explicit{false}; ///< -c로 지정했으면 파일이 없을 때 오류
            std::string socket_path;     ///< 비어 있으면 설정값 사용
            int read_timeout_ms{-1};     ///< 음수면 설정값 사용
            int verbosity{0};            ///< -v마다 +1, -q는 -1
            CtlRequest req;
        };

        /// argv[1..]를 해석한다. 실패 시 false와 err에 사유.
        bool parse_command_line(int argc, const char* const* argv, CliArgs& out, std::string& err);

        const char* usage_text();

        int exit_code_for(const ipc::IpcError& e);

        class CtlApp {
          public:
            CtlApp(std::string socket_path, ipc::ConnectionOptions opt);

            /// 결과는 out, 오류 메시지는 err로 출력
            int run(const CtlRequest& req, std::istream& in, std::ostream& out, std::ostream& err);

            ipc::Client& client() { return client_; }

          private:
            ipc::IpcResult ensure_connected();
            int do_ping(std::ostream& out, std::ostream& err);
            int do_show(const CtlRequest& req, std::ostream& out, std::ostream& err);
            int do_apply(const CtlRequest& req, std::istream& in, std::ostream& out, std::ostream& err);
            int report(const ipc::IpcError& e, std::ostream& err) const;

            std::string socket_path_;
            ipc::Client client_;
        };

    } // namespace ctl
} // namespace nipc
