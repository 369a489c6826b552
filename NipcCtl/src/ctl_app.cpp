/**
 * @file ctl_app.cpp
 * ### 파일 설명(한글)
 * CtlApp 구현. 한 번 실행에 연결 하나, 요청 하나.
 */
#include "ctl_app.hpp"
#include "nipc_log.hpp"

#include <cstdlib>
#include <fstream>
#include <istream>
#include <nlohmann/json.hpp>
#include <ostream>
#include <utility>

namespace nipc {
    namespace ctl {

        const char* usage_text() {
            return "usage: nipc [-c <config.json>] [-s <socket>] [-t <timeout_ms>] [-v|-q] <command>\n"
                   "commands:\n"
                   "  ping\n"
                   "  show [--saved | --post-last-commit]\n"
                   "  apply <state.json | -> [--no-verify]\n";
        }

        namespace {
            bool parse_int(const std::string& s, int& out) {
                if (s.empty()) return false;
                char* end = nullptr;
                long v = std::strtol(s.c_str(), &end, 10);
                if (*end != '\0' || v < 0 || v > 0x7fffffffL) return false;
                out = static_cast<int>(v);
                return true;
            }
        } // namespace

        bool parse_command_line(int argc, const char* const* argv, CliArgs& out, std::string& err) {
            int i = 1;
            // 전역 옵션
            for (; i < argc; ++i) {
                const std::string a = argv[i];
                if (a.empty() || a[0] != '-' || a == "-") break;
                if (a == "-v") {
                    ++out.verbosity;
                } else if (a == "-q") {
                    --out.verbosity;
                } else if (a == "-c" || a == "-s" || a == "-t") {
                    if (i + 1 >= argc) {
                        err = "option " + a + " requires a value";
                        return false;
                    }
                    const std::string v = argv[++i];
                    if (a == "-c") {
                        out.config_path = v;
                        out.config_explicit = true;
                    } else if (a == "-s") {
                        out.socket_path = v;
                    } else if (!parse_int(v, out.read_timeout_ms)) {
                        err = "invalid timeout '" + v + "'";
                        return false;
                    }
                } else {
                    err = "unknown option '" + a + "'";
                    return false;
                }
            }

            if (i >= argc) {
                err = "no command given";
                return false;
            }

            const std::string cmd = argv[i++];
            if (cmd == "ping") {
                out.req.cmd = Subcommand::Ping;
            } else if (cmd == "show") {
                out.req.cmd = Subcommand::Show;
                for (; i < argc; ++i) {
                    const std::string a = argv[i];
                    if (a == "--saved") out.req.show_kind = ipc::StateKind::Saved;
                    else if (a == "--post-last-commit") out.req.show_kind = ipc::StateKind::PostLastCommit;
                    else if (a == "--running") out.req.show_kind = ipc::StateKind::Running;
                    else {
                        err = "unexpected argument '" + a + "' for show";
                        return false;
                    }
                }
            } else if (cmd == "apply") {
                out.req.cmd = Subcommand::Apply;
                for (; i < argc; ++i) {
                    const std::string a = argv[i];
                    if (a == "--no-verify") {
                        out.req.verify_change = false;
                    } else if (out.req.apply_source.empty() && (a == "-" || a[0] != '-')) {
                        out.req.apply_source = a;
                    } else {
                        err = "unexpected argument '" + a + "' for apply";
                        return false;
                    }
                }
                if (out.req.apply_source.empty()) {
                    err = "apply requires a state file or '-'";
                    return false;
                }
            } else {
                err = "unknown command '" + cmd + "'";
                return false;
            }

            if (out.req.cmd == Subcommand::Ping && i < argc) {
                err = "unexpected argument '" + std::string(argv[i]) + "' for ping";
                return false;
            }
            return true;
        }

        int exit_code_for(const ipc::IpcError& e) {
            using ipc::IpcErrorCategory;
            switch (e.category) {
            case IpcErrorCategory::None:
                return kExitOk;
            case IpcErrorCategory::FrameIo:
            case IpcErrorCategory::MalformedEnvelope:
                return kExitTransport;
            case IpcErrorCategory::Protocol:
            case IpcErrorCategory::Validation:
                return kExitDaemon;
            case IpcErrorCategory::UnknownLogLevel:
            case IpcErrorCategory::UnexpectedKind:
                return kExitInternal;
            }
            return kExitInternal;
        }

        CtlApp::CtlApp(std::string socket_path, ipc::ConnectionOptions opt)
            : socket_path_(std::move(socket_path)), client_(std::move(opt)) {
        }

        int CtlApp::run(const CtlRequest& req, std::istream& in, std::ostream& out, std::ostream& err) {
            if (req.cmd == Subcommand::None) {
                err << "no command given\n";
                return kExitUsage;
            }

            // apply는 입력을 먼저 읽은 뒤 연결한다
            if (req.cmd == Subcommand::Apply) return do_apply(req, in, out, err);

            ipc::IpcResult r = ensure_connected();
            if (!r.ok) return report(r.error, err);

            switch (req.cmd) {
            case Subcommand::Ping:
                return do_ping(out, err);
            case Subcommand::Show:
                return do_show(req, out, err);
            default:
                break;
            }
            return kExitUsage;
        }

        ipc::IpcResult CtlApp::ensure_connected() {
            // 이미 adopt()된 연결이 있으면 그대로 사용
            if (client_.connection().is_open()) return ipc::IpcResult::success(nullptr);
            return client_.connect(socket_path_);
        }

        int CtlApp::do_ping(std::ostream& out, std::ostream& err) {
            ipc::IpcResult r = client_.ping();
            if (!r.ok) return report(r.error, err);
            out << (r.data.is_string() ? r.data.get<std::string>() : r.data.dump()) << "\n";
            return kExitOk;
        }

        int CtlApp::do_show(const CtlRequest& req, std::ostream& out, std::ostream& err) {
            ipc::QueryOptions opt;
            opt.kind = req.show_kind;
            NIPC_LOG_DBG("CTL", "query %s", ipc::state_kind_name(opt.kind));

            ipc::IpcResult r = client_.query_network_state(opt);
            if (!r.ok) return report(r.error, err);
            out << r.data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            return kExitOk;
        }

        int CtlApp::do_apply(const CtlRequest& req, std::istream& in, std::ostream& out, std::ostream& err) {
            nlohmann::json desired;
            try {
                if (req.apply_source == "-") {
                    in >> desired;
                } else {
                    std::ifstream file(req.apply_source);
                    if (!file.is_open()) {
                        err << "failed to open " << req.apply_source << "\n";
                        return kExitUsage;
                    }
                    file >> desired;
                }
            } catch (const nlohmann::json::exception& e) {
                err << "invalid desired state in " << req.apply_source << ": " << e.what() << "\n";
                return kExitUsage;
            }

            ipc::IpcResult r = ensure_connected();
            if (!r.ok) return report(r.error, err);

            NIPC_LOG_INF("CTL", "applying desired state from %s verify=%d", req.apply_source.c_str(),
                         req.verify_change ? 1 : 0);
            r = client_.apply_network_state(desired, ipc::ApplyOptions::with_verify(req.verify_change));
            if (!r.ok) return report(r.error, err);
            if (!r.data.is_null()) {
                out << r.data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            }
            return kExitOk;
        }

        int CtlApp::report(const ipc::IpcError& e, std::ostream& err) const {
            if (e.is_daemon_error()) {
                err << (e.is_validation_error() ? "invalid argument: " : "daemon error: ") << e.kind << ": "
                    << e.msg << "\n";
            } else {
                err << "error: " << e.to_string() << "\n";
            }
            return exit_code_for(e);
        }

    } // namespace ctl
} // namespace nipc
