#include "nipc_daemon_log.hpp"
#include "nipc_log.hpp"

namespace nipc {
    namespace ipc {

        const char* daemon_log_level_name(DaemonLogLevel l) {
            switch (l) {
                case DaemonLogLevel::Trace: return "trace";
                case DaemonLogLevel::Debug: return "debug";
                case DaemonLogLevel::Info:  return "info";
                case DaemonLogLevel::Warn:  return "warn";
                case DaemonLogLevel::Error: return "error";
            }
            return "info";
        }

        bool parse_daemon_log_level(const std::string& s, DaemonLogLevel& out) {
            if (s == "trace") out = DaemonLogLevel::Trace;
            else if (s == "debug") out = DaemonLogLevel::Debug;
            else if (s == "info") out = DaemonLogLevel::Info;
            else if (s == "warn") out = DaemonLogLevel::Warn;
            else if (s == "error") out = DaemonLogLevel::Error;
            else return false;
            return true;
        }

        static bool string_field(const nlohmann::json& data, const char* key, std::string& out) {
            auto it = data.find(key);
            if (it == data.end() || !it->is_string()) return false;
            out = it->get<std::string>();
            return true;
        }

        bool log_entry_from_envelope(const nlohmann::json& data, LogEntry& out, IpcError& err) {
            std::string level;
            if (!data.is_object() || !string_field(data, "source", out.source) ||
                !string_field(data, "level", level) || !string_field(data, "message", out.message)) {
                err = IpcError(IpcErrorCategory::MalformedEnvelope, "log-data",
                               "log envelope data needs string source/level/message: " + data.dump());
                return false;
            }
            if (!parse_daemon_log_level(level, out.level)) {
                err = IpcError(IpcErrorCategory::UnknownLogLevel, "bug",
                               "unknown log level '" + level + "' from " + out.source);
                return false;
            }
            return true;
        }

        void forward_to_logger(const LogEntry& entry) {
            Lvl lvl = Lvl::Info;
            switch (entry.level) {
                case DaemonLogLevel::Trace: lvl = Lvl::Trace; break;
                case DaemonLogLevel::Debug: lvl = Lvl::Debug; break;
                case DaemonLogLevel::Info:  lvl = Lvl::Info; break;
                case DaemonLogLevel::Warn:  lvl = Lvl::Warn; break;
                case DaemonLogLevel::Error: lvl = Lvl::Error; break;
            }
            log_line(lvl, entry.source, entry.message);
        }

    } // namespace ipc
} // namespace nipc
