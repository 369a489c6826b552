/**
 * @file nipc_daemon_log.hpp
 * @brief 응답 앞에 끼어드는 "log" 프레임 표현과 sink
 *
 * LogEntry는 프레임마다 만들어져 sink로 전달된 뒤 버려진다(보관하지 않음).
 */
#pragma once
#include "nipc_error.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace nipc {
    namespace ipc {

        enum class DaemonLogLevel { Trace, Debug, Info, Warn, Error };

        const char* daemon_log_level_name(DaemonLogLevel l);
        bool parse_daemon_log_level(const std::string& s, DaemonLogLevel& out);

        struct LogEntry {
            std::string source;
            DaemonLogLevel level{DaemonLogLevel::Info};
            std::string message;
        };

        using LogSink = std::function<void(const LogEntry&)>;

        /**
         * @brief "log" envelope의 data({"source","level","message"})를 LogEntry로 변환
         * @return 실패 시 false와 err. 필드 누락은 MalformedEnvelope,
         *         모르는 level은 UnknownLogLevel.
         */
        bool log_entry_from_envelope(const nlohmann::json& data, LogEntry& out, IpcError& err);

        /// nipc 로거로 전달(tag = source). Connection의 기본 sink.
        void forward_to_logger(const LogEntry& entry);

    } // namespace ipc
} // namespace nipc
