#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "nipc_ipc_types.hpp"
#include "nipc_log.hpp"

class AppConfig {
public:
    struct ClientConfig {
        std::string socket_path = nipc::ipc::kDefaultSocketPath;
        int read_timeout_ms = 0; // 0 = wait forever
        uint32_t max_frame_bytes = nipc::ipc::kDefaultMaxFrameBytes; // 1 .. 0xFFFFFFFF
        bool strict_kinds = false;
    };

    struct LogConfig {
        std::string level = "info"; // trace, debug, info, warn, error
        bool console_output = true;
        bool file_output = false;
        std::string log_dir = "logs";
        std::string file_name = "nipc.log";
        int max_file_size_mb = 10;
        int max_backup_files = 5;
    };

    static AppConfig& instance();

    // Load configuration from a JSON file.
    // Returns true if successful, false otherwise. Values missing from the
    // file keep their current value.
    bool load(const std::string& path);

    // Restore built-in defaults.
    void reset();

    const ClientConfig& client() const { return client_; }
    const LogConfig& logging() const { return logging_; }

    ClientConfig& client() { return client_; }
    LogConfig& logging() { return logging_; }

    nipc::ipc::ConnectionOptions connection_options() const;
    nipc::LoggerOptions logger_options() const;

private:
    AppConfig() = default;
    ~AppConfig() = default;
    AppConfig(const AppConfig&) = delete;
    AppConfig& operator=(const AppConfig&) = delete;

    ClientConfig client_;
    LogConfig logging_;

    mutable std::mutex config_mutex_;
};
