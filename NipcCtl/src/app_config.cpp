#include "app_config.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

AppConfig& AppConfig::instance() {
    static AppConfig inst;
    return inst;
}

void AppConfig::reset() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    client_ = ClientConfig{};
    logging_ = LogConfig{};
}

bool AppConfig::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << path << std::endl;
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        // Client
        if (j.contains("client")) {
            auto& cli = j["client"];
            client_.socket_path = cli.value("socket_path", client_.socket_path);
            client_.read_timeout_ms = cli.value("read_timeout_ms", client_.read_timeout_ms);
            const int64_t max_frame = cli.value("max_frame_bytes", static_cast<int64_t>(client_.max_frame_bytes));
            if (max_frame < 1 || max_frame > static_cast<int64_t>(nipc::ipc::kWireMaxFrameBytes)) {
                std::cerr << "client.max_frame_bytes must be in 1.." << nipc::ipc::kWireMaxFrameBytes << " in "
                          << path << std::endl;
                return false;
            }
            client_.max_frame_bytes = static_cast<uint32_t>(max_frame);
            client_.strict_kinds = cli.value("strict_kinds", client_.strict_kinds);
        }

        // Logging
        if (j.contains("logging")) {
            auto& log = j["logging"];
            logging_.level = log.value("level", logging_.level);
            logging_.console_output = log.value("console_output", logging_.console_output);
            logging_.file_output = log.value("file_output", logging_.file_output);
            logging_.log_dir = log.value("log_dir", logging_.log_dir);
            logging_.file_name = log.value("file_name", logging_.file_name);
            logging_.max_file_size_mb = log.value("max_file_size_mb", logging_.max_file_size_mb);
            logging_.max_backup_files = log.value("max_backup_files", logging_.max_backup_files);
        }

        nipc::Lvl lvl;
        if (!nipc::parse_level(logging_.level, lvl)) {
            std::cerr << "Unknown logging.level '" << logging_.level << "' in " << path << std::endl;
            return false;
        }
        if (client_.read_timeout_ms < 0) {
            std::cerr << "client.read_timeout_ms must not be negative in " << path << std::endl;
            return false;
        }

        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error parsing config file: " << e.what() << std::endl;
        return false;
    }
}

nipc::ipc::ConnectionOptions AppConfig::connection_options() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    nipc::ipc::ConnectionOptions opt;
    opt.limits.read_timeout_ms = client_.read_timeout_ms;
    opt.limits.max_frame_bytes = client_.max_frame_bytes;
    opt.strict_kinds = client_.strict_kinds;
    return opt;
}

nipc::LoggerOptions AppConfig::logger_options() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    nipc::LoggerOptions opt;
    opt.log_dir = logging_.log_dir;
    opt.file_name = logging_.file_name;
    opt.max_file_size_mb = logging_.max_file_size_mb;
    opt.max_backup_files = logging_.max_backup_files;
    opt.file_output = logging_.file_output;
    opt.console_output = logging_.console_output;
    return opt;
}
