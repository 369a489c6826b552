/**
 * @file main.cpp
 * ### 파일 설명(한글)
 * nipc 엔트리 포인트. 설정 로드, 콘솔 인자 반영, 로거 초기화 후 CtlApp을 실행.
 */

#include <filesystem>
#include <iostream>

#include "app_config.hpp"
#include "ctl_app.hpp"
#include "nipc_log.hpp"

int main(int argc, char** argv)
{
    using namespace nipc;

    // 1. Parse command line
    ctl::CliArgs args;
    std::string perr;
    if (!ctl::parse_command_line(argc, argv, args, perr)) {
        std::cerr << "nipc: " << perr << "\n" << ctl::usage_text();
        return ctl::kExitUsage;
    }

    // 2. Load Configuration
    auto& config = AppConfig::instance();
    std::error_code ec;
    if (args.config_explicit || std::filesystem::exists(args.config_path, ec)) {
        if (!config.load(args.config_path)) return ctl::kExitUsage;
    }

    // 3. CLI Override
    if (!args.socket_path.empty()) config.client().socket_path = args.socket_path;
    if (args.read_timeout_ms >= 0) config.client().read_timeout_ms = args.read_timeout_ms;

    // 4. Initialize Logger
    // 출력이 모두 꺼져 있어도 writer를 띄워야 stderr fallback으로 새지 않는다
    const auto& log_cfg = config.logging();
    init_logger(config.logger_options());

    // 5. Set Log Level
    Lvl lvl = Lvl::Info;
    parse_level(log_cfg.level, lvl);
    int adjusted = static_cast<int>(lvl) - args.verbosity;
    if (adjusted < static_cast<int>(Lvl::Trace)) adjusted = static_cast<int>(Lvl::Trace);
    if (adjusted > static_cast<int>(Lvl::Error)) adjusted = static_cast<int>(Lvl::Error);
    set_level(static_cast<Lvl>(adjusted));

    NIPC_LOG_DBG("Main", "socket=%s timeout_ms=%d strict=%d", config.client().socket_path.c_str(),
                 config.client().read_timeout_ms, config.client().strict_kinds ? 1 : 0);

    // 6. Run
    ctl::CtlApp app(config.client().socket_path, config.connection_options());
    int rc = app.run(args.req, std::cin, std::cout, std::cerr);

    shutdown_logger();
    return rc;
}
