/**
 * @file nipc_log.hpp
 * ### 파일 설명(한글)
 * nipc 공용 로거. printf 스타일 매크로와 비동기 파일/콘솔 출력.
 * * init_logger() 이전에는 stderr로 직접 출력한다(fallback).
 */
#pragma once
#include <cstdarg>
#include <string>

namespace nipc {

    // 레벨 순서(숫자가 작을수록 더 상세한 로그)
    enum class Lvl { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4 };

    struct LoggerOptions {
        std::string log_dir = "logs";
        std::string file_name = "nipc.log";
        int max_file_size_mb = 10;
        int max_backup_files = 5;
        bool file_output = false;
        bool console_output = true;
        bool console_color = true;
    };

    // 로거 초기화 (앱 시작 시 호출)
    void init_logger(const LoggerOptions& opt);

    // 로거 종료: 큐에 남은 로그를 모두 기록한 뒤 반환
    void shutdown_logger();

    void set_level(Lvl l);
    Lvl level();

    // "trace", "debug", "info", "warn", "error" -> Lvl. 모르는 값이면 false.
    bool parse_level(const std::string& s, Lvl& out);
    const char* level_name(Lvl l);

    void logf(Lvl lvl, const char* tag, const char* file, int line, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 5, 6)))
#endif
        ;

    // 이미 포맷된 메시지를 그대로 기록 (데몬에서 전달된 로그 등)
    void log_line(Lvl lvl, const std::string& tag, const std::string& message);

} // namespace nipc

#define NIPC_LOG_TRC(tag, fmt, ...)                                            \
    ::nipc::logf(::nipc::Lvl::Trace, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define NIPC_LOG_DBG(tag, fmt, ...)                                            \
    ::nipc::logf(::nipc::Lvl::Debug, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define NIPC_LOG_INF(tag, fmt, ...)                                            \
    ::nipc::logf(::nipc::Lvl::Info, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define NIPC_LOG_WRN(tag, fmt, ...)                                            \
    ::nipc::logf(::nipc::Lvl::Warn, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define NIPC_LOG_ERR(tag, fmt, ...)                                            \
    ::nipc::logf(::nipc::Lvl::Error, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

// 소켓을 오가는 원문 envelope 추적용
#define NIPC_LOG_FLOW(fmt, ...)                                                \
    ::nipc::logf(::nipc::Lvl::Trace, "FLOW", __FILE__, __LINE__, fmt, ##__VA_ARGS__)
