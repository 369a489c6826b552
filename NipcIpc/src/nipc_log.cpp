/**
 * @file nipc_log.cpp
 * ### 파일 설명(한글)
 * nipc_log 구현. 큐 + 전용 writer 스레드로 파일/콘솔에 기록하고
 * 파일 크기 초과 시 nipc.log -> nipc.log.1 -> ... 순으로 로테이션한다.
 */
#include "nipc_log.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace nipc {

    static std::atomic<Lvl> g_level{Lvl::Info};

    void set_level(Lvl l) {
        g_level.store(l);
    }

    Lvl level() {
        return g_level.load();
    }

    bool parse_level(const std::string& s, Lvl& out) {
        if (s == "trace") out = Lvl::Trace;
        else if (s == "debug") out = Lvl::Debug;
        else if (s == "info") out = Lvl::Info;
        else if (s == "warn") out = Lvl::Warn;
        else if (s == "error") out = Lvl::Error;
        else return false;
        return true;
    }

    const char* level_name(Lvl l) {
        switch (l) {
            case Lvl::Trace: return "TRC";
            case Lvl::Debug: return "DBG";
            case Lvl::Info:  return "INF";
            case Lvl::Warn:  return "WRN";
            case Lvl::Error: return "ERR";
        }
        return "INF";
    }

    static const char* level_color(Lvl l) {
        switch (l) {
            case Lvl::Trace: return "\033[36m";  // 청록색
            case Lvl::Debug: return "\033[90m";  // 회색
            case Lvl::Info:  return "\033[0m";
            case Lvl::Warn:  return "\033[33m";  // 노란색
            case Lvl::Error: return "\033[31m";  // 빨간색
        }
        return "\033[0m";
    }

    namespace {

    struct Record {
        Lvl level;
        std::string timestamp;
        std::string thread_id;
        std::string tag;
        std::string origin;  // "file:line" 또는 빈 문자열
        std::string message;
    };

    std::string now_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t tt = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&tt, &tm);
        char ts[32];
        std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
        return ts;
    }

    std::string current_thread_id() {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        return oss.str();
    }

    std::string render(const Record& r, bool color) {
        std::ostringstream oss;
        if (color) oss << level_color(r.level);
        oss << "[" << r.timestamp << "] [" << level_name(r.level) << "] [tid:" << r.thread_id << "] ["
            << r.tag << "] ";
        if (!r.origin.empty()) oss << "[" << r.origin << "] ";
        oss << r.message;
        if (color) oss << "\033[0m";
        oss << "\n";
        return oss.str();
    }

    class LogWriter {
    public:
        static LogWriter& instance() {
            static LogWriter inst;
            return inst;
        }

        void start(const LoggerOptions& opt) {
            std::lock_guard<std::mutex> lock(mtx_);
            if (running_) return;
            opt_ = opt;
            max_bytes_ = static_cast<uintmax_t>(opt.max_file_size_mb) * 1024 * 1024;

            if (opt_.file_output) {
                std::error_code ec;
                fs::create_directories(opt_.log_dir, ec);
                if (ec) {
                    std::cerr << "nipc: failed to create log directory " << opt_.log_dir << ": "
                              << ec.message() << std::endl;
                }
            }
            running_ = true;
            worker_ = std::thread([this] { drain(); });
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (!running_) return;
                running_ = false;
            }
            cv_.notify_one();
            if (worker_.joinable()) worker_.join();
        }

        // 실행 중이 아니면 false -> 호출자가 stderr fallback 처리
        bool push(Record&& r) {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (!running_) return false;
                queue_.push(std::move(r));
            }
            cv_.notify_one();
            return true;
        }

        ~LogWriter() { stop(); }

    private:
        LogWriter() = default;

        void drain() {
            std::unique_lock<std::mutex> lock(mtx_);
            while (true) {
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
                while (!queue_.empty()) {
                    Record r = std::move(queue_.front());
                    queue_.pop();
                    lock.unlock();  // 파일 쓰기 중에는 락 해제
                    write(r);
                    lock.lock();
                }
                if (!running_) break;
            }
        }

        void write(const Record& r) {
            if (opt_.console_output) {
                std::cerr << render(r, opt_.console_color) << std::flush;
            }
            if (!opt_.file_output) return;

            try {
                fs::path path = fs::path(opt_.log_dir) / opt_.file_name;
                if (max_bytes_ > 0 && fs::exists(path) && fs::file_size(path) >= max_bytes_) {
                    rotate(path);
                }
                std::ofstream ofs(path, std::ios::app);
                if (ofs.is_open()) ofs << render(r, false);
            } catch (const fs::filesystem_error& e) {
                if (opt_.console_output) std::cerr << "nipc: log write error: " << e.what() << std::endl;
            }
        }

        void rotate(const fs::path& path) {
            const std::string base = path.string();
            if (opt_.max_backup_files <= 0) {
                fs::remove(path);
                return;
            }
            fs::remove(base + "." + std::to_string(opt_.max_backup_files));
            for (int i = opt_.max_backup_files - 1; i >= 1; --i) {
                fs::path src = base + "." + std::to_string(i);
                if (fs::exists(src)) fs::rename(src, base + "." + std::to_string(i + 1));
            }
            fs::rename(path, base + ".1");
        }

        LoggerOptions opt_;
        uintmax_t max_bytes_{0};
        std::queue<Record> queue_;
        std::mutex mtx_;
        std::condition_variable cv_;
        std::thread worker_;
        bool running_{false};
    };

    void emit(Record&& r) {
        if (LogWriter::instance().push(std::move(r))) return;
        // 로거 미초기화: stderr로 바로 출력
        std::fputs(render(r, false).c_str(), stderr);
    }

    } // namespace

    void init_logger(const LoggerOptions& opt) {
        LogWriter::instance().start(opt);
    }

    void shutdown_logger() {
        LogWriter::instance().stop();
    }

    void logf(Lvl lvl, const char* tag, const char* file, int line, const char* fmt, ...) {
        if (lvl < g_level.load()) return;

        va_list ap;
        va_start(ap, fmt);
        std::vector<char> buf(16 * 1024);
        std::vsnprintf(buf.data(), buf.size(), fmt, ap);
        va_end(ap);

        Record r;
        r.level = lvl;
        r.timestamp = now_timestamp();
        r.thread_id = current_thread_id();
        r.tag = tag ? tag : "-";
        r.origin = fs::path(file ? file : "-").filename().string() + ":" + std::to_string(line);
        r.message = buf.data();
        emit(std::move(r));
    }

    void log_line(Lvl lvl, const std::string& tag, const std::string& message) {
        if (lvl < g_level.load()) return;

        Record r;
        r.level = lvl;
        r.timestamp = now_timestamp();
        r.thread_id = current_thread_id();
        r.tag = tag.empty() ? "-" : tag;
        r.message = message;
        emit(std::move(r));
    }

} // namespace nipc
