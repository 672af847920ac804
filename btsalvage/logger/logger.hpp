#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace btsalvage::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    const char* levelName(LogLevel l);

    struct LogRecord
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "verify", "checker", "output"
        std::string msg;

        // Optional structured fields:
        std::string torrent;       // .torrent path being processed
        std::string file;          // content-relative file path
        std::int64_t piece{-1};
        std::string expected;      // hex digest
        std::string actual;        // hex digest
        std::string error;         // OS / parser error text
    };

    class ILoggerSink
    {
    public:
        virtual ~ILoggerSink() = default;
        virtual void write(const LogRecord& rec) = 0;
    };

    // Diagnostics only; stdout is reserved for results.
    class StderrSink : public ILoggerSink
    {
    public:
        void write(const LogRecord& rec) override;
    };

    class FileSink : public ILoggerSink
    {
    public:
        explicit FileSink(const std::string& path);
        bool good() const { return out_.good(); }
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    std::string formatRecord(const LogRecord& rec);

    class Logger
    {
    public:
        explicit Logger(std::shared_ptr<ILoggerSink> sink = std::make_shared<StderrSink>())
        : sink_(std::move(sink)) {}

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }

        bool enabled(LogLevel lvl) const {
            return static_cast<unsigned>(lvl) >= static_cast<unsigned>(level());
        }

        void log(LogRecord rec) {
            if (!enabled(rec.level)) return;
            rec.ts = std::chrono::system_clock::now();
            sink_->write(rec);
        }

        void trace(std::string msg, std::string logger = {}) { emit(LogLevel::trace, std::move(msg), std::move(logger)); }
        void debug(std::string msg, std::string logger = {}) { emit(LogLevel::debug, std::move(msg), std::move(logger)); }
        void info (std::string msg, std::string logger = {}) { emit(LogLevel::info , std::move(msg), std::move(logger)); }
        void warn (std::string msg, std::string logger = {}) { emit(LogLevel::warn , std::move(msg), std::move(logger)); }
        void error(std::string msg, std::string logger = {}) { emit(LogLevel::error, std::move(msg), std::move(logger)); }

    private:
        void emit(LogLevel lvl, std::string msg, std::string logger) {
            LogRecord rec;
            rec.level = lvl;
            rec.msg   = std::move(msg);
            rec.logger= std::move(logger);
            log(std::move(rec));
        }

        std::shared_ptr<ILoggerSink> sink_;
        std::atomic<LogLevel> level_{LogLevel::warn};
    };

    // Compile-time floor; BTS_LOG statements below it vanish entirely.
    #ifndef BTS_LOG_LEVEL
    #define BTS_LOG_LEVEL btsalvage::logger::LogLevel::debug
    #endif

    #define BTS_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(BTS_LOG_LEVEL))

    // Usage: BTS_LOG(loggerPtr, LogLevel::debug, "verify") << "piece " << p;
    #define BTS_LOG(LOGGER_PTR, LVL, NAME) \
        if (!(LOGGER_PTR) || !BTS_LOG_ENABLED(LVL) || !(LOGGER_PTR)->enabled(LVL)) ; \
        else ::btsalvage::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), (NAME)).stream()

    namespace detail {
        class LogStreamHelper
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, const char* name)
            : lg_(lg) { rec_.level = lvl; rec_.logger = name; }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
        private:
            Logger& lg_;
            LogRecord rec_;
            std::ostringstream ss_;
        };
    }

} // namespace btsalvage::logger
