// logger.cpp
#include "logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <syncstream>

namespace btsalvage::logger {

    const char* levelName(LogLevel l) {
        switch (l) {
            case LogLevel::trace: return "TRACE";
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info:  return "INFO";
            case LogLevel::warn:  return "WARN";
            case LogLevel::error: return "ERROR";
            default:              return "NONE";
        }
    }

    static std::string ts_iso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    // Everything after the timestamp; shared by both sinks.
    std::string formatRecord(const LogRecord& rec) {
        std::ostringstream out;
        out << "[" << levelName(rec.level) << "] "
            << (rec.logger.empty() ? "btsalvage" : rec.logger) << ": "
            << rec.msg;

        if (!rec.torrent.empty())  out << " torrent="  << rec.torrent;
        if (!rec.file.empty())     out << " file="     << rec.file;
        if (rec.piece >= 0)        out << " piece="    << rec.piece;
        if (!rec.expected.empty()) out << " expected=" << rec.expected;
        if (!rec.actual.empty())   out << " actual="   << rec.actual;
        if (!rec.error.empty())    out << " error=\""  << rec.error << '"';
        return out.str();
    }

    // -------- StderrSink: atomic per-line emission --------
    void StderrSink::write(const LogRecord& rec) {
        std::osyncstream out(std::cerr);
        out << ts_iso8601(rec.ts) << ' ' << formatRecord(rec) << '\n';
    }

    // -------- FileSink: mutex-serialized appends --------
    FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

    void FileSink::write(const LogRecord& rec) {
        std::scoped_lock lk(mu_);
        if (!out_) return;
        out_ << ts_iso8601(rec.ts) << ' ' << formatRecord(rec) << '\n';
        out_.flush();
    }

} // namespace btsalvage::logger
