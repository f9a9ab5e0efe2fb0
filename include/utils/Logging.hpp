#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace pushfeed {
    enum class LogLevel : std::uint8_t { DEBUG, INFO, WARN, ERROR };

    inline const char *to_string(LogLevel l) {
        switch (l) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            default: return "?";
        }
    }

    using LogFn = std::function<void(LogLevel, std::string_view)>;

    /// Default sink: "[LEVEL] message" on stderr, lines below `min` are dropped.
    inline LogFn stderrLogger(LogLevel min = LogLevel::INFO) {
        return [min](LogLevel level, std::string_view msg) {
            if (level < min) return;
            static std::mutex mtx;
            std::lock_guard lock(mtx);
            std::cerr << "[" << to_string(level) << "] " << msg << "\n";
        };
    }

    namespace debug {
        inline std::atomic<bool> raw{false}; // echo raw inbound frames at DEBUG
        inline std::atomic<int> raw_max{512}; // truncate raw output

        inline std::string raw_excerpt(std::string_view msg) {
            const int maxc = raw_max.load(std::memory_order_relaxed);
            if (maxc > 0 && static_cast<int>(msg.size()) > maxc) msg = msg.substr(0, static_cast<std::size_t>(maxc));
            return std::string(msg);
        }
    }
} // namespace pushfeed
