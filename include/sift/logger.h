#pragma once

#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>
#include <tuple>
#include <utility>

namespace sift {

class Logger {
public:
    enum class Level {
        Error = 0,
        Warning,
        Info,
        Debug,
        Trace
    };

    static Logger& instance();

    void set_level(Level level) noexcept;
    Level level() const noexcept;

    [[nodiscard]] bool enabled(Level level) const noexcept { return level <= level_.load(std::memory_order_relaxed); }

    template <typename... Args>
    void log(Level level, std::string_view fmt, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt);
        } else {
            auto tuple_args = std::make_tuple(std::forward<Args>(args)...);
            auto formatted = std::apply(
                [&](auto&... unpacked) {
                    return std::vformat(fmt, std::make_format_args(unpacked...));
                },
                tuple_args);
            write(level, formatted);
        }
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(Level::Warning, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    void set_output(std::ostream* stream) noexcept;

    // Accepts error, warn, warning, info, debug, trace (any case).
    static std::optional<Level> ParseLevel(std::string_view text);

private:
    Logger();
    void write(Level level, std::string_view message);

    std::ostream* stream_;
    std::atomic<Level> level_;
    std::mutex mutex_;
};

} // namespace sift
