#pragma once

#include <fmt/format.h>

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace nicefind {

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

    template <typename... Args>
    void log(Level level, std::string_view fmt, Args&&... args) {
        if (level > this->level()) {
            return;
        }
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt);
        } else {
            write(level, fmt::vformat(fmt, fmt::make_format_args(args...)));
        }
    }

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args) {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
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

private:
    Logger();
    void write(Level level, std::string_view message);

    std::ostream* stream_;
    Level level_;
    mutable std::mutex mutex_;
};

} // namespace nicefind
