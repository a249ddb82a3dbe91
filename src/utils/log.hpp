#ifndef STRATA_UTILS_LOG_HPP
#define STRATA_UTILS_LOG_HPP

#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include "terminal.hpp"

namespace Strata::Utils::Log {
    enum class Level {
        Debug,
        Info,
        Warning,
        Error,
        Silent,
    };

    struct Config {
        Level level{Level::Warning};
        std::ostream* stream{&std::clog};
        bool colour{false};
    };

    [[nodiscard]] inline Config& config() noexcept
    {
        static Config instance{};
        return instance;
    }

    inline void configure(Config value) noexcept { config() = value; }

    [[nodiscard]] inline bool enabled(Level level) noexcept
    {
        const auto& current = config();
        return current.stream != nullptr && level != Level::Silent && level >= current.level;
    }

    namespace Details {
        [[nodiscard]] inline std::string_view tag(Level level) noexcept
        {
            switch (level) {
                case Level::Debug: return "debug";
                case Level::Info: return "info";
                case Level::Warning: return "warning";
                case Level::Error: return "error";
                default: return "";
            }
        }

        [[nodiscard]] inline std::string_view colour(Level level) noexcept
        {
            switch (level) {
                case Level::Debug: return Terminal::Colors::kBrightBlack;
                case Level::Info: return Terminal::Colors::kAzure;
                case Level::Warning: return Terminal::Colors::kOrange;
                case Level::Error: return Terminal::Colors::kCrimson;
                default: return Terminal::Colors::kReset;
            }
        }
    }

    inline void write(Level level, std::string_view message)
    {
        if (!enabled(level)) {
            return;
        }
        const auto& current = config();
        std::string header{"[Strata] "};
        header.append(Details::tag(level));
        header.append(": ");
        *current.stream << Terminal::paint(header, Details::colour(level), current.colour) << message << '\n';
    }

    inline void debug(std::string_view message) { write(Level::Debug, message); }
    inline void info(std::string_view message) { write(Level::Info, message); }
    inline void warning(std::string_view message) { write(Level::Warning, message); }
    inline void error(std::string_view message) { write(Level::Error, message); }
}

#endif // STRATA_UTILS_LOG_HPP
