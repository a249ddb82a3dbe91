#ifndef STRATA_UTILS_TERMINAL_HPP
#define STRATA_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Strata::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";

        inline constexpr std::string_view kAzure        = "\033[38;5;33m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
        inline constexpr std::string_view kCrimson      = "\033[38;5;196m";
    }

    [[nodiscard]] inline std::string paint(std::string_view text, std::string_view colour, bool enabled)
    {
        if (!enabled) {
            return std::string(text);
        }
        std::string painted;
        painted.reserve(text.size() + colour.size() + Colors::kReset.size());
        painted.append(colour);
        painted.append(text);
        painted.append(Colors::kReset);
        return painted;
    }
}

#endif // STRATA_UTILS_TERMINAL_HPP
