#pragma once

#include <string>
#include <string_view>

namespace toolhost {
namespace ansi {

// SGR sequences used by the log sinks and the CLI output.
inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kGray = "\033[90m";
inline constexpr std::string_view kCyan = "\033[36m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kBoldRed = "\033[1;31m";

/// `text` wrapped in `style` and a reset, or unchanged when `enabled` is false.
inline std::string Paint(std::string_view text, std::string_view style, bool enabled) {
    std::string out;
    if (!enabled) {
        out.assign(text);
        return out;
    }
    out.reserve(style.size() + text.size() + kReset.size());
    out.append(style).append(text).append(kReset);
    return out;
}

} // namespace ansi
} // namespace toolhost
