#include "swiftdrop/cli_colors.hpp"

#include "swiftdrop/env.hpp"

#include <algorithm>
#include <mutex>
#include <optional>

#include <unistd.h>

namespace swiftdrop::cli {

namespace {

std::optional<bool> g_forced;

bool IsTerminal(std::ostream& os) {
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

}  // namespace

bool ColorsEnabled(std::ostream& os) {
    if (g_forced.has_value()) {
        return *g_forced;
    }
    if (!env::Get("NO_COLOR").empty()) {
        return false;
    }
    return IsTerminal(os);
}

void SetColorsEnabled(bool enabled) {
    g_forced = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

void DrawProgress(const std::string& label, int percent) {
    static std::mutex draw_mutex;
    constexpr int kWidth = 30;
    int clamped = std::clamp(percent, 0, 100);
    int filled = clamped * kWidth / 100;
    std::string bar(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(kWidth - filled), '.');

    std::lock_guard<std::mutex> lock(draw_mutex);
    std::cerr << "\r" << label << " [" << Colorize(bar, color::CYAN, std::cerr) << "] " << clamped << "%";
    if (clamped == 100) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

}  // namespace swiftdrop::cli
