#pragma once

#include <cstdint>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>
#include <fmt/format.h>

namespace rv::shell {

inline int term_width() {
    winsize w{};
    if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) return w.ws_col;
    return 0;
}

inline std::string human_bytes(uint64_t b) {
    static const char* kUnits[] = {"B","KiB","MiB","GiB","TiB","PiB"};
    int u = 0;
    auto v = static_cast<double>(b);
    while (v >= 1024.0 && u < 5) { v /= 1024.0; ++u; }
    // show 0 decimals for B/KiB, 1 for others
    if (u <= 1) return fmt::format("{} {}", static_cast<uint64_t>(u==0 ? b : static_cast<uint64_t>(v)), kUnits[u]);
    return fmt::format("{:.1f} {}", v, kUnits[u]);
}

inline std::string ellipsize_middle(std::string s, size_t maxw) {
    if (s.size() <= maxw || maxw < 5) return s;
    const size_t keep = (maxw - 3) / 2;
    const size_t tail = maxw - 3 - keep;
    return s.substr(0, keep) + "..." + s.substr(s.size() - tail);
}

}
