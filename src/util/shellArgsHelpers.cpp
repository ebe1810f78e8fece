#include "util/shellArgsHelpers.hpp"

#include <algorithm>
#include <limits>

using namespace rv::shell;

CommandResult rv::shell::invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult rv::shell::failed(std::string msg) { return {1, "", std::move(msg)}; }
CommandResult rv::shell::ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult rv::shell::usage(std::string text) { return {0, std::move(text), ""}; }

std::optional<std::string> rv::shell::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool rv::shell::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool rv::shell::hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::optional<int> rv::shell::parseInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    size_t i = 0;
    bool negative = false;
    if (sv[0] == '-') {
        if (sv.size() == 1) return std::nullopt;
        negative = true;
        i = 1;
    }

    long long v = 0;
    for (; i < sv.size(); ++i) {
        const char c = sv[i];
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + (c - '0');
        if (v > std::numeric_limits<int>::max()) return std::nullopt; // overflow
    }

    return static_cast<int>(negative ? -v : v);
}
