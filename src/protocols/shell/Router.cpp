#include "protocols/shell/Router.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/Parser.hpp"
#include "logging/LogRegistry.hpp"
#include "util/shellArgsHelpers.hpp"
#include "util/cmdLineHelpers.hpp"

#include <cctype>
#include <exception>
#include <unistd.h>
#include <fmt/core.h>

using namespace rv::shell;
using namespace rv::logging;

void Router::registerCommand(const CommandUsage& usage, CommandHandler handler) {
    const std::string key = normalize(usage.primary());

    CommandInfo info{usage.description.empty() ? "No description provided." : usage.description, std::move(handler), {}};

    for (const std::string& alias : usage.aliases) {
        const auto a = normalize(strip_leading_dashes(alias));
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
        LogRegistry::shell()->debug("Alias '{}' mapped to '{}'", a, key);
    }

    commands_[key] = std::move(info);
    book_.commands.push_back(usage);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const auto n = normalize(strip_leading_dashes(nameOrAlias));
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::hasCommand(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    LogRegistry::shell()->debug("[Router] Executing {} arguments", args.size());
    return dispatch(parseTokens(tokenize(args)));
}

CommandResult Router::executeLine(const std::string& line) const {
    LogRegistry::shell()->debug("[Router] Executing line: '{}'", line);
    return dispatch(parseTokens(tokenize(line)));
}

CommandResult Router::dispatch(CommandCall call) const {
    if (call.name.empty()) return usage(help());

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command or alias: {}\n\n{}", call.name, help()));

    // "<command> --help"
    if (hasKey(call, "help") || hasKey(call, "h")) return ok(help(canonical));

    LogRegistry::shell()->debug("[Router] Executing command: '{}'", canonical);
    call.name = canonical;

    try {
        return commands_.at(canonical).handler(call);
    } catch (const std::exception& e) {
        LogRegistry::shell()->error("[Router] {} failed: {}", canonical, e.what());
        return failed(e.what());
    }
}

std::string Router::help(const std::string& command) const {
    auto book = book_;
    const bool color = isatty(STDOUT_FILENO) != 0;
    book.book_theme = ColorTheme{.enabled = color};

    if (!command.empty()) {
        const auto canonical = canonicalFor(command);
        if (const auto* u = book.find(canonical)) {
            auto c = *u;
            c.theme = *book.book_theme;
            if (const int w = term_width(); w > 0) c.term_width = w;
            return c.str();
        }
    }

    return book.basicStr() + "\nRun 'reelvault help <command>' for details.\n";
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::strip_leading_dashes(const std::string& s) {
    size_t i = 0; while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}
