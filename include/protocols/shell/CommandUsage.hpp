#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rv::shell {

// A labeled entry (argument or flag), with optional aliases.
struct Entry {
    std::string label;                  // e.g. "--force"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-f"}
};

struct Example {
    std::string cmd;
    std::string note;
};

// ANSI color theme. Set enabled=false to disable.
struct ColorTheme {
    bool enabled = true;

    std::string header = "\033[1;36m"; // section titles (bold cyan)
    std::string command = "\033[1;32m"; // command name (bold green)
    std::string key = "\033[33m";      // left column keys (yellow)
    std::string reset = "\033[0m";

    [[nodiscard]] std::string maybe(const std::string& code) const {
        return enabled ? code : "";
    }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string C() const { return maybe(command); }
    [[nodiscard]] std::string K() const { return maybe(key); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

class CommandUsage {
public:
    std::string command;
    std::vector<std::string> aliases;
    std::string description;
    std::optional<std::string> synopsis;         // synthesized when empty

    std::vector<Entry> positionals;              // ordered; appear in synopsis
    std::vector<Entry> optional;                 // flags

    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 30;
    ColorTheme theme{};

    [[nodiscard]] const std::string& primary() const { return command; }

    // Full help for "reelvault help <command>"
    [[nodiscard]] std::string str() const;

    // One line: name, aliases and description
    [[nodiscard]] std::string basicStr() const;

private:
    [[nodiscard]] std::string buildSynopsis_() const;
};

class CommandBook {
public:
    std::string title;
    std::vector<CommandUsage> commands;
    std::optional<ColorTheme> book_theme;

    [[nodiscard]] std::string basicStr() const;
    [[nodiscard]] const CommandUsage* find(const std::string& nameOrAlias) const;
};

}
