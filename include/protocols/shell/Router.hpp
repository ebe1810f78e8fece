#pragma once

#include "protocols/shell/types.hpp"
#include "protocols/shell/CommandUsage.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rv::shell {

class Router {
public:
    void registerCommand(const CommandUsage& usage, CommandHandler handler);

    // Process arguments without the program name.
    CommandResult execute(const std::vector<std::string>& args) const;

    CommandResult executeLine(const std::string& line) const;

    CommandResult dispatch(CommandCall call) const;

    // Command summary, or full help for one command.
    [[nodiscard]] std::string help(const std::string& command = {}) const;

    [[nodiscard]] bool hasCommand(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    CommandBook book_{.title = "ReelVault - version control for project files and their assets"};

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string strip_leading_dashes(const std::string& s);
};

} // namespace rv::shell
