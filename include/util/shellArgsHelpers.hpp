#pragma once

#include "protocols/shell/types.hpp"

#include <optional>
#include <string>

namespace rv::shell {

CommandResult invalid(std::string msg);
CommandResult failed(std::string msg);
CommandResult ok(std::string out);
CommandResult usage(std::string text);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

std::optional<int> parseInt(const std::string& sv);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

}
