#pragma once

#include "protocols/shell/CommandUsage.hpp"

namespace rv::shell {

class ProjectUsage {
public:
    [[nodiscard]] static CommandUsage init();
    [[nodiscard]] static CommandUsage commit();
    [[nodiscard]] static CommandUsage list();
    [[nodiscard]] static CommandUsage log();
    [[nodiscard]] static CommandUsage show();
    [[nodiscard]] static CommandUsage tracking();
    [[nodiscard]] static CommandUsage remove();
    [[nodiscard]] static CommandUsage prune();
    [[nodiscard]] static CommandUsage pull();
    [[nodiscard]] static CommandUsage del();
    [[nodiscard]] static CommandUsage use();
    [[nodiscard]] static CommandUsage status();
};

class SystemUsage {
public:
    [[nodiscard]] static CommandUsage help();
    [[nodiscard]] static CommandUsage version();
    [[nodiscard]] static CommandUsage serve();
};

}
