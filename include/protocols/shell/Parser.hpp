#pragma once

#include "protocols/shell/Token.hpp"
#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rv::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// Flags that never take a value, so "--force file.aepx" keeps file.aepx positional.
inline bool isSwitch(const std::string& key) {
    return key == "force" || key == "f" || key == "yes" || key == "y" || key == "json";
}

inline CommandCall parseTokens(const std::vector<Token>& toks) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;

    // Command name = first Word
    for (; i < toks.size(); ++i) {
        if (toks[i].type == TokenType::Word) {
            call.name = toks[i].text;
            ++i;
            break;
        }
    }
    // Leading flag as name ("-h")
    if (call.name.empty() && !toks.empty() && toks[0].type == TokenType::Flag) {
        call.name = toks[0].text;
        i = 1;
    }

    bool stop_flags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto key = t.text;
            if (!isSwitch(key) && i + 1 < toks.size() && toks[i+1].type == TokenType::Word && toks[i+1].text != "--") {
                setOpt(call, key, toks[i+1].text);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
