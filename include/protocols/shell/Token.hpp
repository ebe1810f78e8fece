#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace rv::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    if (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}
inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

inline void skip_ws(const char*& p, const char* e) {
    while (p < e && (*p == ' ' || *p == '\t')) ++p;
}

inline std::string read_quoted(const char*& p, const char* e, char quote) {
    // p is at the opening quote; consume it
    ++p;
    std::string buf;
    buf.reserve(32);
    while (p < e) {
        if (*p == quote) { ++p; break; }
        if (quote == '"' && *p == '\\' && p + 1 < e) {
            ++p;
            buf.push_back(*p++);
            continue;
        }
        buf.push_back(*p++);
    }
    return buf;
}

inline std::string read_unquoted_atom(const char*& p, const char* e) {
    const char* b = p;
    while (p < e && *p != ' ' && *p != '\t' && *p != '"' && *p != '\'') ++p;
    return {b, static_cast<std::string::size_type>(p - b)};
}

// "-xVALUE" vs "-abc": a tail with path-ish characters is a glued value.
inline bool looks_glued_value(std::string_view tail) {
    return std::ranges::any_of(tail, [](char c) { return c == '/' || c == '.' || c == ':' || c == '='; });
}

inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// Classifies one already-split argument (argv element or unquoted atom).
inline void classify(std::string atom, std::vector<Token>& out) {
    if (atom == "--") { pushWord(out, std::move(atom)); return; }

    if (atom.size() < 2 || atom[0] != '-' || looks_negative_number(atom)) {
        pushWord(out, std::move(atom));
        return;
    }

    if (atom.rfind("--", 0) == 0) {
        if (out.empty()) { pushWord(out, std::move(atom)); return; } // "--help" as the command
        const auto eq = atom.find('=');
        if (eq == std::string::npos) pushFlag(out, atom.substr(2));
        else {
            pushFlag(out, atom.substr(2, eq - 2));
            pushWord(out, atom.substr(eq + 1));
        }
        return;
    }

    if (atom.size() == 2) {
        if (out.empty()) pushWord(out, std::move(atom));
        else pushFlag(out, atom.substr(1));
        return;
    }

    const std::string_view tail = std::string_view(atom).substr(2);
    if (looks_glued_value(tail)) {
        pushFlag(out, std::string(1, atom[1]));
        std::string value(tail);
        if (!value.empty() && value[0] == '=') value.erase(value.begin());
        pushWord(out, std::move(value));
    } else expand_bundle(std::string_view(atom).substr(1), out);
}

// Tokens from process arguments; quoting was already resolved by the invoking shell.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size());
    bool stop = false;
    for (const auto& a : args) {
        if (stop) { pushWord(out, a); continue; }
        if (a == "--") stop = true;
        classify(a, out);
    }
    return out;
}

// Tokens from a single command line with shell-style quoting.
inline std::vector<Token> tokenize(const std::string& line) {
    std::vector<Token> out;
    out.reserve(16);

    const char* p = line.c_str();
    const char* e = p + line.size();

    // Strip the program name if the line was copied from a terminal
    for (const std::string_view prefix : {"reelvault ", "rv "}) {
        if (line.starts_with(prefix)) { p += prefix.size(); break; }
    }

    skip_ws(p, e);
    while (p < e) {
        if (*p == '"' || *p == '\'') {
            const char q = *p;
            pushWord(out, read_quoted(p, e, q));
            skip_ws(p, e);
            continue;
        }

        std::string atom = read_unquoted_atom(p, e);
        // Fold a quoted value glued to "--key=" or "key="
        if (p < e && (*p == '"' || *p == '\'') && !atom.empty() && atom.back() == '=') {
            const char q = *p;
            atom += read_quoted(p, e, q);
        }

        classify(std::move(atom), out);
        skip_ws(p, e);
    }

    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

inline std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    out.reserve(64 + tokens.size() * 16);
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
