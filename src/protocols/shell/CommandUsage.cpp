#include "protocols/shell/CommandUsage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rv::shell {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0, n = s.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(s[i])) && s[i] != '\n') ++i;

        if (i < n && s[i] == '\n') {
            out.emplace_back("");
            ++i;
            continue;
        }

        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        if (end < n && s[end] != ' ') {
            auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp >= i) break_pos = sp;
        }

        if (break_pos == i) break_pos = end;

        out.push_back(trimRight(s.substr(i, break_pos - i)));

        if (break_pos < n && s[break_pos] == ' ') i = break_pos + 1;
        else i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

void emitWrapped(std::ostringstream& out, const std::string& text, std::size_t indent, int width) {
    for (const auto& ln : wrap(text, width - static_cast<int>(indent)))
        out << std::string(indent, ' ') << ln << "\n";
}

std::string keyLabel(const Entry& e) {
    return e.aliases.empty() ? e.label : fmt::format("{} | {}", e.label, fmt::join(e.aliases, " | "));
}

std::string padRight(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out,
                       const std::string& title,
                       const std::vector<Entry>& items,
                       int width,
                       std::size_t max_key_col,
                       const ColorTheme& theme) {
    if (items.empty()) return;
    constexpr std::size_t indent = 2, gap = 2;

    std::size_t keyw = 0;
    for (const auto& it : items) keyw = std::max(keyw, keyLabel(it).size());
    keyw = std::min(keyw, max_key_col);

    out << theme.H() << title << theme.R() << "\n";
    const int rightw = width - static_cast<int>(indent + keyw + gap);
    for (const auto& it : items) {
        const auto lines = wrap(it.desc, std::max(20, rightw));
        out << std::string(indent, ' ') << theme.K() << padRight(keyLabel(it), keyw) << theme.R()
            << std::string(gap, ' ') << lines[0] << "\n";
        for (std::size_t i = 1; i < lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << lines[i] << "\n";
    }
    out << "\n";
}

}

std::string CommandUsage::buildSynopsis_() const {
    if (synopsis) return *synopsis;

    std::ostringstream syn;
    syn << "reelvault " << command;
    for (const auto& p : positionals) {
        if (p.label.find('<') != std::string::npos || p.label.find('[') != std::string::npos) syn << " " << p.label;
        else syn << " <" << p.label << ">";
    }
    for (const auto& o : optional) syn << " [" << o.label << "]";
    return syn.str();
}

std::string CommandUsage::basicStr() const {
    std::ostringstream out;
    const auto head = aliases.empty() ? command : fmt::format("{} ({})", command, fmt::join(aliases, ", "));
    out << "  " << theme.C() << padRight(head, 24) << theme.R() << description << "\n";
    return out.str();
}

std::string CommandUsage::str() const {
    const int tw = term_width > 40 ? term_width : 100;

    std::ostringstream out;
    out << theme.C() << command << theme.R();
    if (!description.empty()) out << " - " << description;
    out << "\n\n";

    out << theme.H() << "Usage:" << theme.R() << "\n";
    emitWrapped(out, buildSynopsis_(), 2, tw);
    out << "\n";

    if (!aliases.empty()) out << theme.H() << "Aliases:" << theme.R() << " " << fmt::format("{}", fmt::join(aliases, ", ")) << "\n\n";

    emitTwoColSection(out, "Arguments:", positionals, tw, max_key_col, theme);
    emitTwoColSection(out, "Options:", optional, tw, max_key_col, theme);

    if (!examples.empty()) {
        out << theme.H() << "Examples:" << theme.R() << "\n";
        for (const auto& ex : examples) {
            emitWrapped(out, fmt::format("$ {}", ex.cmd), 2, tw);
            if (!ex.note.empty()) emitWrapped(out, ex.note, 4, tw);
        }
        out << "\n";
    }

    return out.str();
}

std::string CommandBook::basicStr() const {
    std::ostringstream out;
    if (!title.empty()) out << title << "\n\n";
    for (auto c : commands) {
        if (book_theme) c.theme = *book_theme;
        out << c.basicStr();
    }
    return out.str();
}

const CommandUsage* CommandBook::find(const std::string& nameOrAlias) const {
    for (const auto& c : commands) {
        if (c.command == nameOrAlias) return &c;
        if (std::ranges::find(c.aliases, nameOrAlias) != c.aliases.end()) return &c;
    }
    return nullptr;
}

}
