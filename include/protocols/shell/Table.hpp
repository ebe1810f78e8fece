#pragma once

#include "util/cmdLineHelpers.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace rv::shell {

enum class Align { Left, Right };

// How an over-wide cell is shortened: not at all, "abc...", or "ab...yz" for paths.
enum class Clip { None, Tail, Middle };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    Clip clip = Clip::None;
};

// Fixed-column listing for project, commit and asset views. Clippable columns give up
// width (rightmost first) until the table fits the terminal.
class Table {
public:
    explicit Table(std::vector<Column> cols, const int term_width = 0)
        : cols_(std::move(cols)), term_width_(term_width > 0 ? static_cast<std::size_t>(term_width) : kFallbackWidth) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const auto width = columnWidths();

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        std::vector<std::string> rule;
        rule.reserve(cols_.size());
        for (const auto w : width) rule.emplace_back(w, '-');

        std::vector<std::string> headers;
        headers.reserve(cols_.size());
        for (const auto& c : cols_) headers.push_back(c.header);

        emitLine(out, headers, width);
        emitLine(out, rule, width);
        for (const auto& r : rows_) emitLine(out, r, width);
        return out;
    }

private:
    static constexpr std::size_t kFallbackWidth = 100;
    static constexpr std::size_t kIndent = 2;
    static constexpr std::size_t kGap = 2;

    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    std::size_t term_width_;

    [[nodiscard]] std::vector<std::size_t> columnWidths() const {
        std::vector<std::size_t> width(cols_.size());
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            std::size_t w = std::max(cols_[i].min, cols_[i].header.size());
            for (const auto& r : rows_) w = std::max(w, r[i].size());
            width[i] = cols_[i].clip == Clip::None ? w : std::min(w, std::max(cols_[i].max, cols_[i].min));
        }

        std::size_t total = kIndent + kGap * (cols_.size() - 1);
        for (const auto w : width) total += w;

        for (std::size_t i = cols_.size(); i-- > 0 && total > term_width_;) {
            if (cols_[i].clip == Clip::None) continue;
            const auto floor = std::max<std::size_t>(cols_[i].min, 5);
            const auto give = std::min(total - term_width_, width[i] > floor ? width[i] - floor : 0);
            width[i] -= give;
            total -= give;
        }
        return width;
    }

    [[nodiscard]] std::string clip(const std::string& s, const std::size_t w, const Clip mode) const {
        if (s.size() <= w || mode == Clip::None) return s;
        if (mode == Clip::Middle && w >= 5) return ellipsize_middle(s, w);
        if (w <= 3) return s.substr(0, w);
        return s.substr(0, w - 3) + "...";
    }

    void emitLine(std::string& out, const std::vector<std::string>& cells, const std::vector<std::size_t>& width) const {
        std::string line(kIndent, ' ');
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) line.append(kGap, ' ');
            const auto text = clip(cells[i], width[i], cols_[i].clip);
            if (cols_[i].align == Align::Left) fmt::format_to(std::back_inserter(line), "{:<{}}", text, width[i]);
            else fmt::format_to(std::back_inserter(line), "{:>{}}", text, width[i]);
        }
        while (!line.empty() && line.back() == ' ') line.pop_back();
        out += line;
        out += '\n';
    }
};

}
