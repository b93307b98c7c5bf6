#pragma once

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace sp::cli {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t max = 60;            // wider cells are clipped with "..."
};

class Table {
public:
    explicit Table(std::vector<Column> cols) : cols_(std::move(cols)) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const std::size_t ncol = cols_.size();
        std::vector<std::size_t> width(ncol, 0);
        for (std::size_t i = 0; i < ncol; ++i) width[i] = cols_[i].header.size();
        for (const auto& r : rows_)
            for (std::size_t i = 0; i < ncol; ++i)
                width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));

        std::string out;
        const auto emit = [&](const std::vector<std::string>& cells) {
            out += "  ";
            for (std::size_t i = 0; i < ncol; ++i) {
                if (i) out += "  ";
                const auto cell = clip(cells[i], width[i]);
                if (cols_[i].align == Align::Left && i + 1 == ncol) out += cell; // no trailing pad
                else if (cols_[i].align == Align::Left)
                    fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
                else fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
            }
            out += '\n';
        };

        std::vector<std::string> headers;
        std::vector<std::string> rules;
        for (std::size_t i = 0; i < ncol; ++i) {
            headers.push_back(cols_[i].header);
            rules.emplace_back(width[i], '-');
        }

        emit(headers);
        emit(rules);
        for (const auto& r : rows_) emit(r);
        return out;
    }

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;

    static std::string clip(const std::string& s, const std::size_t width) {
        if (s.size() <= width) return s;
        if (width <= 3) return s.substr(0, width);
        return s.substr(0, width - 3) + "...";
    }
};

}
