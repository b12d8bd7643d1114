#include "trellis/table_builder.hpp"
#include <algorithm>

namespace trellis {

void table_builder::push_record(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

std::string table_builder::build() const {
    if (rows_.empty()) {
        return {};
    }

    size_t columns = 0;
    for (const auto& row : rows_) {
        columns = std::max(columns, row.size());
    }

    std::vector<size_t> widths(columns, 0);
    for (const auto& row : rows_) {
        for (size_t c = 0; c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    std::string rule = "+";
    for (size_t w : widths) {
        rule.append(w + 2, '-');
        rule += '+';
    }

    auto render_row = [&](const std::vector<std::string>& row) {
        std::string line = "|";
        for (size_t c = 0; c < columns; ++c) {
            const std::string cell = c < row.size() ? row[c] : std::string();
            line += ' ';
            line += cell;
            line.append(widths[c] - cell.size() + 1, ' ');
            line += '|';
        }
        return line;
    };

    std::string out = rule;
    for (size_t r = 0; r < rows_.size(); ++r) {
        out += '\n';
        out += render_row(rows_[r]);
        if (r == 0) {
            out += '\n';
            out += rule;
        }
    }
    if (rows_.size() > 1) {
        out += '\n';
        out += rule;
    }
    return out;
}

} // namespace trellis
