#pragma once

#include <string>
#include <vector>

namespace trellis {

/// Collects rows of text cells and renders them as a bordered ASCII grid:
///
///   +----+------+
///   | ID | name |
///   +----+------+
///   | 1  | Ann  |
///   +----+------+
///
/// The first pushed row is the header. Short rows are padded with empty cells.
class table_builder {
public:
    void push_record(std::vector<std::string> cells);

    size_t row_count() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    const std::vector<std::vector<std::string>>& rows() const { return rows_; }

    /// Renders the grid without a trailing newline. Empty builders render as "".
    std::string build() const;

private:
    std::vector<std::vector<std::string>> rows_;
};

} // namespace trellis
