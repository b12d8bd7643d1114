#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace trellis::tui {

struct rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }

    /// The area inside a one-cell border.
    rect inner() const { return rect{x + 1, y + 1, width - 2, height - 2}; }
};

enum class cell_style {
    normal,
    bold,
    reverse
};

/// Backend-independent character grid the session and tabs draw into.
/// Writes outside the grid are clipped.
class canvas {
public:
    canvas(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }
    rect area() const { return rect{0, 0, width_, height_}; }

    void clear();

    /// Writes `text` starting at (x, y), clipped to `max_width` cells when given.
    void put(int x, int y, std::string_view text, cell_style style = cell_style::normal, int max_width = -1);

    void draw_box(const rect& r, std::string_view title = {});

    char at(int x, int y) const;
    cell_style style_at(int x, int y) const;

    /// Row `y` as text, trailing spaces included.
    std::string line(int y) const;
    std::vector<std::string> lines() const;

    /// True if any row contains `text`.
    bool contains(std::string_view text) const;

private:
    int width_;
    int height_;
    std::vector<char> cells_;
    std::vector<cell_style> styles_;
};

} // namespace trellis::tui
