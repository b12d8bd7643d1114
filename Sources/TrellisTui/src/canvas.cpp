#include "trellis/tui/canvas.hpp"
#include <algorithm>

namespace trellis::tui {

canvas::canvas(int width, int height)
    : width_(std::max(width, 0)),
      height_(std::max(height, 0)),
      cells_(static_cast<size_t>(width_) * height_, ' '),
      styles_(static_cast<size_t>(width_) * height_, cell_style::normal) {}

void canvas::clear() {
    std::fill(cells_.begin(), cells_.end(), ' ');
    std::fill(styles_.begin(), styles_.end(), cell_style::normal);
}

void canvas::put(int x, int y, std::string_view text, cell_style style, int max_width) {
    if (y < 0 || y >= height_) return;
    int limit = max_width < 0 ? static_cast<int>(text.size()) : std::min(max_width, static_cast<int>(text.size()));
    for (int i = 0; i < limit; ++i) {
        int cx = x + i;
        if (cx < 0) continue;
        if (cx >= width_) break;
        size_t index = static_cast<size_t>(y) * width_ + cx;
        cells_[index] = text[i];
        styles_[index] = style;
    }
}

void canvas::draw_box(const rect& r, std::string_view title) {
    if (r.width < 2 || r.height < 2) return;

    std::string horizontal(static_cast<size_t>(r.width - 2), '-');
    put(r.x, r.y, "+" + horizontal + "+");
    put(r.x, r.y + r.height - 1, "+" + horizontal + "+");
    for (int row = r.y + 1; row < r.y + r.height - 1; ++row) {
        put(r.x, row, "|");
        put(r.x + r.width - 1, row, "|");
    }
    if (!title.empty()) {
        put(r.x + 2, r.y, title, cell_style::bold, r.width - 4);
    }
}

char canvas::at(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return ' ';
    return cells_[static_cast<size_t>(y) * width_ + x];
}

cell_style canvas::style_at(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return cell_style::normal;
    return styles_[static_cast<size_t>(y) * width_ + x];
}

std::string canvas::line(int y) const {
    if (y < 0 || y >= height_) return {};
    auto begin = cells_.begin() + static_cast<size_t>(y) * width_;
    return std::string(begin, begin + width_);
}

std::vector<std::string> canvas::lines() const {
    std::vector<std::string> out;
    out.reserve(height_);
    for (int y = 0; y < height_; ++y) {
        out.push_back(line(y));
    }
    return out;
}

bool canvas::contains(std::string_view text) const {
    for (int y = 0; y < height_; ++y) {
        if (line(y).find(text) != std::string::npos) return true;
    }
    return false;
}

} // namespace trellis::tui
