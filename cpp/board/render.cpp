#include "lifemesh/render.hpp"

namespace lifemesh {

std::vector<std::string> render_rows(const std::vector<std::uint8_t>& alive, std::size_t width, std::size_t height) {
    std::vector<std::string> rows;
    rows.reserve(height);
    for (std::size_t y = 0; y < height; ++y) {
        std::string row(width, kDeadGlyph);
        for (std::size_t x = 0; x < width; ++x) {
            if (alive[y * width + x]) row[x] = kAliveGlyph;
        }
        rows.push_back(row);
    }
    return rows;
}

std::vector<std::string> render(const Board& board) {
    return render_rows(board.states(), board.width(), board.height());
}

void print_board(std::ostream& out, const Board& board) {
    for (const auto& row : render(board)) out << row << '\n';
    out << "Generation " << board.generation() << "\n\n";
    out.flush();
}

}
