#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "lifemesh/board.hpp"

namespace lifemesh {

constexpr char kAliveGlyph = '*';
constexpr char kDeadGlyph = '_';

std::vector<std::string> render_rows(const std::vector<std::uint8_t>& alive, std::size_t width, std::size_t height);

std::vector<std::string> render(const Board& board);

void print_board(std::ostream& out, const Board& board);
}
