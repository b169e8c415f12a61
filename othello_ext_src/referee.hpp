#pragma once

#include "common.hpp"

// Text forms used by the line-oriented referee:
//   move      "<B|W> <a-h> <1-8>"   (lettered column, 1-indexed row)
//   pass      "<B|W>"
//   init      "I <B|W>"
//   ready     "R <B|W>"
//   comment   "C <text>"
namespace referee
{
    char column_letter(int col);
    int column_index(char letter);

    std::string encode_move(Color color, const Move &m);

    // nullopt on an unknown column letter, a missing/non-numeric row or a row
    // outside 1..8. Callers substitute a pass.
    std::optional<Move> decode_move(const std::string &line);

    std::optional<Color> parse_color(const std::string &token);
    std::optional<Color> parse_init(const std::string &line);

    bool is_move_line(const std::string &line);

    std::string ready_line(Color color);
    std::string comment_line(const std::string &message);
} // namespace referee
