#include "referee.hpp"

#include <cctype>

namespace referee
{
    char column_letter(int col)
    {
        if (col < 0 || col >= BOARD_SIZE)
            throw std::out_of_range("column_letter: column " + std::to_string(col) + " is off the board");
        return (char)('a' + col);
    }

    int column_index(char letter)
    {
        char c = (char)std::tolower((unsigned char)letter);
        if (c < 'a' || c > 'h')
            return -1;
        return c - 'a';
    }

    std::string encode_move(Color color, const Move &m)
    {
        std::string out(1, color_char(color));
        if (m.is_pass())
            return out;
        out += ' ';
        out += column_letter(m.x);
        out += ' ';
        out += std::to_string(m.y + 1);
        return out;
    }

    std::optional<Color> parse_color(const std::string &token)
    {
        if (token.size() != 1)
            return std::nullopt;
        char c = (char)std::toupper((unsigned char)token[0]);
        if (c == 'B')
            return Color::Black;
        if (c == 'W')
            return Color::White;
        return std::nullopt;
    }

    std::optional<Move> decode_move(const std::string &line)
    {
        std::istringstream is(line);
        std::string color_tok;
        std::string col_tok;
        std::string row_tok;

        if (!(is >> color_tok) || !parse_color(color_tok))
            return std::nullopt;

        // bare colour token is a pass
        if (!(is >> col_tok))
            return Move::pass();

        if (col_tok.size() != 1)
            return std::nullopt;
        int col = column_index(col_tok[0]);
        if (col < 0)
            return std::nullopt;

        if (!(is >> row_tok) || row_tok.empty())
            return std::nullopt;
        for (char ch : row_tok)
            if (!std::isdigit((unsigned char)ch))
                return std::nullopt;
        if (row_tok.size() > 1)
            return std::nullopt;

        int row = row_tok[0] - '0';
        if (row < 1 || row > BOARD_SIZE)
            return std::nullopt;

        std::string extra;
        if (is >> extra)
            return std::nullopt;

        return Move::from_col_row(col, row - 1);
    }

    std::optional<Color> parse_init(const std::string &line)
    {
        std::istringstream is(line);
        std::string tag;
        std::string color_tok;
        if (!(is >> tag >> color_tok))
            return std::nullopt;
        if (tag.size() != 1 || std::tolower((unsigned char)tag[0]) != 'i')
            return std::nullopt;
        return parse_color(color_tok);
    }

    bool is_move_line(const std::string &line)
    {
        return !line.empty() && (line[0] == 'B' || line[0] == 'W');
    }

    std::string ready_line(Color color)
    {
        return std::string("R ") + color_char(color);
    }

    std::string comment_line(const std::string &message)
    {
        return "C " + message;
    }
} // namespace referee
