#pragma once

#include "common.hpp"

struct Board
{
    Bitboard black = BLACK_INITIAL_POSITIONS;
    Bitboard white = WHITE_INITIAL_POSITIONS;

    Bitboard occupied() const { return black | white; }
    Bitboard empty() const { return ~(black | white); }
    Bitboard pieces(Color c) const { return c == Color::Black ? black : white; }

    bool operator==(const Board &o) const { return black == o.black && white == o.white; }
    bool operator!=(const Board &o) const { return !(*this == o); }

    // 8 rows of "B", "W" or "." separated by spaces
    std::string to_string() const;
};

class GameState
{
public:
    GameState();
    GameState(const Board &board, Color current_player, int turn_number = 0);

    Board board;
    Color current_player;
    int turn_number;

    // Tree key: occupied cells only. Colour and side to move are not part of it.
    std::uint64_t tree_key() const { return board.occupied(); }

    Bitboard legal_moves_mask() const;
    std::vector<Move> legal_moves() const;
    bool is_move_legal(const Move &m) const;
    std::string explain_illegal_move(const Move &m) const;

    // Board after the current player places m. Same mover and turn counter.
    GameState apply(const Move &m) const;

    // One full turn: validates, applies, increments the turn and switches the mover.
    GameState next(const Move &m) const;
    void play(const Move &m);

    GameState with_player(Color c) const;

    bool is_over() const;
    bool is_terminal() const;

    int score() const;
    std::optional<Color> winner() const;
    int mobility() const;
    int empty_squares() const;

    Move random_move(std::mt19937 &rng) const;
    Move move_with_lowest_opp_mobility() const;

    // (black, white) counts over fixed cell sets
    std::pair<int, int> corners_held() const { return held(CORNERS_MASK); }
    std::pair<int, int> edges_held() const { return held(EDGES_MASK); }
    std::pair<int, int> x_moves_held() const { return held(X_CELLS_MASK); }
    std::pair<int, int> diagonals_held() const { return held(DIAGONALS_MASK); }
    std::pair<int, int> center_4_held() const { return held(CENTER_4_MASK); }
    std::pair<int, int> inner_board_held() const { return held(INNER_BOARD_MASK); }

    bool operator==(const GameState &o) const
    {
        return board == o.board && current_player == o.current_player && turn_number == o.turn_number;
    }
    bool operator!=(const GameState &o) const { return !(*this == o); }

private:
    std::pair<int, int> held(Bitboard cells) const;

    static Bitboard flips_in_direction(Bitboard pos, Bitboard own, Bitboard opp, int d);
};
