#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using Bitboard = std::uint64_t;

// Cell index = row * 8 + col, bit 0 is a1 (top-left), bit 63 is h8.
static constexpr int BOARD_SIZE = 8;
static constexpr int NUM_CELLS = 64;

static constexpr Bitboard BLACK_INITIAL_POSITIONS = (1ULL << 28) | (1ULL << 35);
static constexpr Bitboard WHITE_INITIAL_POSITIONS = (1ULL << 27) | (1ULL << 36);

// Shift directions: 0:E(<<1) 1:S(<<8) 2:SE(<<9) 3:SW(<<7) 4:W(>>1) 5:N(>>8) 6:NW(>>9) 7:NE(>>7)
// Each mask clears the cells that would wrap around (or fall off) when shifted.
static constexpr Bitboard DIRECTION_MASKS[8] = {
    0x7F7F7F7F7F7F7F7FULL,
    0x00FFFFFFFFFFFFFFULL,
    0x007F7F7F7F7F7F7FULL,
    0x00FEFEFEFEFEFEFEULL,
    0xFEFEFEFEFEFEFEFEULL,
    0xFFFFFFFFFFFFFF00ULL,
    0xFEFEFEFEFEFEFE00ULL,
    0x7F7F7F7F7F7F7F00ULL};

static constexpr int DIRECTION_OFFSETS[4] = {1, 8, 9, 7};

constexpr Bitboard shift_dir(Bitboard b, int d)
{
    return d < 4 ? (b & DIRECTION_MASKS[d]) << DIRECTION_OFFSETS[d]
                 : (b & DIRECTION_MASKS[d]) >> DIRECTION_OFFSETS[d - 4];
}

inline int popcount64(Bitboard b)
{
    return __builtin_popcountll(b);
}

inline int lsb_index(Bitboard b)
{
    return __builtin_ctzll(b);
}

template <std::size_t N>
constexpr Bitboard mask_of(const int (&cells)[N])
{
    Bitboard m = 0;
    for (std::size_t i = 0; i < N; ++i)
        m |= 1ULL << cells[i];
    return m;
}

static constexpr int CORNER_CELLS[4] = {0, 7, 56, 63};

// cells next to a corner
static constexpr int X_CELLS[12] = {1, 6, 8, 9, 14, 15, 48, 49, 54, 55, 57, 62};

static constexpr int EDGE_CELLS[28] = {
    0, 1, 2, 3, 4, 5, 6, 7,
    8, 16, 24, 32, 40, 48, 56,
    15, 23, 31, 39, 47, 55,
    57, 58, 59, 60, 61, 62, 63};

static constexpr int DIAGONAL_CELLS[16] = {
    0, 9, 18, 27, 36, 45, 54, 63,
    7, 14, 21, 28, 35, 42, 49, 56};

static constexpr int CENTER_4_CELLS[4] = {27, 28, 35, 36};

static constexpr int INNER_BOARD_CELLS[16] = {
    18, 19, 20, 21,
    26, 27, 28, 29,
    34, 35, 36, 37,
    42, 43, 44, 45};

static constexpr Bitboard CORNERS_MASK = mask_of(CORNER_CELLS);
static constexpr Bitboard X_CELLS_MASK = mask_of(X_CELLS);
static constexpr Bitboard EDGES_MASK = mask_of(EDGE_CELLS);
static constexpr Bitboard DIAGONALS_MASK = mask_of(DIAGONAL_CELLS);
static constexpr Bitboard CENTER_4_MASK = mask_of(CENTER_4_CELLS);
static constexpr Bitboard INNER_BOARD_MASK = mask_of(INNER_BOARD_CELLS);

enum class Color : int
{
    Black = 0,
    White = 1
};

constexpr Color opponent_of(Color c)
{
    return c == Color::Black ? Color::White : Color::Black;
}

constexpr char color_char(Color c)
{
    return c == Color::Black ? 'B' : 'W';
}

class GameError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A placement outside the legal set. The state it was played against is unchanged.
class InvalidMoveError : public GameError
{
public:
    InvalidMoveError() : GameError("Invalid move!") {}
    explicit InvalidMoveError(const std::string &what) : GameError(what) {}
};

class GameOverError : public GameError
{
public:
    GameOverError() : GameError("Game Over.") {}
};

// x = column, y = row (0-indexed). t is 'D' for a disc placement, 'P' for a pass.
struct Move
{
    int x = 0;
    int y = 0;
    char t = 'P';

    static Move pass() { return Move{0, 0, 'P'}; }

    static Move place(int cell)
    {
        if (cell < 0 || cell >= NUM_CELLS)
            throw InvalidMoveError("Invalid move: cell " + std::to_string(cell) + " is off the board");
        return Move{cell % BOARD_SIZE, cell / BOARD_SIZE, 'D'};
    }

    static Move from_col_row(int col, int row)
    {
        if (col < 0 || col >= BOARD_SIZE || row < 0 || row >= BOARD_SIZE)
            throw InvalidMoveError("Invalid move: (" + std::to_string(col) + ", " + std::to_string(row) + ") is off the board");
        return Move{col, row, 'D'};
    }

    bool is_pass() const { return t == 'P'; }
    int cell() const { return y * BOARD_SIZE + x; }
    Bitboard bit() const { return is_pass() ? 0 : 1ULL << cell(); }

    std::string to_string() const
    {
        if (is_pass())
            return "pass";
        std::ostringstream os;
        os << x << " " << y;
        return os.str();
    }

    bool operator==(const Move &o) const
    {
        return x == o.x && y == o.y && t == o.t;
    }

    bool operator!=(const Move &o) const { return !(*this == o); }
};

constexpr std::uint64_t splitmix64(std::uint64_t x)
{
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

// Verbose output is silenced when the extension runs under pytest.
inline bool default_verbose()
{
    return std::getenv("PYTEST_CURRENT_TEST") == nullptr;
}

// Referee comment channel. Written to stderr so stdout stays a clean move channel.
inline void log_comment(const std::string &message)
{
    std::cerr << "C " << message << std::endl;
}
