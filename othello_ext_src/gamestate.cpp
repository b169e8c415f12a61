#include "gamestate.hpp"

std::string Board::to_string() const
{
    std::ostringstream os;
    for (int y = 0; y < BOARD_SIZE; ++y)
    {
        for (int x = 0; x < BOARD_SIZE; ++x)
        {
            Bitboard pos = 1ULL << (y * BOARD_SIZE + x);
            if (black & pos)
                os << "B ";
            else if (white & pos)
                os << "W ";
            else
                os << ". ";
        }
        os << "\n";
    }
    return os.str();
}

GameState::GameState()
    : current_player(Color::Black),
      turn_number(0)
{
}

GameState::GameState(const Board &board_, Color current_player_, int turn_number_)
    : board(board_),
      current_player(current_player_),
      turn_number(turn_number_)
{
    if (board.black & board.white)
        throw std::invalid_argument("GameState: black and white boards overlap");
    if (turn_number < 0)
        throw std::invalid_argument("GameState: negative turn number");
}

Bitboard GameState::legal_moves_mask() const
{
    const Bitboard own = board.pieces(current_player);
    const Bitboard opp = board.pieces(opponent_of(current_player));
    const Bitboard empty = board.empty();

    Bitboard moves = 0;
    for (int d = 0; d < 8; ++d)
    {
        Bitboard run = shift_dir(own, d) & opp;
        while (run)
        {
            Bitboard beyond = shift_dir(run, d);
            moves |= beyond & empty;
            run = beyond & opp;
        }
    }
    return moves;
}

std::vector<Move> GameState::legal_moves() const
{
    std::vector<Move> out;
    Bitboard mask = legal_moves_mask();
    out.reserve(popcount64(mask));
    while (mask)
    {
        out.push_back(Move::place(lsb_index(mask)));
        mask &= mask - 1;
    }
    return out;
}

bool GameState::is_move_legal(const Move &m) const
{
    if (m.is_pass())
        return true;
    if (m.t != 'D' || m.x < 0 || m.x >= BOARD_SIZE || m.y < 0 || m.y >= BOARD_SIZE)
        return false;
    return (legal_moves_mask() & m.bit()) != 0;
}

std::string GameState::explain_illegal_move(const Move &m) const
{
    std::ostringstream os;
    os << "m=(" << m.x << "," << m.y << "," << m.t << ")";
    os << " turn=" << turn_number << " cur=" << color_char(current_player);
    if (m.is_pass())
        return os.str() + " pass";
    if (m.t != 'D')
        return os.str() + " illegal: bad_type";
    if (m.x < 0 || m.x >= BOARD_SIZE || m.y < 0 || m.y >= BOARD_SIZE)
        return os.str() + " illegal: off_board";
    if (board.occupied() & m.bit())
        return os.str() + " illegal: occupied";
    if (!(legal_moves_mask() & m.bit()))
        return os.str() + " illegal: no_capture";
    return os.str() + " legal?";
}

Bitboard GameState::flips_in_direction(Bitboard pos, Bitboard own, Bitboard opp, int d)
{
    Bitboard flip = 0;
    Bitboard cur = shift_dir(pos, d);
    while (cur & opp)
    {
        flip |= cur;
        cur = shift_dir(cur, d);
    }
    // the run only flips when it is closed by one of our own discs
    return (cur & own) ? flip : 0;
}

GameState GameState::apply(const Move &m) const
{
    if (m.is_pass())
        return *this;
    if (!is_move_legal(m))
        throw InvalidMoveError("Invalid move: " + explain_illegal_move(m));

    Bitboard own = board.pieces(current_player);
    Bitboard opp = board.pieces(opponent_of(current_player));
    const Bitboard pos = m.bit();

    Bitboard flipped = 0;
    for (int d = 0; d < 8; ++d)
        flipped |= flips_in_direction(pos, own, opp, d);

    own |= pos | flipped;
    opp &= ~flipped;

    GameState out = *this;
    if (current_player == Color::Black)
    {
        out.board.black = own;
        out.board.white = opp;
    }
    else
    {
        out.board.white = own;
        out.board.black = opp;
    }
    return out;
}

GameState GameState::next(const Move &m) const
{
    if (is_over())
        throw GameOverError();

    GameState out = m.is_pass() ? *this : apply(m);
    out.turn_number += 1;
    out.current_player = opponent_of(current_player);
    return out;
}

void GameState::play(const Move &m)
{
    *this = next(m);
}

GameState GameState::with_player(Color c) const
{
    GameState out = *this;
    out.current_player = c;
    return out;
}

bool GameState::is_over() const
{
    if (legal_moves_mask() != 0)
        return false;
    return with_player(opponent_of(current_player)).legal_moves_mask() == 0;
}

bool GameState::is_terminal() const
{
    if (is_over())
        return false;
    Bitboard mask = legal_moves_mask();
    if (!mask)
        return false;
    return next(Move::place(lsb_index(mask))).is_over();
}

int GameState::score() const
{
    return popcount64(board.black) - popcount64(board.white);
}

std::optional<Color> GameState::winner() const
{
    int s = score();
    if (s > 0)
        return Color::Black;
    if (s < 0)
        return Color::White;
    return std::nullopt;
}

int GameState::mobility() const
{
    return popcount64(legal_moves_mask());
}

int GameState::empty_squares() const
{
    return NUM_CELLS - popcount64(board.occupied());
}

Move GameState::random_move(std::mt19937 &rng) const
{
    auto moves = legal_moves();
    if (moves.empty())
        return Move::pass();
    std::uniform_int_distribution<std::size_t> dist(0, moves.size() - 1);
    return moves[dist(rng)];
}

Move GameState::move_with_lowest_opp_mobility() const
{
    Move best = Move::pass();
    int lowest = INT_MAX;
    for (const auto &m : legal_moves())
    {
        int mob = next(m).mobility();
        if (mob < lowest)
        {
            lowest = mob;
            best = m;
        }
    }
    return best;
}

std::pair<int, int> GameState::held(Bitboard cells) const
{
    return {popcount64(board.black & cells), popcount64(board.white & cells)};
}
