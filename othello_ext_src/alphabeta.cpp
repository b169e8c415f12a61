#include "alphabeta.hpp"

// Deeper plies get this much extra time before they fall back to the static score.
static constexpr int HARD_LIMIT_GRACE_MS = 1000;

AlphaBetaEngine::AlphaBetaEngine(int max_depth_, int time_limit_ms_)
    : max_depth(std::max(1, max_depth_)),
      time_limit_ms(std::max(0, time_limit_ms_))
{
}

Move AlphaBetaEngine::choose_move(const GameState &root)
{
    if (root.is_over() || root.legal_moves_mask() == 0)
        return Move::pass();

    const auto t_start = std::chrono::steady_clock::now();
    const auto soft_deadline = t_start + std::chrono::milliseconds(time_limit_ms);
    hard_deadline = soft_deadline + std::chrono::milliseconds(HARD_LIMIT_GRACE_MS);
    nodes_searched = 0;
    last_depth = 0;

    const Color max_player = root.current_player;
    Move best_move = sort_moves(root).front();

    for (int depth = 1; depth <= max_depth; ++depth)
    {
        if (depth > 1 && std::chrono::steady_clock::now() >= soft_deadline)
            break;
        Move mv = best_move;
        alpha_beta(root, 0, INT_MIN, INT_MAX, max_player, true, depth, &mv);
        best_move = mv;
        last_depth = depth;
    }
    return best_move;
}

int AlphaBetaEngine::alpha_beta(const GameState &g, int ply, int alpha, int beta, Color max_player, bool maximising, int depth_limit, Move *best_out)
{
    nodes_searched++;

    if (ply >= depth_limit || g.is_over() || g.is_terminal())
        return evaluate_state(g, max_player);

    std::vector<Move> actions = sort_moves(g);
    if (actions.empty())
        actions.push_back(Move::pass());

    int v = maximising ? INT_MIN : INT_MAX;
    Move mv = actions.front();

    for (const auto &action : actions)
    {
        GameState child = g.next(action);

        int child_value;
        if (std::chrono::steady_clock::now() < hard_deadline)
            child_value = alpha_beta(child, ply + 1, alpha, beta, max_player, !maximising, depth_limit, nullptr);
        else
            child_value = evaluate_state(child, max_player);

        if (maximising)
        {
            if (child_value > v)
            {
                v = child_value;
                mv = action;
                alpha = std::max(alpha, v);
            }
            if (v >= beta)
                break;
        }
        else
        {
            if (child_value < v)
            {
                v = child_value;
                mv = action;
                beta = std::min(beta, v);
            }
            if (v <= alpha)
                break;
        }
    }

    if (best_out)
        *best_out = mv;
    return v;
}

int AlphaBetaEngine::evaluate_state(const GameState &g, Color max_player)
{
    if (g.turn_number >= MID_GAME)
    {
        int score = g.score();
        return max_player == Color::White ? -score : score;
    }

    if (g.current_player == max_player)
        return g.mobility();

    // opponent to move: the reply that leaves max_player the least room
    auto moves = g.legal_moves();
    if (moves.empty())
        return 0;

    int score = INT_MAX;
    for (const auto &m : moves)
    {
        int move_score = g.next(m).mobility();
        if (m.bit() & CORNERS_MASK)
            move_score *= CORNER_MULTIPLIER;
        if (m.bit() & EDGES_MASK)
            move_score *= EDGE_MULTIPLIER;
        score = std::min(score, move_score);
    }
    return score;
}

std::vector<Move> AlphaBetaEngine::sort_moves(const GameState &g)
{
    auto moves = g.legal_moves();
    std::vector<std::pair<int, Move>> scored;
    scored.reserve(moves.size());
    for (const auto &m : moves)
    {
        GameState child = g.next(m);
        scored.emplace_back(evaluate_state(child, child.current_player), m);
    }
    std::stable_sort(scored.begin(), scored.end(), [](const std::pair<int, Move> &a, const std::pair<int, Move> &b)
                     { return a.first > b.first; });

    std::vector<Move> out;
    out.reserve(scored.size());
    for (const auto &s : scored)
        out.push_back(s.second);
    return out;
}
