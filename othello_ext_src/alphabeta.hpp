#pragma once

#include "gamestate.hpp"

// Depth-limited minimax with alpha-beta pruning and iterative deepening.
// Alternate strategy to MCTSEngine, sharing the same board API.
class AlphaBetaEngine
{
public:
    static constexpr int MID_GAME = 35;
    static constexpr int CORNER_MULTIPLIER = 5;
    static constexpr int EDGE_MULTIPLIER = 2;

    explicit AlphaBetaEngine(int max_depth = 4, int time_limit_ms = 100);

    Move choose_move(const GameState &root);

    void set_max_depth(int v) { max_depth = std::max(1, v); }
    void set_time_limit_ms(int v) { time_limit_ms = std::max(0, v); }

    int get_last_depth() const { return last_depth; }
    std::size_t get_nodes_searched() const { return nodes_searched; }

    // Static score of g for max_player: mobility based before the mid game,
    // disc difference after it.
    static int evaluate_state(const GameState &g, Color max_player);

    // Legal moves ordered by descending evaluate_state of the resulting state.
    static std::vector<Move> sort_moves(const GameState &g);

private:
    int alpha_beta(const GameState &g, int ply, int alpha, int beta, Color max_player, bool maximising, int depth_limit, Move *best_out);

    int max_depth;
    int time_limit_ms;
    int last_depth = 0;
    std::size_t nodes_searched = 0;
    std::chrono::steady_clock::time_point hard_deadline;
};
