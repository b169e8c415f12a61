#pragma once

#include "config.hpp"
#include "gamestate.hpp"
#include "time_budget.hpp"

#include <thread>

struct MCTSNode
{
    double visits = 0.0;
    double wins = 0.0;

    double ratio() const { return visits > 0.0 ? wins / visits : 0.0; }

    // Placeholder for unrecorded children in UCB1: one visit, half a win.
    static MCTSNode cold_start() { return MCTSNode{1.0, 0.5}; }
};

// Flat MCTS statistics keyed by GameState::tree_key(). No parent/child links
// are stored; each search() rebuilds its path as a list of states.
class SearchTree
{
public:
    explicit SearchTree(double exploration_factor = DEFAULT_EXPLORATION_FACTOR, std::uint32_t seed = 0);

    // One select / expand / simulate / backpropagate iteration from root.
    // Does nothing when root is a finished game.
    void search(const GameState &root);

    // Adds other's statistics into this tree. other is left empty.
    void merge(SearchTree &&other);

    Move best_move(const GameState &game, bool log = false) const;
    double evaluate(const GameState &game) const;

    Move ucb1(const GameState &game) const;
    double ucb1_score(double parent_visits, const MCTSNode &child) const;
    std::size_t ucb1_select(double parent_visits, const std::vector<MCTSNode> &children) const;

    bool is_leaf(const GameState &game) const;

    const MCTSNode *find(std::uint64_t key) const;
    bool contains(std::uint64_t key) const { return nodes.find(key) != nodes.end(); }
    std::size_t size() const { return nodes.size(); }
    const std::unordered_map<std::uint64_t, MCTSNode> &get_nodes() const { return nodes; }

    std::uint64_t get_search_iterations() const { return search_iterations; }
    double get_exploration_factor() const { return exploration_factor; }
    void set_exploration_factor(double v) { exploration_factor = v; }
    void set_verbose(bool v) { verbose = v; }

    void clear();

private:
    std::pair<GameState, std::vector<GameState>> select(const GameState &root) const;
    GameState expand(const GameState &leaf) const;
    std::optional<Color> simulate(GameState game);
    void backpropagate(Color player, std::optional<Color> winner, const std::vector<GameState> &path);

    double exploration_factor;
    bool verbose;
    std::mt19937 rng;
    std::unordered_map<std::uint64_t, MCTSNode> nodes;
    std::uint64_t search_iterations = 0;
};

// Joins every joinable thread in the list when it goes out of scope, so a
// failed spawn never destroys a running worker.
class ThreadJoiner
{
public:
    explicit ThreadJoiner(std::vector<std::thread> &threads_) : threads(threads_) {}
    ~ThreadJoiner()
    {
        for (auto &th : threads)
            if (th.joinable())
                th.join();
    }

    ThreadJoiner(const ThreadJoiner &) = delete;
    ThreadJoiner &operator=(const ThreadJoiner &) = delete;

private:
    std::vector<std::thread> &threads;
};

// Runs one SearchTree per hardware thread against the same root until a
// deadline, folds them into a long-lived tree, and picks the move from it.
class MCTSEngine
{
public:
    explicit MCTSEngine(const EngineConfig &config = EngineConfig{}, int seed = 0);

    Move choose_move(const GameState &root);
    Move choose_move_for(const GameState &root, double seconds);

    void search_until(const GameState &root, std::chrono::steady_clock::time_point deadline);

    // (move, stats of its successor) for every legal move at root
    std::vector<std::pair<Move, MCTSNode>> get_root_visit_stats(const GameState &root) const;

    void set_exploration_factor(double v);
    void set_verbose(bool v);
    void set_num_threads(int n);
    void reset_search();

    const SearchTree &get_tree() const { return tree; }
    const EngineConfig &get_config() const { return config; }
    double get_time_remaining() const { return budget.get_time_remaining(); }
    std::uint64_t get_search_iterations() const { return search_iterations; }
    int get_num_threads() const { return num_threads; }

private:
    Move pick_from_tree(const GameState &root);

    EngineConfig config;
    SearchTree tree;
    TimeBudget budget;
    std::uint64_t search_iterations = 0;
    std::uint32_t seed;
    std::uint64_t round = 0;
    int num_threads;
    bool verbose;
};
