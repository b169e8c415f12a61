#include "mcts.hpp"

#include <exception>
#include <limits>
#include <thread>

SearchTree::SearchTree(double exploration_factor_, std::uint32_t seed)
    : exploration_factor(exploration_factor_),
      verbose(default_verbose()),
      rng((seed == 0) ? std::mt19937(std::random_device{}()) : std::mt19937(seed))
{
}

void SearchTree::search(const GameState &root)
{
    if (root.is_over())
        return;

    auto selected = select(root);
    GameState &leaf = selected.first;
    std::vector<GameState> &path = selected.second;

    GameState child = expand(leaf);
    const bool expanded = child != leaf;

    std::optional<Color> winner = simulate(child);
    if (expanded)
        path.push_back(child);

    backpropagate(root.current_player, winner, path);
    search_iterations += 1;
}

std::pair<GameState, std::vector<GameState>> SearchTree::select(const GameState &root) const
{
    std::vector<GameState> path;
    path.reserve(64);

    GameState g = root;
    while (!g.is_over() && !is_leaf(g))
    {
        path.push_back(g);
        g = g.next(ucb1(g));
    }
    return {g, std::move(path)};
}

GameState SearchTree::expand(const GameState &leaf) const
{
    for (const auto &m : leaf.legal_moves())
    {
        GameState child = leaf.next(m);
        if (!contains(child.tree_key()))
            return child;
    }
    return leaf;
}

std::optional<Color> SearchTree::simulate(GameState game)
{
    while (!game.is_over())
    {
        Move m = best_move(game);
        if (m.is_pass())
            m = game.random_move(rng);
        game.play(m);
    }
    return game.winner();
}

void SearchTree::backpropagate(Color player, std::optional<Color> winner, const std::vector<GameState> &path)
{
    // reward is always seen from the side to move at the root of this search
    double value = 0.0;
    if (!winner)
        value = 0.5;
    else if (*winner == player)
        value = 1.0;

    for (const auto &g : path)
    {
        MCTSNode &node = nodes[g.tree_key()];
        node.visits += 1.0;
        node.wins += value;
    }
}

void SearchTree::merge(SearchTree &&other)
{
    if (&other == this)
        return;

    for (const auto &kv : other.nodes)
    {
        auto it = nodes.find(kv.first);
        if (it == nodes.end())
        {
            nodes.emplace(kv.first, kv.second);
        }
        else
        {
            it->second.visits += kv.second.visits;
            it->second.wins += kv.second.wins;
        }
    }
    search_iterations += other.search_iterations;

    other.nodes.clear();
    other.search_iterations = 0;
}

double SearchTree::ucb1_score(double parent_visits, const MCTSNode &child) const
{
    const double visits = std::max(child.visits, 1.0);
    const double exploitation = child.wins / visits;
    const double exploration = exploration_factor * std::sqrt((std::log(parent_visits) + 1e-5) / visits);
    return exploitation + exploration;
}

std::size_t SearchTree::ucb1_select(double parent_visits, const std::vector<MCTSNode> &children) const
{
    std::size_t best = 0;
    double best_value = std::numeric_limits<double>::lowest();
    for (std::size_t i = 0; i < children.size(); ++i)
    {
        double v = ucb1_score(parent_visits, children[i]);
        if (v > best_value)
        {
            best_value = v;
            best = i;
        }
    }
    return best;
}

Move SearchTree::ucb1(const GameState &game) const
{
    auto moves = game.legal_moves();
    if (moves.empty())
        return Move::pass();

    const MCTSNode *parent = find(game.tree_key());
    const double parent_visits = parent ? parent->visits : 1.0;

    std::vector<MCTSNode> children;
    children.reserve(moves.size());
    for (const auto &m : moves)
    {
        const MCTSNode *n = find(game.next(m).tree_key());
        children.push_back(n ? *n : MCTSNode::cold_start());
    }
    return moves[ucb1_select(parent_visits, children)];
}

Move SearchTree::best_move(const GameState &game, bool log) const
{
    Move best = Move::pass();
    double best_value = std::numeric_limits<double>::lowest();
    for (const auto &m : game.legal_moves())
    {
        double value = evaluate(game.next(m));
        if (log && verbose)
        {
            std::ostringstream os;
            os << "MCTS: Considering Move " << m.to_string() << ", Value: " << value;
            log_comment(os.str());
        }
        if (value > best_value)
        {
            best_value = value;
            best = m;
        }
    }
    return best;
}

double SearchTree::evaluate(const GameState &game) const
{
    const MCTSNode *node = find(game.tree_key());
    const double visits = node ? node->visits : 0.0;
    const double win_ratio = node ? node->ratio() : 0.0;

    // game is the result of a move; score it for the player who made that move
    const Color mover = opponent_of(game.current_player);
    auto diff = [mover](std::pair<int, int> held) -> double
    {
        return mover == Color::Black ? held.first - held.second : held.second - held.first;
    };

    double value = 10.0 / (1.0 + std::exp(-visits));
    value += 10.0 * win_ratio;
    value += 2.0 * diff(game.corners_held());
    value += 1.5 * diff(game.edges_held());
    value += 1.75 * diff(game.diagonals_held());
    value += diff(game.center_4_held());
    value += diff(game.inner_board_held());
    value -= 1.5 * game.mobility();
    value -= diff(game.x_moves_held());
    return value;
}

bool SearchTree::is_leaf(const GameState &game) const
{
    if (game.is_over())
        return true;
    for (const auto &m : game.legal_moves())
    {
        if (contains(game.next(m).tree_key()))
            return false;
    }
    return true;
}

const MCTSNode *SearchTree::find(std::uint64_t key) const
{
    auto it = nodes.find(key);
    return it == nodes.end() ? nullptr : &it->second;
}

void SearchTree::clear()
{
    nodes.clear();
    search_iterations = 0;
}

MCTSEngine::MCTSEngine(const EngineConfig &config_, int seed_)
    : config(config_),
      tree(config_.exploration_factor, (std::uint32_t)seed_),
      budget(config_.max_time),
      seed((std::uint32_t)seed_),
      num_threads(std::max(1, (int)std::thread::hardware_concurrency())),
      verbose(config_.log && default_verbose())
{
    tree.set_verbose(verbose);
    if (verbose)
        log_comment(config.to_string());
}

Move MCTSEngine::choose_move(const GameState &root)
{
    if (root.legal_moves_mask() == 0)
        return Move::pass();

    const auto t_start = std::chrono::steady_clock::now();
    const double seconds = budget.time_for_turn(root.turn_number);
    const auto deadline = t_start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                        std::chrono::duration<double>(seconds));
    if (verbose)
    {
        std::ostringstream os;
        os << std::fixed << std::setprecision(3)
           << "MCTS: turn " << root.turn_number << " budget=" << seconds
           << "s remaining=" << budget.get_time_remaining() << "s";
        log_comment(os.str());
    }

    search_until(root, deadline);
    return pick_from_tree(root);
}

Move MCTSEngine::choose_move_for(const GameState &root, double seconds)
{
    if (root.legal_moves_mask() == 0)
        return Move::pass();
    if (!(seconds >= 0.0))
        throw std::invalid_argument("choose_move_for: seconds must be non-negative");

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(seconds));
    search_until(root, deadline);
    return pick_from_tree(root);
}

Move MCTSEngine::pick_from_tree(const GameState &root)
{
    auto legal = root.legal_moves();
    Move mv = tree.best_move(root, true);

    if (std::find(legal.begin(), legal.end(), mv) == legal.end())
    {
        if (verbose)
            log_comment("MCTS: Got illegal move from search! Sending first legal move.");
        return legal.empty() ? Move::pass() : legal.front();
    }

    if (verbose)
    {
        log_comment("MCTS: Total search iterations this game: " + std::to_string(search_iterations));
        log_comment("MCTS: Sending move: " + mv.to_string());
    }
    return mv;
}

void MCTSEngine::search_until(const GameState &root, std::chrono::steady_clock::time_point deadline)
{
    if (root.is_over())
        return;

    const int n = std::max(1, num_threads);
    const std::uint64_t base = (seed == 0) ? (std::uint64_t)std::random_device{}() : (std::uint64_t)seed;

    std::vector<SearchTree> trees;
    trees.reserve(n);
    for (int i = 0; i < n; ++i)
    {
        std::uint32_t s = (std::uint32_t)splitmix64(base ^ (round * 0x9e3779b97f4a7c15ULL) ^ (std::uint64_t)(i + 1));
        trees.emplace_back(config.exploration_factor, s == 0 ? 1u : s);
        trees.back().set_verbose(false);
    }
    round++;

    std::vector<std::uint64_t> counts(n, 0);
    std::vector<std::exception_ptr> errors(n);

    auto worker = [&](int i)
    {
        try
        {
            const GameState local_root = root;
            SearchTree &local_tree = trees[i];
            while (std::chrono::steady_clock::now() <= deadline)
            {
                local_tree.search(local_root);
                counts[i]++;
            }
        }
        catch (...)
        {
            errors[i] = std::current_exception();
        }
    };

    {
        std::vector<std::thread> workers;
        workers.reserve(n - 1);
        ThreadJoiner joiner(workers);
        for (int i = 1; i < n; ++i)
            workers.emplace_back(worker, i);
        worker(0);
    }

    for (auto &e : errors)
        if (e)
            std::rethrow_exception(e);

    std::uint64_t total = 0;
    for (int i = 0; i < n; ++i)
    {
        if (verbose)
            log_comment("MCTS: Thread " + std::to_string(i) + " completed " + std::to_string(counts[i]) + " iterations");
        total += counts[i];
        tree.merge(std::move(trees[i]));
    }
    search_iterations += total;

    if (verbose)
    {
        log_comment("MCTS: Total search iterations this turn: " + std::to_string(total));
        log_comment("MCTS: Tree size: " + std::to_string(tree.size()));
    }
}

std::vector<std::pair<Move, MCTSNode>> MCTSEngine::get_root_visit_stats(const GameState &root) const
{
    std::vector<std::pair<Move, MCTSNode>> out;
    for (const auto &m : root.legal_moves())
    {
        const MCTSNode *n = tree.find(root.next(m).tree_key());
        out.emplace_back(m, n ? *n : MCTSNode{});
    }
    return out;
}

void MCTSEngine::set_exploration_factor(double v)
{
    config.exploration_factor = v;
    tree.set_exploration_factor(v);
}

void MCTSEngine::set_verbose(bool v)
{
    verbose = v;
    tree.set_verbose(v);
}

void MCTSEngine::set_num_threads(int n)
{
    num_threads = (n > 0) ? n : std::max(1, (int)std::thread::hardware_concurrency());
}

void MCTSEngine::reset_search()
{
    tree.clear();
    budget.reset(config.max_time);
    search_iterations = 0;
    round = 0;
}
