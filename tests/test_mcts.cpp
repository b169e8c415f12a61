/**
 * Search tree and orchestrator tests
 *
 * Trees are seeded so every run walks the same playouts. Engines are built
 * with logging off so the comment channel stays quiet.
 */

#include <doctest/doctest.h>

#include "mcts.hpp"

#include <algorithm>
#include <atomic>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

static EngineConfig quiet_config(double max_time = DEFAULT_MAX_TIME)
{
    EngineConfig cfg;
    cfg.max_time = max_time;
    cfg.log = false;
    return cfg;
}

static GameState finished_game()
{
    Board b;
    b.black = 1ULL << 0;
    b.white = 1ULL << 2;
    return GameState(b, Color::Black, 12);
}

// ============================================================================
// Single tree
// ============================================================================

TEST_SUITE("SearchTree") {

    TEST_CASE("First search on an empty tree records the expanded child") {
        SearchTree tree(DEFAULT_EXPLORATION_FACTOR, 1);
        GameState root;

        tree.search(root);

        REQUIRE(tree.size() == 1);
        const GameState child = root.next(root.legal_moves().front());
        const MCTSNode *node = tree.find(child.tree_key());
        REQUIRE(node != nullptr);
        CHECK(node->visits == doctest::Approx(1.0));
        CHECK(node->wins >= 0.0);
        CHECK(node->wins <= 1.0);
        CHECK(tree.get_search_iterations() == 1);
        CHECK_FALSE(tree.contains(root.tree_key()));
    }

    TEST_CASE("Keys are never removed and visits never decrease") {
        SearchTree tree(DEFAULT_EXPLORATION_FACTOR, 3);
        GameState root;

        std::unordered_map<std::uint64_t, MCTSNode> previous;
        for (int i = 0; i < 25; ++i)
        {
            tree.search(root);
            for (const auto &kv : previous)
            {
                const MCTSNode *now = tree.find(kv.first);
                REQUIRE(now != nullptr);
                CHECK(now->visits >= kv.second.visits);
                CHECK(now->wins >= kv.second.wins);
            }
            for (const auto &kv : tree.get_nodes())
                CHECK(kv.second.wins <= kv.second.visits);
            previous = tree.get_nodes();
        }
        CHECK(tree.get_search_iterations() == 25);
    }

    TEST_CASE("Second search keys the root along with one new child") {
        SearchTree tree(DEFAULT_EXPLORATION_FACTOR, 2);
        GameState root;

        tree.search(root);
        REQUIRE(tree.size() == 1);

        tree.search(root);
        CHECK(tree.size() == 3);
        CHECK(tree.contains(root.tree_key()));
        CHECK(tree.find(root.tree_key())->visits == doctest::Approx(1.0));
    }

    TEST_CASE("Playouts are deterministic whatever the seed") {
        GameState root;
        SearchTree a(DEFAULT_EXPLORATION_FACTOR, 1);
        SearchTree b(DEFAULT_EXPLORATION_FACTOR, 987654);
        for (int i = 0; i < 30; ++i)
        {
            a.search(root);
            b.search(root);
        }

        REQUIRE(a.size() == b.size());
        for (const auto &kv : a.get_nodes())
        {
            const MCTSNode *other = b.find(kv.first);
            REQUIRE(other != nullptr);
            CHECK(other->visits == kv.second.visits);
            CHECK(other->wins == kv.second.wins);
        }
    }

    TEST_CASE("Searching a finished game does nothing") {
        SearchTree tree(DEFAULT_EXPLORATION_FACTOR, 5);
        tree.search(finished_game());
        CHECK(tree.size() == 0);
        CHECK(tree.get_search_iterations() == 0);
    }

    TEST_CASE("Unvisited positions are scored from the mover's side") {
        SearchTree tree;
        GameState root;
        GameState after = root.next(Move::from_col_row(3, 2));

        // sigmoid(0) * 10 + diagonals 1.75 * 2 + centre 2 + inner 3 - 1.5 * white mobility 3
        CHECK(tree.evaluate(after) == doctest::Approx(9.0));

        GameState mirrored(Board{after.board.white, after.board.black}, Color::Black, after.turn_number);
        CHECK(tree.evaluate(mirrored) == doctest::Approx(tree.evaluate(after)));
    }

    TEST_CASE("best_move always returns a legal move") {
        SearchTree tree(DEFAULT_EXPLORATION_FACTOR, 13);
        GameState root;
        for (int i = 0; i < 10; ++i)
            tree.search(root);
        Move m = tree.best_move(root);
        CHECK(root.is_move_legal(m));
        CHECK_FALSE(m.is_pass());

        CHECK(tree.best_move(finished_game()).is_pass());
    }

    TEST_CASE("clear drops every statistic") {
        SearchTree tree(DEFAULT_EXPLORATION_FACTOR, 17);
        tree.search(GameState());
        tree.clear();
        CHECK(tree.size() == 0);
        CHECK(tree.get_search_iterations() == 0);
    }
}

// ============================================================================
// UCB1
// ============================================================================

TEST_SUITE("UCB1 selection") {

    TEST_CASE("Cold start is one visit and half a win") {
        MCTSNode n = MCTSNode::cold_start();
        CHECK(n.visits == doctest::Approx(1.0));
        CHECK(n.wins == doctest::Approx(0.5));
        CHECK(n.ratio() == doctest::Approx(0.5));
        CHECK(MCTSNode{}.ratio() == doctest::Approx(0.0));
    }

    TEST_CASE("Ties go to the first candidate") {
        SearchTree tree;
        std::vector<MCTSNode> children(5, MCTSNode::cold_start());
        CHECK(tree.ucb1_select(1.0, children) == 0);
        CHECK(tree.ucb1_select(40.0, children) == 0);

        children[3] = MCTSNode{1.0, 1.0};
        children[4] = MCTSNode{1.0, 1.0};
        CHECK(tree.ucb1_select(1.0, children) == 3);
    }

    TEST_CASE("The selected score is the maximum under every ordering") {
        SearchTree tree;
        const std::vector<MCTSNode> base = {{2.0, 1.0}, {5.0, 3.0}, {1.0, 1.0}, {10.0, 2.0}};

        std::vector<std::size_t> order(base.size());
        std::iota(order.begin(), order.end(), 0);

        double expected = 0.0;
        for (const auto &n : base)
            expected = std::max(expected, tree.ucb1_score(20.0, n));

        do
        {
            std::vector<MCTSNode> children;
            for (std::size_t i : order)
                children.push_back(base[i]);
            std::size_t pick = tree.ucb1_select(20.0, children);
            CHECK(tree.ucb1_score(20.0, children[pick]) == expected);
        } while (std::next_permutation(order.begin(), order.end()));
    }

    TEST_CASE("Exploration favours rarely visited children") {
        SearchTree tree(2.0);
        MCTSNode often{100.0, 60.0};
        MCTSNode rarely{2.0, 1.0};
        CHECK(tree.ucb1_score(102.0, rarely) > tree.ucb1_score(102.0, often));

        tree.set_exploration_factor(0.0);
        CHECK(tree.ucb1_score(102.0, often) > tree.ucb1_score(102.0, rarely));
    }

    TEST_CASE("Zero visits are scored as one") {
        SearchTree tree;
        MCTSNode empty{};
        CHECK(tree.ucb1_score(10.0, empty) == doctest::Approx(tree.ucb1_score(10.0, MCTSNode{1.0, 0.0})));
    }
}

// ============================================================================
// Merging
// ============================================================================

TEST_SUITE("Merging trees") {

    TEST_CASE("Statistics are summed per key and the donor is emptied") {
        GameState root;
        SearchTree a(DEFAULT_EXPLORATION_FACTOR, 21);
        SearchTree b(DEFAULT_EXPLORATION_FACTOR, 22);
        for (int i = 0; i < 12; ++i)
        {
            a.search(root);
            b.search(root);
        }

        auto expected = a.get_nodes();
        for (const auto &kv : b.get_nodes())
        {
            expected[kv.first].visits += kv.second.visits;
            expected[kv.first].wins += kv.second.wins;
        }

        a.merge(std::move(b));

        CHECK(a.size() == expected.size());
        for (const auto &kv : expected)
        {
            const MCTSNode *n = a.find(kv.first);
            REQUIRE(n != nullptr);
            CHECK(n->visits == doctest::Approx(kv.second.visits));
            CHECK(n->wins == doctest::Approx(kv.second.wins));
        }
        CHECK(a.get_search_iterations() == 24);
        CHECK(b.size() == 0);
        CHECK(b.get_search_iterations() == 0);
    }

    TEST_CASE("Merging into an empty tree copies the donor") {
        SearchTree donor(DEFAULT_EXPLORATION_FACTOR, 31);
        for (int i = 0; i < 6; ++i)
            donor.search(GameState());
        const auto snapshot = donor.get_nodes();

        SearchTree target(DEFAULT_EXPLORATION_FACTOR, 32);
        target.merge(std::move(donor));

        CHECK(target.size() == snapshot.size());
        for (const auto &kv : snapshot)
        {
            REQUIRE(target.contains(kv.first));
            CHECK(target.find(kv.first)->visits == doctest::Approx(kv.second.visits));
        }
    }

    TEST_CASE("Merging an empty donor leaves the target unchanged") {
        SearchTree target(DEFAULT_EXPLORATION_FACTOR, 41);
        for (int i = 0; i < 6; ++i)
            target.search(GameState());
        const auto snapshot = target.get_nodes();

        SearchTree empty(DEFAULT_EXPLORATION_FACTOR, 42);
        target.merge(std::move(empty));

        CHECK(target.size() == snapshot.size());
        for (const auto &kv : snapshot)
            CHECK(target.find(kv.first)->visits == doctest::Approx(kv.second.visits));
        CHECK(target.get_search_iterations() == 6);
    }
}

// ============================================================================
// Engine
// ============================================================================

TEST_SUITE("MCTSEngine") {

    TEST_CASE("Timed search returns a legal move") {
        MCTSEngine engine(quiet_config(), 7);
        engine.set_num_threads(2);
        GameState root;

        Move m = engine.choose_move_for(root, 0.05);

        CHECK(root.is_move_legal(m));
        CHECK_FALSE(m.is_pass());
        CHECK(engine.get_search_iterations() >= 1);
        CHECK(engine.get_search_iterations() == engine.get_tree().get_search_iterations());
        CHECK(engine.get_tree().size() > 0);
    }

    TEST_CASE("Worker trees are folded into the engine tree") {
        MCTSEngine engine(quiet_config(), 9);
        engine.set_num_threads(3);
        CHECK(engine.get_num_threads() == 3);
        GameState root;

        engine.search_until(root, std::chrono::steady_clock::now() + std::chrono::milliseconds(100));
        const auto first = engine.get_search_iterations();
        CHECK(first >= 1);

        engine.search_until(root, std::chrono::steady_clock::now() + std::chrono::milliseconds(100));
        CHECK(engine.get_search_iterations() > first);

        // A cold root child picked by UCB1 is itself a leaf, so its expanded
        // grandchild takes the visit instead.
        const double iterations = (double)engine.get_search_iterations();
        double child_visits = 0.0;
        for (const auto &entry : engine.get_root_visit_stats(root))
            child_visits += entry.second.visits;
        CHECK(child_visits > 0.0);
        CHECK(child_visits <= iterations);

        // The root is on the path of every search except the first one of each
        // worker tree: three workers over two rounds.
        const MCTSNode *root_node = engine.get_tree().find(root.tree_key());
        REQUIRE(root_node != nullptr);
        CHECK(root_node->visits <= iterations);
        CHECK(root_node->visits >= iterations - 6.0);
    }

    TEST_CASE("No legal moves means pass") {
        MCTSEngine engine(quiet_config(), 3);

        Board b;
        b.black = 1ULL << 0;
        b.white = 1ULL << 1;
        GameState stuck(b, Color::White, 20);
        REQUIRE_FALSE(stuck.is_over());

        CHECK(engine.choose_move(stuck).is_pass());
        CHECK(engine.choose_move(finished_game()).is_pass());
        CHECK(engine.get_time_remaining() == doctest::Approx(DEFAULT_MAX_TIME));
    }

    TEST_CASE("Each turn spends its share of the game budget") {
        MCTSEngine engine(quiet_config(1.0), 5);
        engine.set_num_threads(1);
        GameState root;

        Move m = engine.choose_move(root);

        CHECK(root.is_move_legal(m));
        CHECK(engine.get_time_remaining() == doctest::Approx(1.0 - TIME_ALLOCATIONS[0]));
    }

    TEST_CASE("reset_search restores the budget and empties the tree") {
        MCTSEngine engine(quiet_config(2.0), 5);
        engine.set_num_threads(1);
        engine.choose_move(GameState());
        engine.reset_search();

        CHECK(engine.get_tree().size() == 0);
        CHECK(engine.get_search_iterations() == 0);
        CHECK(engine.get_time_remaining() == doctest::Approx(2.0));
    }

    TEST_CASE("Exploration factor reaches the tree") {
        MCTSEngine engine(quiet_config(), 1);
        engine.set_exploration_factor(0.5);
        CHECK(engine.get_config().exploration_factor == doctest::Approx(0.5));
        CHECK(engine.get_tree().get_exploration_factor() == doctest::Approx(0.5));
    }

    TEST_CASE("Started workers are joined when the spawn loop throws") {
        std::atomic<int> finished{0};
        bool caught = false;
        try
        {
            std::vector<std::thread> workers;
            ThreadJoiner joiner(workers);
            for (int i = 0; i < 3; ++i)
                workers.emplace_back([&finished]
                                     {
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    finished++; });
            throw std::runtime_error("spawn failed");
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        CHECK(caught);
        CHECK(finished.load() == 3);
    }

    TEST_CASE("Negative search time is rejected") {
        MCTSEngine engine(quiet_config(), 1);
        CHECK_THROWS_AS(engine.choose_move_for(GameState(), -1.0), std::invalid_argument);
    }
}
