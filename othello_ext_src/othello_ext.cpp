#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "alphabeta.hpp"
#include "mcts.hpp"
#include "referee.hpp"

namespace py = pybind11;

PYBIND11_MODULE(othello_ext, m)
{
    m.doc() = "Othello/Reversi engine: bitboard rules, parallel MCTS, alpha-beta";

    py::register_exception<InvalidMoveError>(m, "InvalidMoveError", PyExc_ValueError);
    py::register_exception<GameOverError>(m, "GameOverError", PyExc_RuntimeError);

    py::enum_<Color>(m, "Color")
        .value("Black", Color::Black)
        .value("White", Color::White);

    py::class_<Move>(m, "Move")
        .def(py::init<>())
        .def_static("pass_", &Move::pass)
        .def_static("place", &Move::place, py::arg("cell"))
        .def_static("from_col_row", &Move::from_col_row, py::arg("col"), py::arg("row"))
        .def_readwrite("x", &Move::x)
        .def_readwrite("y", &Move::y)
        .def_readwrite("t", &Move::t)
        .def("is_pass", &Move::is_pass)
        .def("cell", &Move::cell)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__repr__", [](const Move &mv)
             {
            std::ostringstream os;
            os << "othello_ext.Move(" << mv.x << ", " << mv.y << ", '" << mv.t << "')";
            return os.str(); });

    py::class_<Board>(m, "Board")
        .def(py::init<>())
        .def_readwrite("black", &Board::black)
        .def_readwrite("white", &Board::white)
        .def("__str__", &Board::to_string);

    py::class_<GameState>(m, "GameState")
        .def(py::init<>())
        .def(py::init<const Board &, Color, int>(), py::arg("board"), py::arg("current_player"), py::arg("turn_number") = 0)
        .def_readonly("board", &GameState::board)
        .def_readonly("current_player", &GameState::current_player)
        .def_readonly("turn_number", &GameState::turn_number)
        .def("legal_moves", &GameState::legal_moves)
        .def("is_move_legal", &GameState::is_move_legal, py::arg("move"))
        .def("explain_illegal_move", &GameState::explain_illegal_move, py::arg("move"))
        .def("next", &GameState::next, py::arg("move"))
        .def("play", &GameState::play, py::arg("move"))
        .def("is_over", &GameState::is_over)
        .def("is_terminal", &GameState::is_terminal)
        .def("score", &GameState::score)
        .def("winner", &GameState::winner)
        .def("mobility", &GameState::mobility)
        .def("empty_squares", &GameState::empty_squares)
        .def("tree_key", &GameState::tree_key)
        .def("corners_held", &GameState::corners_held)
        .def("edges_held", &GameState::edges_held)
        .def("x_moves_held", &GameState::x_moves_held)
        .def("diagonals_held", &GameState::diagonals_held)
        .def("center_4_held", &GameState::center_4_held)
        .def("inner_board_held", &GameState::inner_board_held)
        .def("__str__", [](const GameState &g)
             { return g.board.to_string(); });

    py::class_<EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("max_time", &EngineConfig::max_time)
        .def_readwrite("log", &EngineConfig::log)
        .def_readwrite("exploration_factor", &EngineConfig::exploration_factor)
        .def("__repr__", &EngineConfig::to_string);

    m.def("load_config", &load_config, py::arg("path"));
    m.def("parse_config", &parse_config, py::arg("text"));

    py::class_<MCTSNode>(m, "MCTSNode")
        .def_readonly("visits", &MCTSNode::visits)
        .def_readonly("wins", &MCTSNode::wins);

    py::class_<SearchTree>(m, "SearchTree")
        .def(py::init<double, std::uint32_t>(), py::arg("exploration_factor") = DEFAULT_EXPLORATION_FACTOR, py::arg("seed") = 0)
        .def("search", &SearchTree::search, py::arg("root"), py::call_guard<py::gil_scoped_release>())
        .def("merge", [](SearchTree &self, SearchTree &other)
             { self.merge(std::move(other)); }, py::arg("other"))
        .def("best_move", &SearchTree::best_move, py::arg("game"), py::arg("log") = false)
        .def("evaluate", &SearchTree::evaluate, py::arg("game"))
        .def("node", [](const SearchTree &t, std::uint64_t key) -> std::optional<MCTSNode>
             {
            const MCTSNode *n = t.find(key);
            if (!n)
                return std::nullopt;
            return *n; }, py::arg("key"))
        .def("contains", &SearchTree::contains, py::arg("key"))
        .def("size", &SearchTree::size)
        .def("search_iterations", &SearchTree::get_search_iterations)
        .def("clear", &SearchTree::clear);

    py::class_<MCTSEngine>(m, "MCTSEngine")
        .def(py::init<const EngineConfig &, int>(), py::arg("config") = EngineConfig{}, py::arg("seed") = 0)
        .def("choose_move", &MCTSEngine::choose_move, py::arg("root"), py::call_guard<py::gil_scoped_release>())
        .def("choose_move_for", &MCTSEngine::choose_move_for, py::arg("root"), py::arg("seconds"), py::call_guard<py::gil_scoped_release>())
        .def("set_exploration_factor", &MCTSEngine::set_exploration_factor)
        .def("set_verbose", &MCTSEngine::set_verbose, py::arg("verbose"))
        .def("set_num_threads", &MCTSEngine::set_num_threads, py::arg("n"))
        .def("reset_search", &MCTSEngine::reset_search)
        .def("get_time_remaining", &MCTSEngine::get_time_remaining)
        .def("get_search_iterations", &MCTSEngine::get_search_iterations)
        .def("get_tree_size", [](const MCTSEngine &e)
             { return e.get_tree().size(); })
        .def("get_root_visit_stats", [](const MCTSEngine &e, const GameState &root)
             {
            // Each element is a dict: {"x": int, "y": int, "visits": float, "wins": float}
            py::list out;
            for (const auto &entry : e.get_root_visit_stats(root))
            {
                py::dict d;
                d["x"] = entry.first.x;
                d["y"] = entry.first.y;
                d["visits"] = entry.second.visits;
                d["wins"] = entry.second.wins;
                out.append(d);
            }
            return out; }, py::arg("root"));

    py::class_<AlphaBetaEngine>(m, "AlphaBetaEngine")
        .def(py::init<int, int>(), py::arg("max_depth") = 4, py::arg("time_limit_ms") = 100)
        .def("choose_move", &AlphaBetaEngine::choose_move, py::arg("root"), py::call_guard<py::gil_scoped_release>())
        .def("set_max_depth", &AlphaBetaEngine::set_max_depth)
        .def("set_time_limit_ms", &AlphaBetaEngine::set_time_limit_ms)
        .def("get_last_depth", &AlphaBetaEngine::get_last_depth)
        .def("get_nodes_searched", &AlphaBetaEngine::get_nodes_searched);

    py::module_ ref = m.def_submodule("referee", "Referee line protocol codec");
    ref.def("encode_move", &referee::encode_move, py::arg("color"), py::arg("move"));
    ref.def("decode_move", &referee::decode_move, py::arg("line"));
    ref.def("parse_init", &referee::parse_init, py::arg("line"));
    ref.def("is_move_line", &referee::is_move_line, py::arg("line"));
    ref.def("ready_line", &referee::ready_line, py::arg("color"));
    ref.def("comment_line", &referee::comment_line, py::arg("message"));
}
