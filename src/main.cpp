#include <iostream>
#include "Board.hpp"
#include "GameSession.hpp"
#include "LogMsgs.hpp"
#include "ModuleCatalogue.hpp"
#include "PathFinder.hpp"
#include "Token.hpp"
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>


//input helpers
static std::optional<int> get_flag_int(int argc, char* argv[], const std::string& shortf, const std::string& longf) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == shortf || a == longf) {
            if (i + 1 < argc) return std::stoi(argv[i + 1]);
        } else if (a.rfind(longf + "=", 0) == 0) {
            return std::stoi(a.substr(longf.size() + 1));
        }
    }
    return std::nullopt;
}

static std::optional<std::string> get_flag_str(int argc, char* argv[], const std::string& shortf, const std::string& longf) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == shortf || a == longf) {
            if (i + 1 < argc) return std::string(argv[i + 1]);
        } else if (a.rfind(longf + "=", 0) == 0) {
            return a.substr(longf.size() + 1);
        }
    }
    return std::nullopt;
}

// Primeiro argumento que não é flag nem valor de flag.
static std::optional<std::string> get_positional(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            if (a.find('=') == std::string::npos) ++i; // salta o valor
            continue;
        }
        if (a.size() > 1 && a[0] == '-') { ++i; continue; }
        return a;
    }
    return std::nullopt;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

static Pos parse_pos(const std::string& s) {
    auto xy = split(s, ',');
    if (xy.size() != 2) throw std::invalid_argument("bad cell '" + s + "' (expected x,y)");
    return Pos{std::stoi(xy[0]), std::stoi(xy[1])};
}

// "m:f,m:f,m:f,m:f" pela ordem TL, TR, BL, BR
static BoardConfig parse_board(const std::string& s) {
    auto quads = split(s, ',');
    if (quads.size() != 4) throw std::invalid_argument("board needs 4 module:face pairs");
    BoardConfig config{};
    for (std::size_t i = 0; i < 4; ++i) {
        auto mf = split(quads[i], ':');
        if (mf.size() != 2) throw std::invalid_argument("bad quadrant '" + quads[i] + "'");
        config[i] = {std::stoi(mf[0]), std::stoi(mf[1])};
    }
    return config;
}

// "red:1,1;blue:14,14"
static std::vector<Token> parse_tokens(const std::string& s) {
    std::vector<Token> tokens;
    for (const auto& item : split(s, ';')) {
        const auto colon = item.find(':');
        if (colon == std::string::npos) throw std::invalid_argument("bad token '" + item + "'");
        auto color = parse_color(item.substr(0, colon));
        if (!color) throw std::invalid_argument("unknown color in '" + item + "'");
        tokens.push_back({*color, parse_pos(item.substr(colon + 1))});
    }
    return tokens;
}

static std::vector<Token> default_tokens() {
    return {{Color::Red, {0, 0}}, {Color::Yellow, {15, 0}},
            {Color::Blue, {0, 15}}, {Color::Green, {15, 15}}};
}

//output helpers
static char token_char(Color c) {
    switch (c) {
        case Color::Red:    return 'R';
        case Color::Yellow: return 'Y';
        case Color::Blue:   return 'B';
        case Color::Green:  return 'G';
        default:            return '?';
    }
}

static void print_board(const Board& board, const std::vector<Token>& tokens) {
    std::cout << "\nTabuleiro:\n   ";
    for (int x = 0; x < BOARD_SIZE; ++x) std::cout << (x % 10) << " ";
    std::cout << "\n";

    for (int y = 0; y < BOARD_SIZE; ++y) {
        std::cout << (y < 10 ? " " : "") << y << "|";
        for (int x = 0; x < BOARD_SIZE; ++x) {
            const Cell& cell = board.get_cell(x, y);
            char c = '.';
            if (board.is_in_dead_zone(x, y)) c = '#';
            else if (cell.has_refractor()) c = to_char(cell.get_refractor()->orientation);
            else if (cell.has_goal()) c = 'o';
            for (const auto& t : tokens) {
                if (t.pos == Pos{x, y}) c = token_char(t.color);
            }
            std::cout << c << (cell.has_wall(Side::Right) ? '|' : ' ');
        }
        std::cout << "\n   ";
        for (int x = 0; x < BOARD_SIZE; ++x) {
            std::cout << (board.get_cell(x, y).has_wall(Side::Bottom) ? "--" : "  ");
        }
        std::cout << "\n";
    }
}

static void print_result(const SearchResult& r) {
    std::cout << "Resultado: " << to_string(r.status);
    if (r.ok()) std::cout << " em " << r.action_count << " ação(ões)";
    std::cout << " [estados: " << r.states_explored << ", " << r.elapsed_ms << " ms]\n";
    if (!r.ok() && !r.message.empty()) std::cout << "  " << r.message << "\n";
    for (std::size_t i = 0; i < r.actions.size(); ++i) {
        const auto& a = r.actions[i];
        std::cout << (i + 1 == r.actions.size() ? "└── " : "├── ")
                  << to_string(a.color) << " " << to_string(a.direction) << ": "
                  << to_string(a.from) << " -> " << to_string(a.to);
        if (a.segments.size() > 1) std::cout << " (" << a.segments.size() << " segmentos)";
        std::cout << "\n";
    }
}

static void print_goals(const std::vector<GoalOption>& goals) {
    for (std::size_t i = 0; i < goals.size(); ++i) {
        const auto& g = goals[i];
        std::cout << i << ": " << g.goal.id << " " << to_string(g.goal.color) << " "
                  << to_string(g.goal.shape) << " " << to_string(g.goal.pos) << " <- ";
        for (std::size_t k = 0; k < g.eligible.size(); ++k) {
            std::cout << (k ? "," : "") << to_string(g.eligible[k]);
        }
        std::cout << "\n";
    }
}

static void print_stats(const SessionStats& s) {
    std::cout << "\nRondas: " << s.rounds << "  ações: " << s.total_actions
              << "  média: " << s.average_actions << "\n";
    for (Color c : TOKEN_COLORS) {
        std::cout << "  " << to_string(c) << ": "
                  << s.rounds_per_color[static_cast<std::size_t>(index_of(c))] << "\n";
    }
}

static int run_solve(const Board& board, const std::vector<Token>& tokens,
                     int argc, char* argv[], const SearchOptions& options) {
    auto colorFlag = get_flag_str(argc, argv, "-c", "--color");
    auto goalFlag  = get_flag_str(argc, argv, "-g", "--goal");
    auto cellFlag  = get_flag_str(argc, argv, "-x", "--goal-cell");

    std::optional<Color> color = colorFlag ? parse_color(*colorFlag) : std::optional<Color>(Color::Red);
    if (!color) {
        std::cerr << "Erro: cor desconhecida '" << *colorFlag << "'.\n";
        return 1;
    }

    Pos goal;
    if (cellFlag) {
        goal = parse_pos(*cellFlag);
    } else if (goalFlag) {
        const Goal* g = board.find_goal(*goalFlag);
        if (!g) {
            std::cerr << "Erro: objetivo '" << *goalFlag << "' não existe.\n";
            return 1;
        }
        goal = g->pos;
    } else {
        std::cerr << "Erro: indicar --goal <id> ou --goal-cell x,y.\n";
        return 1;
    }

    print_board(board, tokens);
    SearchResult r = find_path(board, tokens, *color, goal, options);
    print_result(r);
    return r.ok() ? 0 : 2;
}

static int run_play(GameSession& session) {
    session.start();
    while (true) {
        print_board(session.get_board(), session.get_tokens());
        auto goals = session.available_goals();
        if (goals.empty()) {
            std::cout << "Sem objetivos livres.\n";
            break;
        }
        print_goals(goals);
        std::cout << "Escolhe um objetivo (q para terminar): ";
        std::string choice;
        if (!(std::cin >> choice) || choice == "q") break;

        std::size_t idx = 0;
        try {
            idx = static_cast<std::size_t>(std::stoul(choice));
        } catch (const std::exception&) {
            std::cout << "Entrada inválida.\n";
            continue;
        }
        if (idx >= goals.size() || goals[idx].eligible.empty()) {
            std::cout << "Entrada inválida.\n";
            continue;
        }
        const auto& option = goals[idx];

        Color color = option.eligible.front();
        if (option.eligible.size() > 1) {
            std::cout << "Cor da peça: ";
            std::string c;
            std::cin >> c;
            auto parsed = parse_color(c);
            if (!parsed) {
                std::cout << "Cor desconhecida.\n";
                continue;
            }
            color = *parsed;
        }

        try {
            SearchResult r = session.solve(option.goal.id, color);
            print_result(r);
            if (r.ok()) session.execute_round(option.goal.id, color, r);
        } catch (const std::invalid_argument& e) {
            std::cout << "Jogada recusada: " << e.what() << "\n";
        }
    }
    session.finish();
    print_stats(session.statistics());
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        int debug = get_flag_int(argc, argv, "-d", "--debug").value_or(0);
        auto maxStatesFlag = get_flag_int(argc, argv, "-m", "--max-states");
        auto boardFlag  = get_flag_str(argc, argv, "-b", "--board");
        auto tokensFlag = get_flag_str(argc, argv, "-t", "--tokens");

        std::string mode;
        if (auto p = get_positional(argc, argv)) {
            mode = *p;
        } else {
            std::cout << "1 - solve (uma pesquisa)\n";
            std::cout << "2 - goals (listar objetivos)\n";
            std::cout << "3 - play (rondas interativas)\n";
            std::cin >> mode;
            if (mode == "1") mode = "solve";
            else if (mode == "2") mode = "goals";
            else if (mode == "3") mode = "play";
        }

        SearchOptions options;
        options.debug_level = debug;
        if (maxStatesFlag) {
            if (*maxStatesFlag <= 0) throw std::invalid_argument("--max-states must be positive");
            options.max_states = static_cast<std::uint64_t>(*maxStatesFlag);
        }

        const BoardConfig config = boardFlag ? parse_board(*boardFlag)
                                             : BoardConfig{{{0, 0}, {2, 0}, {4, 0}, {6, 0}}};
        const std::vector<Token> tokens = tokensFlag ? parse_tokens(*tokensFlag) : default_tokens();

        Board board(config, standard_catalogue(), debug);

        if (mode == "solve") {
            PlacementReport report = validate_start(board, tokens);
            if (!report.ok()) throw PlacementError(report);
            return run_solve(board, tokens, argc, argv, options);
        }
        if (mode == "goals") {
            GameSession session(board, tokens, options);
            session.start();
            print_board(board, tokens);
            print_goals(session.available_goals());
            return 0;
        }
        if (mode == "play") {
            GameSession session(board, tokens, options);
            return run_play(session);
        }

        std::cerr << "Modo desconhecido '" << mode << "' (solve | goals | play).\n";
        return 1;
    } catch (const BoardConstructionError& e) {
        std::cerr << "Erro no tabuleiro: " << e.what() << "\n";
    } catch (const PlacementError& e) {
        std::cerr << "Colocação inválida:\n";
        for (const auto& issue : e.report().issues) std::cerr << "  - " << issue.message << "\n";
    } catch (const std::logic_error& e) {
        std::cerr << "Erro: " << e.what() << "\n";
    }
    return 1;
}
