#include "Token.hpp"
#include <sstream>

bool PlacementReport::has(PlacementIssueCode code) const {
    for (const auto& issue : issues) {
        if (issue.code == code) return true;
    }
    return false;
}

std::string PlacementReport::summary() const {
    if (issues.empty()) return "ok";
    std::ostringstream oss;
    for (std::size_t i = 0; i < issues.size(); ++i) {
        if (i) oss << "; ";
        oss << issues[i].message;
    }
    return oss.str();
}

namespace {
    void add_issue(PlacementReport& report, PlacementIssueCode code, const Token& t,
                   const std::string& what) {
        report.issues.push_back({code, t.color, t.pos,
                                 std::string(to_string(t.color)) + " token " + what +
                                 " at " + to_string(t.pos)});
    }
}

PlacementReport validate_positions(const Board& board, const std::vector<Token>& tokens) {
    PlacementReport report;

    if (tokens.size() > MAX_TOKENS) {
        report.issues.push_back({PlacementIssueCode::TooManyTokens, Color::Wildcard, Pos{},
                                 "at most " + std::to_string(MAX_TOKENS) + " tokens allowed"});
    }

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& t = tokens[i];

        if (!is_concrete(t.color)) {
            add_issue(report, PlacementIssueCode::InvalidColor, t, "has no concrete color");
        }
        if (!board.is_inside(t.pos.x, t.pos.y)) {
            add_issue(report, PlacementIssueCode::OutsideBoard, t, "is outside the board");
            continue;
        }
        if (board.is_in_dead_zone(t.pos.x, t.pos.y)) {
            add_issue(report, PlacementIssueCode::InDeadZone, t, "is inside the dead zone");
        }

        for (std::size_t j = 0; j < i; ++j) {
            if (tokens[j].color == t.color) {
                add_issue(report, PlacementIssueCode::DuplicateColor, t, "is duplicated");
            }
            if (tokens[j].pos == t.pos) {
                add_issue(report, PlacementIssueCode::Overlap, t, "overlaps another token");
            }
        }
    }
    return report;
}

PlacementReport validate_start(const Board& board, const std::vector<Token>& tokens) {
    PlacementReport report = validate_positions(board, tokens);
    for (const auto& t : tokens) {
        if (board.is_inside(t.pos.x, t.pos.y) && board.get_cell(t.pos).has_refractor()) {
            add_issue(report, PlacementIssueCode::OnRefractor, t, "cannot start on a refractor");
        }
    }
    return report;
}

const Token* find_token(const std::vector<Token>& tokens, Color color) {
    for (const auto& t : tokens) {
        if (t.color == color) return &t;
    }
    return nullptr;
}
