// ============================================================================
// Token.hpp — Peças (agentes) e validação de posições
// ----------------------------------------------------------------------------
// - Uma peça por cor concreta (máx. 4); nunca duas peças na mesma célula.
// - validate_positions(): regras estruturais usadas pela pesquisa.
// - validate_start(): regras de início de jogo (acrescenta a proibição de
//   começar em cima de um refrator).
// - As posições pertencem ao chamador; o motor só trabalha com cópias.
// ============================================================================
#ifndef TOKEN_HPP
#define TOKEN_HPP

#pragma once
#include "Board.hpp"
#include "Constants.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct Token {
    Color color = Color::Red;
    Pos pos;

    bool operator==(const Token& o) const { return color == o.color && pos == o.pos; }
};

enum class PlacementIssueCode {
    OutsideBoard,
    InDeadZone,
    OnRefractor,
    Overlap,
    DuplicateColor,
    InvalidColor,
    TooManyTokens
};

struct PlacementIssue {
    PlacementIssueCode code;
    Color color;
    Pos pos;
    std::string message;
};

struct PlacementReport {
    std::vector<PlacementIssue> issues;

    bool ok() const { return issues.empty(); }
    bool has(PlacementIssueCode code) const;
    std::string summary() const;
};

// Erro recuperável de início de jogo; transporta o relatório completo.
class PlacementError : public std::invalid_argument {
public:
    explicit PlacementError(PlacementReport report)
        : std::invalid_argument(report.summary()), report_(std::move(report)) {}

    const PlacementReport& report() const { return report_; }

private:
    PlacementReport report_;
};

PlacementReport validate_positions(const Board& board, const std::vector<Token>& tokens);
PlacementReport validate_start(const Board& board, const std::vector<Token>& tokens);

// nullptr se não existir peça dessa cor.
const Token* find_token(const std::vector<Token>& tokens, Color color);

#endif // TOKEN_HPP
