#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "strategy/RuleAst.h"
#include "strategy/Strategy.h"

namespace stratlab {
namespace strategy {

// Thrown for any rule text that does not parse; carries the offending fragment.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::string fragment)
        : std::runtime_error(message), fragment_(std::move(fragment)) {}

    const std::string& fragment() const { return fragment_; }

private:
    std::string fragment_;
};

struct ValidationResult {
    bool valid = true;
    std::string error;

    static ValidationResult ok() { return {true, ""}; }
    static ValidationResult fail(std::string message) { return {false, std::move(message)}; }
};

class RuleParser {
public:
    // Whitespace tokens; AND/OR/NOT (any case) split the text into clauses.
    // Empty or blank text yields an empty list.
    static RuleList parseRules(const std::string& rules_text);

    // "<expr> <op> <expr>" with the first operator found in the order
    // >=, <=, ==, !=, >, <.
    static RuleNode parseCondition(const std::string& condition);

    // Number, indicator call, variable, or a binary arithmetic split tried
    // in the order *, /, +, -.
    static ExpressionPtr parseExpression(const std::string& expr);

    static bool isNumericLiteral(const std::string& text);

    static ValidationResult validateStrategy(const Strategy& strategy);

    // Checks required fields and their types before validateStrategy().
    static ValidationResult validateStrategyDocument(const nlohmann::json& doc);
};

} // namespace strategy
} // namespace stratlab
