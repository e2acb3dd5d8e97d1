#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include "analytics/TechnicalIndicators.h"

namespace stratlab {
namespace strategy {

enum class ComparisonOp { GE, LE, EQ, NE, GT, LT };
enum class ArithmeticOp { MUL, DIV, ADD, SUB };
enum class LogicalOp { AND, OR, NOT };

// Bare names a rule can reference. PRICE reads the close column.
enum class Variable { PRICE, OPEN, HIGH, LOW, CLOSE, VOLUME, ENTRY_PRICE };

std::string toString(ComparisonOp op);
std::string toString(ArithmeticOp op);
std::string toString(LogicalOp op);
std::string toString(Variable var);

std::optional<Variable> variableFromName(const std::string& lower_name);

// Maps a variable to its OHLCV column; ENTRY_PRICE has none.
std::optional<PriceField> priceFieldOf(Variable var);

// Indicator argument: a number or a lowercase bare token.
struct IndicatorParam {
    bool is_number = true;
    double number = 0.0;
    std::string token;

    static IndicatorParam fromNumber(double v) { return {true, v, ""}; }
    static IndicatorParam fromToken(std::string t) { return {false, 0.0, std::move(t)}; }

    bool operator==(const IndicatorParam& other) const;
};

struct Expression;
using ExpressionPtr = std::shared_ptr<const Expression>;

// Immutable expression tree node.
struct Expression {
    enum class Type { VALUE, VARIABLE, INDICATOR, ARITHMETIC };

    Type type = Type::VALUE;

    double value = 0.0;                                                 // VALUE
    Variable variable = Variable::PRICE;                                // VARIABLE
    analytics::IndicatorKind indicator = analytics::IndicatorKind::SMA; // INDICATOR
    std::vector<IndicatorParam> params;                                 // INDICATOR
    ArithmeticOp op = ArithmeticOp::ADD;                                // ARITHMETIC
    ExpressionPtr left;
    ExpressionPtr right;

    static ExpressionPtr makeValue(double v);
    static ExpressionPtr makeVariable(Variable var);
    static ExpressionPtr makeIndicator(analytics::IndicatorKind kind, std::vector<IndicatorParam> params);
    static ExpressionPtr makeArithmetic(ArithmeticOp op, ExpressionPtr lhs, ExpressionPtr rhs);
};

bool equals(const Expression& a, const Expression& b);
std::string toString(const Expression& expr);

struct Comparison {
    ComparisonOp op = ComparisonOp::GT;
    ExpressionPtr left;
    ExpressionPtr right;
};

// One item of a parsed rule string, in source order.
struct RuleNode {
    enum class Type { COMPARISON, OPERATOR };

    Type type = Type::COMPARISON;
    Comparison comparison;               // COMPARISON
    LogicalOp logical = LogicalOp::AND;  // OPERATOR

    static RuleNode makeComparison(ComparisonOp op, ExpressionPtr lhs, ExpressionPtr rhs);
    static RuleNode makeOperator(LogicalOp op);
};

using RuleList = std::vector<RuleNode>;

bool equals(const RuleNode& a, const RuleNode& b);
bool equals(const RuleList& a, const RuleList& b);
std::string toString(const RuleNode& node);
std::string toString(const RuleList& rules);

} // namespace strategy
} // namespace stratlab
