#include "strategy/RuleAst.h"
#include <sstream>

namespace stratlab {
namespace strategy {

std::string toString(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::GE: return ">=";
        case ComparisonOp::LE: return "<=";
        case ComparisonOp::EQ: return "==";
        case ComparisonOp::NE: return "!=";
        case ComparisonOp::GT: return ">";
        case ComparisonOp::LT: return "<";
    }
    return "?";
}

std::string toString(ArithmeticOp op) {
    switch (op) {
        case ArithmeticOp::MUL: return "*";
        case ArithmeticOp::DIV: return "/";
        case ArithmeticOp::ADD: return "+";
        case ArithmeticOp::SUB: return "-";
    }
    return "?";
}

std::string toString(LogicalOp op) {
    switch (op) {
        case LogicalOp::AND: return "AND";
        case LogicalOp::OR: return "OR";
        case LogicalOp::NOT: return "NOT";
    }
    return "?";
}

std::string toString(Variable var) {
    switch (var) {
        case Variable::PRICE: return "price";
        case Variable::OPEN: return "open";
        case Variable::HIGH: return "high";
        case Variable::LOW: return "low";
        case Variable::CLOSE: return "close";
        case Variable::VOLUME: return "volume";
        case Variable::ENTRY_PRICE: return "entry_price";
    }
    return "?";
}

std::optional<Variable> variableFromName(const std::string& lower_name) {
    if (lower_name == "price") return Variable::PRICE;
    if (lower_name == "open") return Variable::OPEN;
    if (lower_name == "high") return Variable::HIGH;
    if (lower_name == "low") return Variable::LOW;
    if (lower_name == "close") return Variable::CLOSE;
    if (lower_name == "volume") return Variable::VOLUME;
    if (lower_name == "entry_price") return Variable::ENTRY_PRICE;
    return std::nullopt;
}

std::optional<PriceField> priceFieldOf(Variable var) {
    switch (var) {
        case Variable::PRICE:
        case Variable::CLOSE: return PriceField::CLOSE;
        case Variable::OPEN: return PriceField::OPEN;
        case Variable::HIGH: return PriceField::HIGH;
        case Variable::LOW: return PriceField::LOW;
        case Variable::VOLUME: return PriceField::VOLUME;
        case Variable::ENTRY_PRICE: return std::nullopt;
    }
    return std::nullopt;
}

bool IndicatorParam::operator==(const IndicatorParam& other) const {
    if (is_number != other.is_number) return false;
    return is_number ? number == other.number : token == other.token;
}

ExpressionPtr Expression::makeValue(double v) {
    auto e = std::make_shared<Expression>();
    e->type = Type::VALUE;
    e->value = v;
    return e;
}

ExpressionPtr Expression::makeVariable(Variable var) {
    auto e = std::make_shared<Expression>();
    e->type = Type::VARIABLE;
    e->variable = var;
    return e;
}

ExpressionPtr Expression::makeIndicator(analytics::IndicatorKind kind, std::vector<IndicatorParam> params) {
    auto e = std::make_shared<Expression>();
    e->type = Type::INDICATOR;
    e->indicator = kind;
    e->params = std::move(params);
    return e;
}

ExpressionPtr Expression::makeArithmetic(ArithmeticOp op, ExpressionPtr lhs, ExpressionPtr rhs) {
    auto e = std::make_shared<Expression>();
    e->type = Type::ARITHMETIC;
    e->op = op;
    e->left = std::move(lhs);
    e->right = std::move(rhs);
    return e;
}

bool equals(const Expression& a, const Expression& b) {
    if (a.type != b.type) return false;
    switch (a.type) {
        case Expression::Type::VALUE:
            return a.value == b.value;
        case Expression::Type::VARIABLE:
            return a.variable == b.variable;
        case Expression::Type::INDICATOR:
            return a.indicator == b.indicator && a.params == b.params;
        case Expression::Type::ARITHMETIC:
            return a.op == b.op && a.left && b.left && a.right && b.right &&
                   equals(*a.left, *b.left) && equals(*a.right, *b.right);
    }
    return false;
}

std::string toString(const Expression& expr) {
    std::ostringstream oss;
    switch (expr.type) {
        case Expression::Type::VALUE:
            oss << expr.value;
            break;
        case Expression::Type::VARIABLE:
            oss << toString(expr.variable);
            break;
        case Expression::Type::INDICATOR: {
            oss << analytics::indicatorName(expr.indicator) << "(";
            for (size_t i = 0; i < expr.params.size(); ++i) {
                if (i > 0) oss << ", ";
                if (expr.params[i].is_number) {
                    oss << expr.params[i].number;
                } else {
                    oss << expr.params[i].token;
                }
            }
            oss << ")";
            break;
        }
        case Expression::Type::ARITHMETIC:
            oss << "(" << (expr.left ? toString(*expr.left) : "?")
                << " " << toString(expr.op) << " "
                << (expr.right ? toString(*expr.right) : "?") << ")";
            break;
    }
    return oss.str();
}

RuleNode RuleNode::makeComparison(ComparisonOp op, ExpressionPtr lhs, ExpressionPtr rhs) {
    RuleNode node;
    node.type = Type::COMPARISON;
    node.comparison.op = op;
    node.comparison.left = std::move(lhs);
    node.comparison.right = std::move(rhs);
    return node;
}

RuleNode RuleNode::makeOperator(LogicalOp op) {
    RuleNode node;
    node.type = Type::OPERATOR;
    node.logical = op;
    return node;
}

bool equals(const RuleNode& a, const RuleNode& b) {
    if (a.type != b.type) return false;
    if (a.type == RuleNode::Type::OPERATOR) {
        return a.logical == b.logical;
    }
    const auto& ca = a.comparison;
    const auto& cb = b.comparison;
    return ca.op == cb.op && ca.left && cb.left && ca.right && cb.right &&
           equals(*ca.left, *cb.left) && equals(*ca.right, *cb.right);
}

bool equals(const RuleList& a, const RuleList& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!equals(a[i], b[i])) return false;
    }
    return true;
}

std::string toString(const RuleNode& node) {
    if (node.type == RuleNode::Type::OPERATOR) {
        return toString(node.logical);
    }
    const auto& c = node.comparison;
    return (c.left ? toString(*c.left) : "?") + " " + toString(c.op) + " " +
           (c.right ? toString(*c.right) : "?");
}

std::string toString(const RuleList& rules) {
    std::string out;
    for (const auto& node : rules) {
        if (!out.empty()) out += " ";
        out += toString(node);
    }
    return out;
}

} // namespace strategy
} // namespace stratlab
