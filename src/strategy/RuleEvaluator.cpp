#include "strategy/RuleEvaluator.h"
#include "strategy/RuleParser.h"
#include "common/Logger.h"

namespace stratlab {
namespace strategy {

namespace {

bool compare(ComparisonOp op, double lhs, double rhs) {
    if (isMissing(lhs) || isMissing(rhs)) {
        return false;
    }
    switch (op) {
        case ComparisonOp::GE: return lhs >= rhs;
        case ComparisonOp::LE: return lhs <= rhs;
        case ComparisonOp::EQ: return lhs == rhs;
        case ComparisonOp::NE: return lhs != rhs;
        case ComparisonOp::GT: return lhs > rhs;
        case ComparisonOp::LT: return lhs < rhs;
    }
    return false;
}

double apply(ArithmeticOp op, double lhs, double rhs) {
    switch (op) {
        case ArithmeticOp::MUL: return lhs * rhs;
        case ArithmeticOp::DIV: return lhs / rhs;
        case ArithmeticOp::ADD: return lhs + rhs;
        case ArithmeticOp::SUB: return lhs - rhs;
    }
    return missingValue();
}

} // namespace

analytics::IndicatorKey RuleEvaluator::indicatorKey(const Expression& expr) {
    std::vector<double> numbers;
    PriceField source = PriceField::CLOSE;
    for (const auto& param : expr.params) {
        if (param.is_number) {
            numbers.push_back(param.number);
            continue;
        }
        auto var = variableFromName(param.token);
        auto field = var ? priceFieldOf(*var) : std::nullopt;
        if (field) {
            source = *field;
        } else {
            LOG_DEBUG("Ignoring indicator argument '{}' in {}", param.token, toString(expr));
        }
    }

    if (!analytics::usesSourceSeries(expr.indicator)) {
        source = PriceField::CLOSE;
    }
    return analytics::IndicatorKey(expr.indicator,
                                   analytics::TechnicalIndicators::normalizeParams(expr.indicator, numbers),
                                   source);
}

Series RuleEvaluator::evaluateExpression(const Expression& expr,
                                         const analytics::IndicatorFrame& frame,
                                         const EvaluationContext& context) {
    const size_t n = frame.size();

    switch (expr.type) {
        case Expression::Type::VALUE:
            return Series(n, expr.value);

        case Expression::Type::VARIABLE: {
            if (expr.variable == Variable::ENTRY_PRICE) {
                return Series(n, context.entry_price ? *context.entry_price : missingValue());
            }
            auto field = priceFieldOf(expr.variable);
            return field ? frame.column(*field) : Series(n, missingValue());
        }

        case Expression::Type::INDICATOR:
            return frame.resolve(indicatorKey(expr));

        case Expression::Type::ARITHMETIC: {
            if (!expr.left || !expr.right) {
                return Series(n, missingValue());
            }
            const Series lhs = evaluateExpression(*expr.left, frame, context);
            const Series rhs = evaluateExpression(*expr.right, frame, context);
            Series out(n, missingValue());
            for (size_t i = 0; i < n; ++i) {
                out[i] = apply(expr.op, lhs[i], rhs[i]);
            }
            return out;
        }
    }
    return Series(n, missingValue());
}

SignalSeries RuleEvaluator::evaluateComparison(const Comparison& comparison,
                                               const analytics::IndicatorFrame& frame,
                                               const EvaluationContext& context) {
    const size_t n = frame.size();
    SignalSeries out(n, false);
    if (!comparison.left || !comparison.right) {
        return out;
    }

    const Series lhs = evaluateExpression(*comparison.left, frame, context);
    const Series rhs = evaluateExpression(*comparison.right, frame, context);
    for (size_t i = 0; i < n; ++i) {
        out[i] = compare(comparison.op, lhs[i], rhs[i]);
    }
    return out;
}

SignalSeries RuleEvaluator::evaluate(const RuleList& rules,
                                     const analytics::IndicatorFrame& frame,
                                     const EvaluationContext& context) {
    std::vector<SignalSeries> stack;
    std::optional<LogicalOp> pending;
    bool negate_next = false;

    auto combine = [&stack](LogicalOp op) {
        SignalSeries rhs = std::move(stack.back());
        stack.pop_back();
        SignalSeries& lhs = stack.back();
        for (size_t i = 0; i < lhs.size(); ++i) {
            lhs[i] = op == LogicalOp::AND ? (lhs[i] && rhs[i]) : (lhs[i] || rhs[i]);
        }
    };

    for (const auto& node : rules) {
        if (node.type == RuleNode::Type::COMPARISON) {
            stack.push_back(evaluateComparison(node.comparison, frame, context));
            if (negate_next) {
                stack.back().flip();
                negate_next = false;
            }
            if (pending && stack.size() >= 2) {
                combine(*pending);
            }
            pending.reset();
            continue;
        }

        if (node.logical == LogicalOp::NOT) {
            negate_next = !negate_next;
            continue;
        }
        // A second operator before the right operand replaces the first.
        if (!stack.empty()) {
            pending = node.logical;
        }
    }

    // Trailing NOT applies to the result so far
    if (negate_next && !stack.empty()) {
        stack.back().flip();
    }

    if (stack.empty()) {
        return SignalSeries(frame.size(), false);
    }
    return stack.front();
}

SignalSeries RuleEvaluator::evaluateText(const std::string& rules_text,
                                         const analytics::IndicatorFrame& frame,
                                         const EvaluationContext& context) {
    try {
        return evaluate(RuleParser::parseRules(rules_text), frame, context);
    } catch (const ParseError& e) {
        LOG_WARN("Rule parse failed, signal disabled: {}", e.what());
        return SignalSeries(frame.size(), false);
    }
}

bool RuleEvaluator::referencesEntryPrice(const Expression& expr) {
    switch (expr.type) {
        case Expression::Type::VARIABLE:
            return expr.variable == Variable::ENTRY_PRICE;
        case Expression::Type::ARITHMETIC:
            return (expr.left && referencesEntryPrice(*expr.left)) ||
                   (expr.right && referencesEntryPrice(*expr.right));
        case Expression::Type::VALUE:
        case Expression::Type::INDICATOR:
            return false;
    }
    return false;
}

bool RuleEvaluator::referencesEntryPrice(const RuleList& rules) {
    for (const auto& node : rules) {
        if (node.type != RuleNode::Type::COMPARISON) continue;
        const auto& c = node.comparison;
        if ((c.left && referencesEntryPrice(*c.left)) || (c.right && referencesEntryPrice(*c.right))) {
            return true;
        }
    }
    return false;
}

} // namespace strategy
} // namespace stratlab
