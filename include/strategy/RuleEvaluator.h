#pragma once

#include <optional>
#include <string>
#include "analytics/IndicatorFrame.h"
#include "strategy/RuleAst.h"

namespace stratlab {
namespace strategy {

struct EvaluationContext {
    // Bound while evaluating exit rules for an open position.
    std::optional<double> entry_price;
};

class RuleEvaluator {
public:
    // Strict left-to-right reduction with no precedence: each AND/OR combines
    // the result so far with the comparison that follows it, so
    // "A AND B OR C" is "(A AND B) OR C". NOT negates the comparison after it.
    // Operators lacking an operand are ignored; no comparisons means all false.
    static SignalSeries evaluate(const RuleList& rules,
                                 const analytics::IndicatorFrame& frame,
                                 const EvaluationContext& context = {});

    // Missing operands compare false for every operator, including !=.
    static SignalSeries evaluateComparison(const Comparison& comparison,
                                           const analytics::IndicatorFrame& frame,
                                           const EvaluationContext& context = {});

    static Series evaluateExpression(const Expression& expr,
                                     const analytics::IndicatorFrame& frame,
                                     const EvaluationContext& context = {});

    // Parse + evaluate. Unparseable text is logged and yields all false.
    static SignalSeries evaluateText(const std::string& rules_text,
                                     const analytics::IndicatorFrame& frame,
                                     const EvaluationContext& context = {});

    static bool referencesEntryPrice(const RuleList& rules);
    static bool referencesEntryPrice(const Expression& expr);

    // Column key for an INDICATOR expression: numeric arguments become the
    // parameters (defaults filled in), a price-variable token selects the source.
    static analytics::IndicatorKey indicatorKey(const Expression& expr);
};

} // namespace strategy
} // namespace stratlab
