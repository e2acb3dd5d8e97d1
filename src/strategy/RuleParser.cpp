#include "strategy/RuleParser.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>
#include <regex>
#include <sstream>
#include <utility>

namespace stratlab {
namespace strategy {

namespace {

const std::regex& numberPattern() {
    static const std::regex re(R"(^[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?$)");
    return re;
}

// Fragments a user most likely meant as a number.
const std::regex& numberLikePattern() {
    static const std::regex re(R"(^[+-]?(\d|\.\d)[0-9.eE+-]*$|^[+-]?(inf|infinity|nan)$)",
                               std::regex::icase);
    return re;
}

const std::regex& callPattern() {
    static const std::regex re(R"(^(\w+)\(([^()]*)\)$)");
    return re;
}

const std::regex& callPrefixPattern() {
    static const std::regex re(R"(^\w+\()");
    return re;
}

const std::regex& identifierPattern() {
    static const std::regex re(R"(^[A-Za-z_]\w*$)");
    return re;
}

std::string trim(const std::string& s) {
    const auto begin = std::find_if_not(s.begin(), s.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto end = std::find_if_not(s.rbegin(), s.rend(),
                                      [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::optional<LogicalOp> logicalFromWord(const std::string& word) {
    const std::string upper = toUpper(word);
    if (upper == "AND") return LogicalOp::AND;
    if (upper == "OR") return LogicalOp::OR;
    if (upper == "NOT") return LogicalOp::NOT;
    return std::nullopt;
}

std::optional<double> parseNumber(const std::string& text) {
    if (!std::regex_match(text, numberPattern())) {
        return std::nullopt;
    }
    const double v = std::strtod(text.c_str(), nullptr);
    if (!std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

bool looksNumeric(const std::string& text) {
    return std::regex_match(text, numberLikePattern());
}

// Code points, not bytes
size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

bool isBlank(const std::string& s) {
    return trim(s).empty();
}

std::vector<IndicatorParam> parseArguments(const std::string& args, const std::string& call) {
    std::vector<IndicatorParam> params;
    if (isBlank(args)) {
        return params;
    }

    std::stringstream ss(args);
    std::string part;
    std::vector<std::string> parts;
    while (std::getline(ss, part, ',')) {
        parts.push_back(part);
    }
    if (!args.empty() && args.back() == ',') {
        parts.push_back("");
    }

    for (const auto& raw : parts) {
        const std::string arg = trim(raw);
        if (arg.empty()) {
            throw ParseError("Empty argument in indicator call: " + call, call);
        }
        if (auto number = parseNumber(arg)) {
            params.push_back(IndicatorParam::fromNumber(*number));
        } else if (std::regex_match(arg, identifierPattern())) {
            params.push_back(IndicatorParam::fromToken(toLower(arg)));
        } else if (looksNumeric(arg)) {
            throw ParseError("Malformed numeric literal: " + arg, arg);
        } else {
            throw ParseError("Invalid indicator argument: " + arg, arg);
        }
    }
    return params;
}

// Trimmed sub-expressions already tried within one parseExpression() call.
// The arithmetic fallback revisits the same substrings many times.
struct ExpressionMemo {
    std::map<std::string, ExpressionPtr> parsed;
    std::map<std::string, ParseError> failed;
};

ExpressionPtr parseMemoized(const std::string& raw_expr, ExpressionMemo& memo);

ExpressionPtr parseUncached(const std::string& expr, ExpressionMemo& memo) {
    if (auto number = parseNumber(expr)) {
        return Expression::makeValue(*number);
    }

    std::smatch match;
    if (std::regex_match(expr, match, callPattern())) {
        const std::string name = toLower(match[1].str());
        auto kind = analytics::indicatorFromName(name);
        if (!kind) {
            throw ParseError("Unknown indicator: " + name, expr);
        }
        return Expression::makeIndicator(*kind, parseArguments(match[2].str(), expr));
    }

    if (std::regex_search(expr, callPrefixPattern()) && expr.find(')') == std::string::npos) {
        throw ParseError("Unmatched function-call syntax: " + expr, expr);
    }

    if (auto var = variableFromName(toLower(expr))) {
        return Expression::makeVariable(*var);
    }

    static const std::pair<char, ArithmeticOp> kArithmetic[] = {
        {'*', ArithmeticOp::MUL},
        {'/', ArithmeticOp::DIV},
        {'+', ArithmeticOp::ADD},
        {'-', ArithmeticOp::SUB},
    };
    for (const auto& [symbol, op] : kArithmetic) {
        size_t pos = expr.find(symbol);
        while (pos != std::string::npos) {
            try {
                auto lhs = parseMemoized(expr.substr(0, pos), memo);
                auto rhs = parseMemoized(expr.substr(pos + 1), memo);
                return Expression::makeArithmetic(op, std::move(lhs), std::move(rhs));
            } catch (const ParseError&) {
                pos = expr.find(symbol, pos + 1);
            }
        }
    }

    if (looksNumeric(expr)) {
        throw ParseError("Malformed numeric literal: " + expr, expr);
    }
    throw ParseError("Invalid expression: " + expr, expr);
}

ExpressionPtr parseMemoized(const std::string& raw_expr, ExpressionMemo& memo) {
    const std::string expr = trim(raw_expr);

    auto parsed = memo.parsed.find(expr);
    if (parsed != memo.parsed.end()) {
        return parsed->second;
    }
    auto failed = memo.failed.find(expr);
    if (failed != memo.failed.end()) {
        throw failed->second;
    }

    try {
        auto result = parseUncached(expr, memo);
        memo.parsed.emplace(expr, result);
        return result;
    } catch (const ParseError& e) {
        memo.failed.emplace(expr, e);
        throw;
    }
}

} // namespace

bool RuleParser::isNumericLiteral(const std::string& text) {
    return parseNumber(trim(text)).has_value();
}

ExpressionPtr RuleParser::parseExpression(const std::string& expr) {
    ExpressionMemo memo;
    return parseMemoized(expr, memo);
}

RuleNode RuleParser::parseCondition(const std::string& raw_condition) {
    const std::string condition = trim(raw_condition);

    static const std::pair<const char*, ComparisonOp> kComparison[] = {
        {">=", ComparisonOp::GE},
        {"<=", ComparisonOp::LE},
        {"==", ComparisonOp::EQ},
        {"!=", ComparisonOp::NE},
        {">", ComparisonOp::GT},
        {"<", ComparisonOp::LT},
    };
    for (const auto& [symbol, op] : kComparison) {
        const size_t pos = condition.find(symbol);
        if (pos == std::string::npos) {
            continue;
        }
        const size_t len = std::char_traits<char>::length(symbol);
        auto lhs = parseExpression(condition.substr(0, pos));
        auto rhs = parseExpression(condition.substr(pos + len));
        return RuleNode::makeComparison(op, std::move(lhs), std::move(rhs));
    }

    throw ParseError("Invalid condition: " + condition, condition);
}

RuleList RuleParser::parseRules(const std::string& rules_text) {
    std::vector<std::string> tokens;
    std::vector<std::string> current;

    auto flush = [&]() {
        if (current.empty()) return;
        std::string joined;
        for (const auto& w : current) {
            if (!joined.empty()) joined += ' ';
            joined += w;
        }
        tokens.push_back(joined);
        current.clear();
    };

    std::istringstream iss(rules_text);
    std::string word;
    while (iss >> word) {
        if (logicalFromWord(word)) {
            flush();
            tokens.push_back(toUpper(word));
        } else {
            current.push_back(word);
        }
    }
    flush();

    RuleList rules;
    rules.reserve(tokens.size());
    for (const auto& token : tokens) {
        if (auto op = logicalFromWord(token)) {
            rules.push_back(RuleNode::makeOperator(*op));
            continue;
        }
        try {
            rules.push_back(parseCondition(token));
        } catch (const ParseError& e) {
            throw ParseError("Error parsing condition '" + token + "': " + e.what(), e.fragment());
        }
    }
    return rules;
}

ValidationResult RuleParser::validateStrategy(const Strategy& strategy) {
    const size_t name_len = utf8Length(strategy.name);
    if (name_len == 0 || name_len > 100) {
        return ValidationResult::fail("Strategy name must be 1-100 characters");
    }

    try {
        if (!isBlank(strategy.entry_rules)) {
            parseRules(strategy.entry_rules);
        }
    } catch (const ParseError& e) {
        return ValidationResult::fail(std::string("Invalid entry rules: ") + e.what());
    }

    try {
        if (!isBlank(strategy.exit_rules)) {
            parseRules(strategy.exit_rules);
        }
    } catch (const ParseError& e) {
        return ValidationResult::fail(std::string("Invalid exit rules: ") + e.what());
    }

    const auto& rm = strategy.risk_management;
    if (rm.stop_loss_pct && !(*rm.stop_loss_pct > 0.0 && *rm.stop_loss_pct <= 100.0)) {
        return ValidationResult::fail("Stop loss percentage must be between 0 and 100");
    }
    if (rm.take_profit_pct && !(*rm.take_profit_pct > 0.0 && *rm.take_profit_pct <= 1000.0)) {
        return ValidationResult::fail("Take profit percentage must be between 0 and 1000");
    }
    if (rm.trailing_stop) {
        if (!rm.trailing_stop_pct || !(*rm.trailing_stop_pct > 0.0 && *rm.trailing_stop_pct <= 100.0)) {
            return ValidationResult::fail("Trailing stop percentage must be between 0 and 100");
        }
    }

    return ValidationResult::ok();
}

ValidationResult RuleParser::validateStrategyDocument(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return ValidationResult::fail("Strategy document must be an object");
    }

    for (const char* field : {"name", "entry_rules", "exit_rules"}) {
        if (!doc.contains(field)) {
            return ValidationResult::fail(std::string("Missing required field: ") + field);
        }
        if (!doc[field].is_string()) {
            return ValidationResult::fail(std::string("Field '") + field + "' must be a string");
        }
    }

    if (doc.contains("position_sizing")) {
        const auto& ps = doc["position_sizing"];
        if (!ps.is_object() || !ps.contains("method")) {
            return ValidationResult::fail("Position sizing method not specified");
        }
        const std::string method = ps["method"].is_string() ? ps["method"].get<std::string>() : ps["method"].dump();
        if (!sizingMethodFromString(method)) {
            return ValidationResult::fail("Invalid position sizing method: " + method);
        }
        if (ps.contains("value") && !ps["value"].is_number()) {
            return ValidationResult::fail("Position sizing value must be a number");
        }
    }

    if (doc.contains("risk_management")) {
        const auto& rm = doc["risk_management"];
        if (!rm.is_object()) {
            return ValidationResult::fail("risk_management must be an object");
        }
        for (const char* field : {"stop_loss_pct", "take_profit_pct", "trailing_stop_pct"}) {
            if (rm.contains(field) && !rm[field].is_null() && !rm[field].is_number()) {
                return ValidationResult::fail(std::string("Field '") + field + "' must be a number");
            }
        }
        if (rm.contains("trailing_stop") && !rm["trailing_stop"].is_null() && !rm["trailing_stop"].is_boolean()) {
            return ValidationResult::fail("Field 'trailing_stop' must be a boolean");
        }
    }

    try {
        return validateStrategy(strategyFromJson(doc));
    } catch (const nlohmann::json::exception& e) {
        return ValidationResult::fail(std::string("Malformed strategy document: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return ValidationResult::fail(e.what());
    }
}

} // namespace strategy
} // namespace stratlab
