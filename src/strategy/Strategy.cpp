#include "strategy/Strategy.h"
#include <stdexcept>

namespace stratlab {
namespace strategy {

namespace {
std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

std::string stringOrEmpty(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::string();
    }
    return j[key].get<std::string>();
}
}

std::string toString(SizingMethod method) {
    switch (method) {
        case SizingMethod::FIXED: return "fixed";
        case SizingMethod::PERCENTAGE: return "percentage";
        case SizingMethod::RISK_BASED: return "risk_based";
    }
    return "percentage";
}

std::optional<SizingMethod> sizingMethodFromString(const std::string& value) {
    if (value == "fixed") return SizingMethod::FIXED;
    if (value == "percentage") return SizingMethod::PERCENTAGE;
    if (value == "risk_based") return SizingMethod::RISK_BASED;
    return std::nullopt;
}

bool operator==(const Strategy& a, const Strategy& b) {
    return a.name == b.name &&
           a.description == b.description &&
           a.entry_rules == b.entry_rules &&
           a.exit_rules == b.exit_rules &&
           a.position_sizing.method == b.position_sizing.method &&
           a.position_sizing.value == b.position_sizing.value &&
           a.risk_management.stop_loss_pct == b.risk_management.stop_loss_pct &&
           a.risk_management.take_profit_pct == b.risk_management.take_profit_pct &&
           a.risk_management.trailing_stop == b.risk_management.trailing_stop &&
           a.risk_management.trailing_stop_pct == b.risk_management.trailing_stop_pct;
}

bool operator!=(const Strategy& a, const Strategy& b) {
    return !(a == b);
}

Strategy createDefaultStrategy() {
    Strategy s;
    s.name = "New Strategy";
    s.description = "";
    s.entry_rules = "rsi(14) < 30 AND price > sma(200)";
    s.exit_rules = "rsi(14) > 70 OR price < entry_price * 0.95";
    s.position_sizing.method = SizingMethod::PERCENTAGE;
    s.position_sizing.value = 10.0;
    s.risk_management.stop_loss_pct = 5.0;
    s.risk_management.take_profit_pct = 15.0;
    s.risk_management.trailing_stop = false;
    return s;
}

nlohmann::json toJson(const Strategy& strategy) {
    nlohmann::json j;
    j["name"] = strategy.name;
    j["description"] = strategy.description;
    j["entry_rules"] = strategy.entry_rules;
    j["exit_rules"] = strategy.exit_rules;
    j["position_sizing"] = {
        {"method", toString(strategy.position_sizing.method)},
        {"value", strategy.position_sizing.value}
    };

    nlohmann::json risk;
    const auto& rm = strategy.risk_management;
    if (rm.stop_loss_pct) risk["stop_loss_pct"] = *rm.stop_loss_pct;
    if (rm.take_profit_pct) risk["take_profit_pct"] = *rm.take_profit_pct;
    risk["trailing_stop"] = rm.trailing_stop;
    if (rm.trailing_stop_pct) risk["trailing_stop_pct"] = *rm.trailing_stop_pct;
    j["risk_management"] = risk;
    return j;
}

Strategy strategyFromJson(const nlohmann::json& j) {
    Strategy s;
    s.name = stringOrEmpty(j, "name");
    s.description = stringOrEmpty(j, "description");
    s.entry_rules = stringOrEmpty(j, "entry_rules");
    s.exit_rules = stringOrEmpty(j, "exit_rules");

    if (j.contains("position_sizing") && j["position_sizing"].is_object()) {
        const auto& ps = j["position_sizing"];
        std::string method = stringOrEmpty(ps, "method");
        if (method.empty()) method = "percentage";
        auto parsed = sizingMethodFromString(method);
        if (!parsed) {
            throw std::invalid_argument("Invalid position sizing method: " + method);
        }
        s.position_sizing.method = *parsed;
        s.position_sizing.value = optionalNumber(ps, "value").value_or(10.0);
    }

    if (j.contains("risk_management") && j["risk_management"].is_object()) {
        const auto& rm = j["risk_management"];
        s.risk_management.stop_loss_pct = optionalNumber(rm, "stop_loss_pct");
        s.risk_management.take_profit_pct = optionalNumber(rm, "take_profit_pct");
        s.risk_management.trailing_stop = rm.contains("trailing_stop") && !rm["trailing_stop"].is_null()
            ? rm["trailing_stop"].get<bool>() : false;
        s.risk_management.trailing_stop_pct = optionalNumber(rm, "trailing_stop_pct");
    }
    return s;
}

} // namespace strategy
} // namespace stratlab
