#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace stratlab {
namespace strategy {

enum class SizingMethod { FIXED, PERCENTAGE, RISK_BASED };

std::string toString(SizingMethod method);
std::optional<SizingMethod> sizingMethodFromString(const std::string& value);

struct PositionSizing {
    SizingMethod method = SizingMethod::PERCENTAGE;
    double value = 10.0;    // currency amount for FIXED, percent of cash otherwise
};

struct RiskManagement {
    std::optional<double> stop_loss_pct;
    std::optional<double> take_profit_pct;
    bool trailing_stop = false;
    std::optional<double> trailing_stop_pct;
};

// User-defined strategy; read-only for the duration of a run.
struct Strategy {
    std::string name;
    std::string description;
    std::string entry_rules;
    std::string exit_rules;
    PositionSizing position_sizing;
    RiskManagement risk_management;
};

bool operator==(const Strategy& a, const Strategy& b);
bool operator!=(const Strategy& a, const Strategy& b);

// Template used for new strategies
Strategy createDefaultStrategy();

// Absent optionals are omitted from the document.
nlohmann::json toJson(const Strategy& strategy);

// null reads as absent. Throws std::invalid_argument for an unknown sizing
// method and nlohmann::json::exception for mistyped fields.
Strategy strategyFromJson(const nlohmann::json& j);

} // namespace strategy
} // namespace stratlab
