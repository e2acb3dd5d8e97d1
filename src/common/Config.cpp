#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace stratlab {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

double readRate(const nlohmann::json& t, const char* key, double fallback) {
    const double v = t.value(key, fallback);
    if (v < 0.0 || v >= 1.0) {
        std::cerr << "Warning: " << key << "=" << v << " out of range [0, 1), using " << fallback << std::endl;
        return fallback;
    }
    return v;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    backtest_config_ = backtest::BacktestConfig{};
    data_dir_ = "data";
    strategies_dir_ = "strategies";
    log_dir_ = "logs";
    log_level_ = "info";
}

bool Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cerr << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Warning: config file not found: " << config_path << std::endl;
            std::cerr << "Using defaults." << std::endl;
            return false;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Warning: config file could not be opened." << std::endl;
            return false;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cerr << "Config loaded: Capital=" << backtest_config_.initial_capital
                  << ", Commission=" << backtest_config_.commission_rate
                  << ", Slippage=" << backtest_config_.slippage_rate << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        return false;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("backtest")) {
        const auto& t = j["backtest"];

        const double capital = t.value("initial_capital", backtest_config_.initial_capital);
        if (capital > 0.0) {
            backtest_config_.initial_capital = capital;
        } else {
            std::cerr << "Warning: initial_capital must be positive, ignoring " << capital << std::endl;
        }

        backtest_config_.commission_rate = readRate(t, "commission_rate", backtest_config_.commission_rate);
        backtest_config_.slippage_rate = readRate(t, "slippage_rate", backtest_config_.slippage_rate);
        backtest_config_.risk_free_rate = t.value("risk_free_rate", backtest_config_.risk_free_rate);

        const std::string attribution = toLowerCopy(trimCopy(t.value("commission_attribution", std::string("per_trade"))));
        if (auto parsed = backtest::commissionAttributionFromString(attribution)) {
            backtest_config_.commission_attribution = *parsed;
        } else {
            std::cerr << "Warning: unknown commission_attribution '" << attribution
                      << "', using per_trade" << std::endl;
            backtest_config_.commission_attribution = backtest::CommissionAttribution::PER_TRADE;
        }
    }

    if (j.contains("paths")) {
        const auto& p = j["paths"];
        data_dir_ = p.value("data_dir", data_dir_);
        strategies_dir_ = p.value("strategies_dir", strategies_dir_);
        log_dir_ = p.value("log_dir", log_dir_);
    }

    if (j.contains("logging")) {
        log_level_ = toLowerCopy(j["logging"].value("level", log_level_));
    }

    const std::string env_data_dir = readEnvVar("STRATLAB_DATA_DIR");
    if (!env_data_dir.empty()) {
        data_dir_ = env_data_dir;
    }
}

} // namespace stratlab
