#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

// Simple manual test runner
int main() {
    using namespace stratlab;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // Defaults
    assert(std::abs(config.getInitialCapital() - 100000.0) < 1e-9);
    assert(std::abs(config.getCommissionRate() - 0.001) < 1e-12);
    assert(std::abs(config.getSlippageRate() - 0.0005) < 1e-12);
    assert(config.getBacktestConfig().commission_attribution == backtest::CommissionAttribution::PER_TRADE);
    assert(config.getDataDir() == "data");

    // Missing file keeps defaults
    assert(!config.load("/nonexistent/stratlab/config.json"));
    assert(std::abs(config.getInitialCapital() - 100000.0) < 1e-9);

    // Load from a real file
    const auto path = std::filesystem::temp_directory_path() / "stratlab_test_config.json";
    {
        std::ofstream out(path);
        out << R"({
            "backtest": {
                "initial_capital": 50000,
                "commission_rate": 0.002,
                "slippage_rate": 0.001,
                "risk_free_rate": 0.03,
                "commission_attribution": "Cumulative"
            },
            "paths": {"data_dir": "market", "strategies_dir": "strats", "log_dir": "out/logs"},
            "logging": {"level": "DEBUG"}
        })";
    }
    assert(config.load(path.string()));
    std::cout << "Capital: " << config.getInitialCapital() << std::endl;
    std::cout << "Commission: " << config.getCommissionRate() << std::endl;

    assert(std::abs(config.getInitialCapital() - 50000.0) < 1e-9);
    assert(std::abs(config.getCommissionRate() - 0.002) < 1e-12);
    assert(std::abs(config.getSlippageRate() - 0.001) < 1e-12);
    assert(std::abs(config.getRiskFreeRate() - 0.03) < 1e-12);
    assert(config.getBacktestConfig().commission_attribution == backtest::CommissionAttribution::CUMULATIVE);
    assert(config.getStrategiesDir() == "strats");
    assert(config.getLogDir() == "out/logs");
    assert(config.getLogLevel() == "debug");
    std::filesystem::remove(path);

    // Out-of-range values fall back
    config.reset();
    config.loadFromJson(nlohmann::json::parse(R"({
        "backtest": {"initial_capital": -5, "commission_rate": 1.5, "commission_attribution": "weekly"}
    })"));
    assert(std::abs(config.getInitialCapital() - 100000.0) < 1e-9);
    assert(std::abs(config.getCommissionRate() - 0.001) < 1e-12);
    assert(config.getBacktestConfig().commission_attribution == backtest::CommissionAttribution::PER_TRADE);

    // Environment override for the data directory
    config.reset();
    setenv("STRATLAB_DATA_DIR", "/srv/bars", 1);
    config.loadFromJson(nlohmann::json::object());
    assert(config.getDataDir() == "/srv/bars");
    unsetenv("STRATLAB_DATA_DIR");

    config.setInitialCapital(2500.0);
    assert(std::abs(config.getBacktestConfig().initial_capital - 2500.0) < 1e-9);

    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
