#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"
#include "backtest/BacktestResultIO.h"
#include "backtest/DataHistory.h"
#include "strategy/RuleParser.h"
#include "strategy/StrategyStore.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace stratlab;

namespace {

std::string trimCopy(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

void printUsage() {
    std::cout << "Usage:\n";
    std::cout << "  stratlab --backtest <strategy> --ticker <T> [--ticker <T2> ...]\n";
    std::cout << "           [--tickers A,B,C] [--start YYYY-MM-DD] [--end YYYY-MM-DD]\n";
    std::cout << "           [--initial-capital N] [--data-dir DIR] [--out FILE] [--json]\n";
    std::cout << "  stratlab --validate <strategy.json>\n";
    std::cout << "  stratlab --list-strategies\n";
    std::cout << "  stratlab --save-default\n";
    std::cout << "Common: [--config FILE]\n";
    std::cout << "<strategy> is a JSON file path or the name of a stored strategy.\n";
}

// A path to a strategy document, or the name of one in the strategy store.
std::optional<strategy::Strategy> resolveStrategy(const std::string& ref, const strategy::StrategyStore& store) {
    if (std::filesystem::exists(ref)) {
        return strategy::StrategyStore::loadFile(ref);
    }
    if (auto stored = store.load(ref)) {
        return stored;
    }
    if (ref == "default") {
        return strategy::createDefaultStrategy();
    }
    return std::nullopt;
}

int runValidate(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Strategy file not found: " << path << "\n";
        return 1;
    }

    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Invalid JSON: " << e.what() << "\n";
        return 1;
    }

    const auto result = strategy::RuleParser::validateStrategyDocument(doc);
    if (!result.valid) {
        std::cout << "INVALID: " << result.error << "\n";
        return 1;
    }
    std::cout << "OK: " << doc.value("name", std::string()) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config_path = argv[i + 1];
        }
    }

    try {
        auto& config = Config::getInstance();
        config.load(config_path);
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        if (argc < 2) {
            printUsage();
            return 1;
        }

        const std::string command = argv[1];
        strategy::StrategyStore store(config.getStrategiesDir());

        if (command == "--validate" && argc > 2) {
            return runValidate(argv[2]);
        }

        if (command == "--list-strategies") {
            for (const auto& name : store.list()) {
                std::cout << name << "\n";
            }
            return 0;
        }

        if (command == "--save-default") {
            const auto def = strategy::createDefaultStrategy();
            if (!store.save(def)) {
                std::cerr << "Failed to save the default strategy.\n";
                return 1;
            }
            std::cout << "Saved " << store.pathFor(def.name).string() << "\n";
            return 0;
        }

        if (command != "--backtest" || argc < 3) {
            printUsage();
            return 1;
        }

        bool json_mode = false;
        std::vector<std::string> tickers;
        std::string start_date;
        std::string end_date;
        std::string out_path;
        std::string data_dir = config.getDataDir();
        double cli_initial_capital = -1.0;

        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--json") {
                json_mode = true;
                continue;
            }
            if (arg == "--config" && i + 1 < argc) {
                ++i;
                continue;
            }
            if (arg == "--ticker" && i + 1 < argc) {
                const std::string ticker = trimCopy(argv[++i]);
                if (!ticker.empty()) {
                    tickers.push_back(ticker);
                }
                continue;
            }
            if (arg == "--tickers" && i + 1 < argc) {
                std::string csv = argv[++i];
                size_t start = 0;
                while (start <= csv.size()) {
                    const size_t comma = csv.find(',', start);
                    std::string token = (comma == std::string::npos)
                        ? csv.substr(start)
                        : csv.substr(start, comma - start);
                    token = trimCopy(token);
                    if (!token.empty()) {
                        tickers.push_back(token);
                    }
                    if (comma == std::string::npos) {
                        break;
                    }
                    start = comma + 1;
                }
                continue;
            }
            if (arg == "--start" && i + 1 < argc) {
                start_date = trimCopy(argv[++i]);
                continue;
            }
            if (arg == "--end" && i + 1 < argc) {
                end_date = trimCopy(argv[++i]);
                continue;
            }
            if (arg == "--out" && i + 1 < argc) {
                out_path = argv[++i];
                continue;
            }
            if (arg == "--data-dir" && i + 1 < argc) {
                data_dir = argv[++i];
                continue;
            }
            if (arg == "--initial-capital" && i + 1 < argc) {
                try {
                    cli_initial_capital = std::stod(argv[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid --initial-capital value. Ignored.\n";
                }
                continue;
            }
            std::cerr << "Unknown argument: " << arg << "\n";
        }

        if (cli_initial_capital > 0.0) {
            config.setInitialCapital(cli_initial_capital);
        }
        if (tickers.empty()) {
            std::cerr << "At least one --ticker is required.\n";
            return 1;
        }

        const std::string strategy_ref = argv[2];
        const auto strat = resolveStrategy(strategy_ref, store);
        if (!strat) {
            std::cerr << "Strategy not found: " << strategy_ref << "\n";
            return 1;
        }
        const auto validation = strategy::RuleParser::validateStrategy(*strat);
        if (!validation.valid) {
            std::cerr << "Invalid strategy: " << validation.error << "\n";
            return 1;
        }

        if (!json_mode) {
            std::cout << "\n";
            std::cout << "=============================================\n";
            std::cout << "       stratlab backtester\n";
            std::cout << "=============================================\n\n";
        }
        LOG_INFO("Backtest mode: strategy '{}', {} ticker(s), data dir {}", strat->name, tickers.size(), data_dir);

        backtest::BacktestEngine engine(config.getBacktestConfig(),
                                        std::make_shared<backtest::DataHistory>(data_dir));
        const auto result = tickers.size() == 1
            ? engine.runBacktest(tickers.front(), *strat, start_date, end_date)
            : engine.runMultiBacktest(tickers, *strat, start_date, end_date);

        if (!out_path.empty() && !backtest::BacktestResultIO::save(result, out_path)) {
            std::cerr << "Failed to write " << out_path << "\n";
        }

        if (json_mode) {
            std::cout << backtest::BacktestResultIO::toJson(result).dump() << std::endl;
        } else {
            backtest::BacktestResultIO::printSummary(result, std::cout);
        }
        return result.ok() ? 0 : 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
