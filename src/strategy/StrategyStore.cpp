#include "strategy/StrategyStore.h"
#include "strategy/RuleParser.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace stratlab {
namespace strategy {

StrategyStore::StrategyStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::string StrategyStore::fileStem(const std::string& name) {
    std::string stem;
    stem.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            stem.push_back(static_cast<char>(c));
        } else {
            stem.push_back('_');
        }
    }
    return stem.empty() ? "strategy" : stem;
}

std::filesystem::path StrategyStore::pathFor(const std::string& name) const {
    return directory_ / (fileStem(name) + ".json");
}

std::vector<std::string> StrategyStore::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return names;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            names.push_back(entry.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<Strategy> StrategyStore::loadFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        LOG_ERROR("Strategy file not found: {}", path.string());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        LOG_ERROR("Cannot open strategy file: {}", path.string());
        return std::nullopt;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return strategyFromJson(raw);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Malformed strategy file {}: {}", path.string(), e.what());
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid strategy file {}: {}", path.string(), e.what());
    }
    return std::nullopt;
}

std::optional<Strategy> StrategyStore::load(const std::string& name) const {
    return loadFile(pathFor(name));
}

bool StrategyStore::save(const Strategy& strategy) const {
    const auto validation = RuleParser::validateStrategy(strategy);
    if (!validation.valid) {
        LOG_ERROR("Refusing to save strategy '{}': {}", strategy.name, validation.error);
        return false;
    }

    const auto file_path = pathFor(strategy.name);
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        LOG_ERROR("Cannot create strategy directory {}: {}", directory_.string(), ec.message());
        return false;
    }

    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot write strategy file: {}", tmp_path.string());
            return false;
        }
        out << toJson(strategy).dump(2);
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        LOG_ERROR("Cannot replace strategy file {}: {}", file_path.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    LOG_INFO("Strategy saved: {}", file_path.string());
    return true;
}

bool StrategyStore::remove(const std::string& name) const {
    std::error_code ec;
    const bool removed = std::filesystem::remove(pathFor(name), ec);
    if (ec) {
        LOG_ERROR("Cannot remove strategy {}: {}", name, ec.message());
        return false;
    }
    return removed;
}

} // namespace strategy
} // namespace stratlab
