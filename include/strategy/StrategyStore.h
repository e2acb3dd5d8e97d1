#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "strategy/Strategy.h"

namespace stratlab {
namespace strategy {

// Strategy documents stored as <dir>/<file-safe name>.json
class StrategyStore {
public:
    explicit StrategyStore(std::filesystem::path directory);

    // File stems of the stored documents, sorted.
    std::vector<std::string> list() const;

    std::optional<Strategy> load(const std::string& name) const;

    // Validates before writing; writes to a temp file and renames it over the target.
    bool save(const Strategy& strategy) const;

    bool remove(const std::string& name) const;

    std::filesystem::path pathFor(const std::string& name) const;
    const std::filesystem::path& directory() const { return directory_; }

    // Reads any strategy document; nullopt (and an error log) on failure.
    static std::optional<Strategy> loadFile(const std::filesystem::path& path);

    static std::string fileStem(const std::string& name);

private:
    std::filesystem::path directory_;
};

} // namespace strategy
} // namespace stratlab
