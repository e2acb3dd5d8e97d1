#include "strategy/StrategyStore.h"
#include "strategy/RuleEvaluator.h"
#include "strategy/RuleParser.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace stratlab;
using namespace stratlab::strategy;

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "stratlab_test_strategies";
    std::filesystem::remove_all(dir);

    StrategyStore store(dir);
    assert(store.list().empty());

    {
        Strategy s = createDefaultStrategy();
        s.name = "Golden Cross/v2";
        s.entry_rules = "sma(50) > sma(200) AND volume > 0";
        s.risk_management.trailing_stop = true;
        s.risk_management.trailing_stop_pct = 7.5;
        s.risk_management.take_profit_pct.reset();

        assert(store.save(s));
        assert(StrategyStore::fileStem(s.name) == "Golden_Cross_v2");
        assert(std::filesystem::exists(dir / "Golden_Cross_v2.json"));
        assert(!std::filesystem::exists(dir / "Golden_Cross_v2.json.tmp"));

        const auto loaded = store.load(s.name);
        assert(loaded.has_value());
        assert(*loaded == s);
        assert(!loaded->risk_management.take_profit_pct.has_value());

        // Re-parsed rules evaluate identically
        assert(equals(RuleParser::parseRules(loaded->entry_rules), RuleParser::parseRules(s.entry_rules)));
    }

    {
        Strategy invalid = createDefaultStrategy();
        invalid.name = "Broken";
        invalid.entry_rules = "nosuch(3) > 1";
        assert(!store.save(invalid));
        assert(!store.load("Broken").has_value());
    }

    {
        Strategy second = createDefaultStrategy();
        second.name = "Alpha";
        assert(store.save(second));
        const auto names = store.list();
        assert(names.size() == 2);
        assert(names[0] == "Alpha");
        assert(names[1] == "Golden_Cross_v2");

        assert(store.remove("Alpha"));
        assert(!store.remove("Alpha"));
        assert(store.list().size() == 1);
    }

    {
        // Nulls read as absent; an unknown method is rejected
        std::ofstream(dir / "nulls.json") << R"({"name": "N", "description": null, "entry_rules": "close > 1",
            "exit_rules": "", "risk_management": {"stop_loss_pct": null, "trailing_stop": null}})";
        const auto loaded = StrategyStore::loadFile(dir / "nulls.json");
        assert(loaded.has_value());
        assert(loaded->description.empty());
        assert(!loaded->risk_management.stop_loss_pct.has_value());
        assert(loaded->position_sizing.method == SizingMethod::PERCENTAGE);

        std::ofstream(dir / "bad.json") << R"({"name": "B", "entry_rules": "", "exit_rules": "",
            "position_sizing": {"method": "martingale", "value": 2}})";
        assert(!StrategyStore::loadFile(dir / "bad.json").has_value());

        std::ofstream(dir / "garbage.json") << "{not json";
        assert(!StrategyStore::loadFile(dir / "garbage.json").has_value());
    }

    {
        const Strategy s = createDefaultStrategy();
        const auto doc = toJson(s);
        assert(doc["position_sizing"]["method"] == "percentage");
        assert(!doc["risk_management"].contains("trailing_stop_pct"));
        assert(strategyFromJson(doc) == s);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] StrategyStore PASSED\n";
    return 0;
}
