// forge_filter registry tests

#include <catch2/catch_test_macros.hpp>
#include <forge/filter/registry.hpp>

using namespace forge_filter;

namespace {

const char* CATALOG = R"([
    {"id": "invert", "name": "Invert", "category": "Color"},
    {"id": "blur", "name": "Gaussian Blur", "category": "Blur",
     "params": [
        {"id": "radius", "name": "Radius", "type": "range", "min": 1, "max": 50, "default": 4},
        {"id": "bogus", "type": "sparkle"},
        {"id": "mode", "type": "select"}
     ]},
    {"id": "tint_warm", "name": "Warm Tint", "category": "Color",
     "baseName": "Tint", "expandParam": "mode", "presetParams": {"mode": "warm"},
     "params": [
        {"id": "mode", "type": "select", "options": ["warm", "cool"]},
        {"id": "strength", "type": "range", "min": 0, "max": 1, "default": 0.25}
     ]},
    {"name": "no id"},
    42
])";

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

TEST_CASE("Registry loads usable definitions and skips the rest", "[filter][registry]") {
    auto registry = FilterRegistry::from_json_string(CATALOG);
    REQUIRE(registry);
    REQUIRE(registry->size() == 3);
    REQUIRE(registry->contains("invert"));
    REQUIRE_FALSE(registry->contains("missing"));

    const FilterDef* blur = registry->find("blur");
    REQUIRE(blur != nullptr);
    REQUIRE(blur->params.size() == 1);
    REQUIRE(blur->params[0].id == "radius");
    REQUIRE(blur->params[0].max == 50.0);
    REQUIRE(blur->find_param("bogus") == nullptr);

    const FilterDef* invert = registry->find("invert");
    REQUIRE_FALSE(invert->has_params());
    REQUIRE(invert->source == "wasm");
}

TEST_CASE("Registry accepts a wrapped listing", "[filter][registry]") {
    auto data = nlohmann::json::parse(R"({"filters": [{"id": "invert"}]})");
    auto registry = FilterRegistry::from_json(data);
    REQUIRE(registry);
    REQUIRE(registry->size() == 1);
    REQUIRE(registry->find("invert")->name == "invert");
    REQUIRE(registry->find("invert")->category == "Other");
}

TEST_CASE("Registry rejects malformed input", "[filter][registry]") {
    SECTION("not JSON") {
        auto registry = FilterRegistry::from_json_string("[{");
        REQUIRE_FALSE(registry);
        REQUIRE(registry.error().code() == forge_core::ErrorCode::ParseError);
    }

    SECTION("not an array") {
        auto registry = FilterRegistry::from_json_string(R"({"id": "invert"})");
        REQUIRE_FALSE(registry);
        REQUIRE(registry.error().code() == forge_core::ErrorCode::ParseError);
    }

    SECTION("params that aren't a list") {
        auto def = FilterRegistry::parse_definition(nlohmann::json::parse(R"({"id": "x", "params": 3})"));
        REQUIRE_FALSE(def);
        REQUIRE(def.error().code() == forge_core::ErrorCode::ValidationError);
    }
}

TEST_CASE("Registry add replaces by id and groups by category", "[filter][registry]") {
    auto registry = FilterRegistry::from_json_string(CATALOG);
    REQUIRE(registry);

    REQUIRE(registry->categories() == std::vector<std::string>{"Color", "Blur"});
    REQUIRE(registry->in_category("Color").size() == 2);

    FilterDef replacement;
    replacement.id = "invert";
    replacement.name = "Negative";
    registry->add(replacement);
    REQUIRE(registry->size() == 3);
    REQUIRE(registry->find("invert")->name == "Negative");
}

// =============================================================================
// Parameter Defaults
// =============================================================================

TEST_CASE("Parameter defaults", "[filter][registry][params]") {
    ParamDef range;
    range.type = ParamType::Range;
    range.min = 3.0;
    REQUIRE(default_param_value(range) == 3.0);

    ParamDef select;
    select.type = ParamType::Select;
    select.options = {"soft", "hard"};
    REQUIRE(default_param_value(select) == "soft");

    ParamDef checkbox;
    checkbox.type = ParamType::Checkbox;
    REQUIRE(default_param_value(checkbox) == false);

    ParamDef color;
    color.type = ParamType::Color;
    REQUIRE(default_param_value(color) == "#FFFFFF");

    color.default_value = "#000000";
    REQUIRE(default_param_value(color) == "#000000");
}

TEST_CASE("Presets override parameter defaults", "[filter][registry][params]") {
    auto registry = FilterRegistry::from_json_string(CATALOG);
    REQUIRE(registry);

    const FilterDef* tint = registry->find("tint_warm");
    nlohmann::json params = default_params(*tint);
    REQUIRE(params["mode"] == "warm");
    REQUIRE(params["strength"] == 0.25);

    REQUIRE(default_params(*registry->find("blur"))["radius"] == 4);
}

TEST_CASE("History labels", "[filter][registry]") {
    auto registry = FilterRegistry::from_json_string(CATALOG);
    REQUIRE(registry);

    const FilterDef* tint = registry->find("tint_warm");
    REQUIRE(history_label(*tint, nlohmann::json{{"mode", "cool"}}) == "Tint (Cool)");
    REQUIRE(history_label(*tint, nlohmann::json::object()) == "Warm Tint");
    REQUIRE(history_label(*registry->find("blur"), nlohmann::json{{"radius", 2}}) == "Gaussian Blur");
}

TEST_CASE("Parameter type names", "[filter][registry]") {
    REQUIRE(parse_param_type("range") == ParamType::Range);
    REQUIRE(parse_param_type("color") == ParamType::Color);
    REQUIRE_FALSE(parse_param_type("Range").has_value());
    REQUIRE(std::string(to_string(ParamType::Checkbox)) == "checkbox");
}
