// forge_editor layered configuration tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <forge/editor/config.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace forge_editor;
using namespace std::chrono_literals;

// =============================================================================
// Value Inference
// =============================================================================

TEST_CASE("infer_config_value picks the narrowest type", "[editor][config]") {
    REQUIRE(std::get<bool>(infer_config_value("true")) == true);
    REQUIRE(std::get<bool>(infer_config_value("false")) == false);
    REQUIRE(std::get<std::int64_t>(infer_config_value("250")) == 250);
    REQUIRE(std::get<double>(infer_config_value("0.25")) == 0.25);
    REQUIRE(std::get<std::string>(infer_config_value("debug")) == "debug");
    REQUIRE(std::get<std::string>(infer_config_value("12px")) == "12px");
}

// =============================================================================
// Layering
// =============================================================================

TEST_CASE("ConfigManager resolves by layer priority", "[editor][config]") {
    ConfigManager config;
    config.setup_defaults();

    REQUIRE(config.get_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS) == 250);

    config.set_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS, 500);
    REQUIRE(config.get_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS) == 500);

    config.set_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS, 1000, "environment");
    REQUIRE(config.get_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS) == 1000);

    REQUIRE(config.parse_args(std::vector<std::string>{"--preview.refresh_interval_ms=75"}));
    REQUIRE(config.get_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS) == 75);

    REQUIRE(config.get_layer("cmdline")->remove(config_keys::PREVIEW_REFRESH_INTERVAL_MS));
    REQUIRE(config.get_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS) == 1000);
}

TEST_CASE("ConfigManager typed getters convert and fall back", "[editor][config]") {
    ConfigManager config;
    config.set_string("a.text", "42");
    config.set_float("a.float", 2.75);
    config.set_bool("a.flag", true);

    REQUIRE(config.get_int("a.text") == 42);
    REQUIRE(config.get_int("a.float") == 2);
    REQUIRE(config.get_int("a.flag") == 1);
    REQUIRE(config.get_bool("a.flag"));
    REQUIRE(config.get_string("a.flag") == "true");
    REQUIRE(config.get_int("a.missing", 9) == 9);
    REQUIRE(config.get_string_array("a.text", {"x"}) == std::vector<std::string>{"x"});
}

TEST_CASE("ConfigManager notifies on set", "[editor][config]") {
    ConfigManager config;
    std::vector<std::string> changed;
    config.on_change([&changed](const std::string& key, const ConfigValue&) {
        changed.push_back(key);
    });

    config.set_int("preview.thumbnail_size", 64);
    config.set_string("log.level", "debug");
    REQUIRE(changed == std::vector<std::string>{"preview.thumbnail_size", "log.level"});
}

// =============================================================================
// Sources
// =============================================================================

TEST_CASE("load_json_string flattens nested objects", "[editor][config]") {
    ConfigManager config;
    config.setup_defaults();

    auto loaded = config.load_json_string(R"({
        "filters": {"preview_debounce_ms": 80, "endpoint": "http://localhost:8080/api/filters"},
        "preview": {"thumbnail_size": 48},
        "recent": ["a.png", "b.png"],
        "mixed": [1, "two"]
    })");
    REQUIRE(loaded);

    REQUIRE(config.get_int(config_keys::FILTERS_PREVIEW_DEBOUNCE_MS) == 80);
    REQUIRE(config.get_string(config_keys::FILTERS_ENDPOINT) == "http://localhost:8080/api/filters");
    REQUIRE(config.get_int(config_keys::PREVIEW_THUMBNAIL_SIZE) == 48);
    REQUIRE(config.get_string_array("recent") == std::vector<std::string>{"a.png", "b.png"});
    REQUIRE_FALSE(config.contains("mixed"));
}

TEST_CASE("load_json_string rejects malformed documents", "[editor][config]") {
    ConfigManager config;

    auto broken = config.load_json_string("{\"filters\": ");
    REQUIRE_FALSE(broken);
    REQUIRE(broken.error().code() == forge_core::ErrorCode::ParseError);

    auto not_object = config.load_json_string("[1, 2, 3]");
    REQUIRE_FALSE(not_object);
    REQUIRE(not_object.error().code() == forge_core::ErrorCode::ParseError);
}

TEST_CASE("load_json reads files and reports missing ones", "[editor][config]") {
    ConfigManager config;

    auto missing = config.load_json("/nonexistent/forge/editor.json");
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().code() == forge_core::ErrorCode::IOError);

    const auto path = std::filesystem::temp_directory_path() / "forge_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"layers": {"drag_edge_fraction": 0.25}})";
    }
    auto loaded = config.load_json(path);
    std::filesystem::remove(path);

    REQUIRE(loaded);
    REQUIRE_THAT(config.get_float(config_keys::LAYERS_DRAG_EDGE_FRACTION),
                 Catch::Matchers::WithinAbs(0.25, 1e-9));
}

TEST_CASE("parse_args accepts the three option forms", "[editor][config]") {
    ConfigManager config;
    auto parsed = config.parse_args(std::vector<std::string>{
        "--log-level", "debug", "--preview.thumbnail_size=64", "--verbose", "--config", "editor.json"});
    REQUIRE(parsed);

    REQUIRE(config.get_string("log.level") == "debug");
    REQUIRE(config.get_int("preview.thumbnail_size") == 64);
    REQUIRE(config.get_bool("verbose"));
    REQUIRE(config.get_string("config") == "editor.json");
}

TEST_CASE("parse_args rejects positional and empty options", "[editor][config]") {
    ConfigManager config;

    auto positional = config.parse_args(std::vector<std::string>{"image.png"});
    REQUIRE_FALSE(positional);
    REQUIRE(positional.error().code() == forge_core::ErrorCode::InvalidArgument);

    auto empty = config.parse_args(std::vector<std::string>{"--=3"});
    REQUIRE_FALSE(empty);
    REQUIRE(empty.error().code() == forge_core::ErrorCode::InvalidArgument);
}

// =============================================================================
// EditorConfig
// =============================================================================

TEST_CASE("build_editor_config uses defaults", "[editor][config]") {
    ConfigManager config;
    config.setup_defaults();
    EditorConfig settings = build_editor_config(config);

    REQUIRE(settings.preview_debounce == 150ms);
    REQUIRE(settings.filter_endpoint == "/api/filters");
    REQUIRE(settings.refresh_interval == 250ms);
    REQUIRE(settings.thumbnail_size == 40);
    REQUIRE(settings.checker_size == 5);
    REQUIRE(settings.drag_edge_fraction == 0.3);
    REQUIRE(settings.log_level == "info");
    REQUIRE(settings.log_directory.empty());
    REQUIRE(settings.log_channel_levels.empty());
}

TEST_CASE("build_editor_config collects channel log levels", "[editor][config]") {
    ConfigManager config;
    config.setup_defaults();
    REQUIRE(config.parse_args(std::vector<std::string>{"--log.channels.filters=debug", "--log.channels.sparkle=trace"}));
    REQUIRE(config.load_json_string(R"({"log": {"channels": {"history": "warn"}}})"));

    const EditorConfig settings = build_editor_config(config);
    REQUIRE(settings.log_channel_levels.size() == 2);
    REQUIRE(settings.log_channel_levels.at("filters") == "debug");
    REQUIRE(settings.log_channel_levels.at("history") == "warn");
}

TEST_CASE("build_editor_config clamps out-of-range values", "[editor][config]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("refresh interval below the floor") {
        config.set_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS, 10);
        REQUIRE(build_editor_config(config).refresh_interval == 50ms);
    }

    SECTION("refresh interval above the ceiling") {
        config.set_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS, 60000);
        REQUIRE(build_editor_config(config).refresh_interval == 5000ms);
    }

    SECTION("negative debounce") {
        config.set_int(config_keys::FILTERS_PREVIEW_DEBOUNCE_MS, -20);
        REQUIRE(build_editor_config(config).preview_debounce == 0ms);
    }

    SECTION("edge fraction outside (0, 0.5)") {
        config.set_float(config_keys::LAYERS_DRAG_EDGE_FRACTION, 0.5);
        REQUIRE(build_editor_config(config).drag_edge_fraction == 0.3);
    }

    SECTION("zero thumbnail size") {
        config.set_int(config_keys::PREVIEW_THUMBNAIL_SIZE, 0);
        REQUIRE(build_editor_config(config).thumbnail_size == 40);
    }
}
