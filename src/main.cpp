/// @file main.cpp
/// @brief forge_headless entry point - drives the editing core without a UI
///
/// Builds a small document, wires the filter pipeline to an in-process
/// loopback filter service and runs one scripted editing session on a
/// simulated clock:
/// - FilterPipeline: debounced preview, commit, direct application
/// - FilterListEditor / FilterCache: non-destructive filter list
/// - LayerOrderingEngine: drag a layer into a group
/// - ChangeCoalescingScheduler: polled thumbnail and navigator refreshes
///
/// Configuration comes from defaults, an optional JSON file (--config),
/// FORGE_* environment variables and --key=value arguments.

#include <forge/core/log.hpp>
#include <forge/core/timer.hpp>
#include <forge/editor/config.hpp>
#include <forge/editor/session.hpp>
#include <forge/filter/cache.hpp>
#include <forge/filter/list_editor.hpp>
#include <forge/filter/pipeline.hpp>
#include <forge/filter/registry.hpp>
#include <forge/filter/service.hpp>
#include <forge/history/history.hpp>
#include <forge/layer/layer.hpp>
#include <forge/layer/layer_stack.hpp>
#include <forge/layer/ordering.hpp>
#include <forge/preview/scheduler.hpp>
#include <forge/preview/thumbnail.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

constexpr const char* FORGE_VERSION = "0.1.0";

constexpr const char* FILTER_CATALOG = R"json([
    {"id": "invert", "name": "Invert", "category": "Color"},
    {"id": "brightness", "name": "Brightness", "category": "Adjust",
     "params": [{"id": "amount", "name": "Amount", "type": "range",
                 "min": -100, "max": 100, "step": 1, "default": 0}]},
    {"id": "tint_warm", "name": "Tint (Warm)", "category": "Color",
     "baseName": "Tint", "expandParam": "mode", "presetParams": {"mode": "warm"},
     "params": [{"id": "mode", "name": "Mode", "type": "select", "options": ["warm", "cool"]},
                {"id": "strength", "name": "Strength", "type": "range", "min": 0, "max": 1,
                 "step": 0.05, "default": 0.25}]}
])json";

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>                   Load settings from a JSON file\n"
              << "  --filters.preview_debounce_ms=<n> Preview debounce (default 150)\n"
              << "  --preview.refresh_interval_ms=<n> Thumbnail polling interval, 50-5000 (default 250)\n"
              << "  --log-level <level>               trace, debug, info, warn, error\n"
              << "  --log-dir <dir>                   Write rotating log files to <dir>\n"
              << "  --log.channels.<name>=<level>     Level for one of core, filters, layers, preview, history\n"
              << "  -h, --help                        Show this help\n"
              << "  -v, --version                     Show version\n";
}

void print_version() {
    std::cout << "forge_headless " << FORGE_VERSION << "\n";
}

// =============================================================================
// Loopback Filters
// =============================================================================

std::uint8_t clamp_channel(double value) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

forge_core::Result<std::vector<std::uint8_t>> run_invert(const forge_filter::wire::DecodedRequest& request) {
    std::vector<std::uint8_t> out = request.pixels;
    for (std::size_t i = 0; i < out.size(); i += 4) {
        out[i] = static_cast<std::uint8_t>(255 - out[i]);
        out[i + 1] = static_cast<std::uint8_t>(255 - out[i + 1]);
        out[i + 2] = static_cast<std::uint8_t>(255 - out[i + 2]);
    }
    return out;
}

forge_core::Result<std::vector<std::uint8_t>> run_brightness(const forge_filter::wire::DecodedRequest& request) {
    auto it = request.params.find("amount");
    if (it == request.params.end() || !it->is_number()) {
        return forge_core::Err<std::vector<std::uint8_t>>(
            forge_core::Error{forge_core::ErrorCode::InvalidArgument, "brightness needs a numeric 'amount'"});
    }

    const double offset = it->get<double>() * 2.55;
    std::vector<std::uint8_t> out = request.pixels;
    for (std::size_t i = 0; i < out.size(); i += 4) {
        out[i] = clamp_channel(out[i] + offset);
        out[i + 1] = clamp_channel(out[i + 1] + offset);
        out[i + 2] = clamp_channel(out[i + 2] + offset);
    }
    return out;
}

forge_core::Result<std::vector<std::uint8_t>> run_tint(const forge_filter::wire::DecodedRequest& request) {
    const bool warm = request.params.value("mode", std::string("warm")) == "warm";
    const double strength = std::clamp(request.params.value("strength", 0.25), 0.0, 1.0);
    const double r = warm ? 255.0 : 0.0;
    const double b = warm ? 0.0 : 255.0;

    std::vector<std::uint8_t> out = request.pixels;
    for (std::size_t i = 0; i < out.size(); i += 4) {
        out[i] = clamp_channel(out[i] + (r - out[i]) * strength);
        out[i + 2] = clamp_channel(out[i + 2] + (b - out[i + 2]) * strength);
    }
    return out;
}

void log_failure(const char* what, const forge_core::Error& error) {
    forge_core::debug::record_error(error);
    spdlog::error("{} failed: {}", what, forge_core::build_error_chain(error));
}

} // anonymous namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        }
    }

    forge_core::init_logging();

    // ==========================================================================
    // Configuration
    // ==========================================================================
    forge_editor::ConfigManager config;
    config.setup_defaults();
    config.load_environment();

    if (auto parsed = config.parse_args(argc, argv); !parsed) {
        log_failure("Argument parsing", parsed.error());
        print_usage(argv[0]);
        return 1;
    }

    const std::string config_file = config.get_string("config");
    if (!config_file.empty()) {
        if (auto loaded = config.load_json(config_file, "user"); !loaded) {
            log_failure("Loading config", loaded.error());
            return 1;
        }
    }

    const forge_editor::EditorConfig settings = forge_editor::build_editor_config(config);

    forge_core::LogConfig log_config;
    if (auto level = forge_core::parse_log_level(settings.log_level)) {
        log_config.level = *level;
    } else {
        spdlog::warn("Unknown log level '{}', using info", settings.log_level);
    }
    for (const auto& [channel_name, level_name] : settings.log_channel_levels) {
        auto channel = forge_core::parse_log_channel(channel_name);
        auto level = forge_core::parse_log_level(level_name);
        if (channel && level) {
            log_config.channel_levels[*channel] = *level;
        } else {
            spdlog::warn("Ignoring log level '{}' for channel '{}'", level_name, channel_name);
        }
    }
    log_config.log_directory = settings.log_directory;
    forge_core::configure_logging(log_config);

    spdlog::info("forge_headless {}", FORGE_VERSION);

    // ==========================================================================
    // Document
    // ==========================================================================
    forge_history::HistoryJournal history;
    forge_core::TimerQueue timers;
    forge_editor::EditorSession session(320, 240, history, timers);

    auto& stack = session.layers();
    auto& background = stack.add_raster_layer("Background");
    if (auto painted = background.paint([](forge_raster::Surface& surface) {
            surface.fill(forge_raster::Rgba::opaque(200, 180, 150));
        }); !painted) {
        log_failure("Painting", painted.error());
        return 1;
    }
    const forge_layer::LayerId background_id = background.id();

    const forge_layer::LayerId details_id = stack.create_group("Details");
    auto& sketch = stack.add_raster_layer("Sketch");
    const forge_layer::LayerId sketch_id = sketch.id();
    if (auto painted = sketch.paint([](forge_raster::Surface& surface) {
            surface.fill_rect(forge_raster::Rect{40, 40, 120, 80}, forge_raster::Rgba::opaque(30, 60, 200));
        }); !painted) {
        log_failure("Painting", painted.error());
        return 1;
    }

    std::size_t renders = 0;
    const auto render_sub = session.on_render_requested([&renders]() { ++renders; });
    const auto status_sub = session.on_status([](const std::string& message) {
        std::cout << "status: " << message << "\n";
    });

    // ==========================================================================
    // Filter Service
    // ==========================================================================
    auto catalog = forge_filter::FilterRegistry::from_json_string(FILTER_CATALOG);
    if (!catalog) {
        log_failure("Filter catalog", catalog.error());
        return 1;
    }
    const forge_filter::FilterRegistry& registry = *catalog;

    forge_filter::LoopbackTransport transport(timers, 40ms);
    transport.register_filter("invert", run_invert);
    transport.register_filter("brightness", run_brightness);
    transport.register_filter("tint_warm", run_tint);
    forge_filter::WireFilterService service(transport, settings.filter_endpoint);

    forge_filter::FilterPipeline pipeline(session, service, settings.preview_debounce);

    // ==========================================================================
    // Preview Scheduler
    // ==========================================================================
    forge_preview::ThumbnailGenerator thumbnails(settings.thumbnail_size, settings.checker_size);
    thumbnails.set_renderer(forge_layer::LayerKind::Vector,
                            std::make_unique<forge_preview::TransformedThumbnailRenderer>());
    forge_preview::ChangeCoalescingScheduler scheduler(session, thumbnails, settings.refresh_interval);
    scheduler.set_navigator_callback([]() { spdlog::debug("Navigator refreshed"); });
    scheduler.start();

    // ==========================================================================
    // Scripted Session
    // ==========================================================================

    // Dialog preview: a burst of edits collapses into one request
    stack.set_active_by_id(sketch_id);
    if (auto opened = pipeline.open_filter_dialog(*registry.find("brightness")); !opened) {
        log_failure("Opening brightness", opened.error());
        return 1;
    }
    for (int amount = 5; amount <= 40; amount += 5) {
        if (auto set = pipeline.set_param("amount", amount); !set) {
            log_failure("Setting amount", set.error());
        }
        timers.advance(20ms);
    }
    timers.advance(settings.preview_debounce + 100ms);
    if (auto committed = pipeline.commit(); !committed) {
        log_failure("Commit", committed.error());
    }

    // Direct application with preset parameters
    stack.set_active_by_id(background_id);
    session.set_selection(forge_editor::Selection{0, 0, 160, 120});
    auto applied = pipeline.apply_direct(*registry.find("tint_warm"), [](forge_core::Result<void> outcome) {
        if (!outcome) {
            log_failure("Tint", outcome.error());
        }
    });
    if (!applied) {
        log_failure("Tint", applied.error());
    }
    timers.advance(100ms);
    session.clear_selection();

    // Non-destructive filter list
    forge_filter::FilterListEditor list_editor(session, registry);
    forge_filter::FilterCache cache(session, service);
    if (auto opened = list_editor.open(background_id); opened) {
        auto added = list_editor.add_filter("invert");
        if (!added) {
            log_failure("Adding invert", added.error());
        }
        list_editor.close();
    } else {
        log_failure("Opening filter list", opened.error());
    }
    if (const auto* layer = stack.find(background_id)) {
        (void)cache.filtered(*layer);
        timers.advance(100ms);
        spdlog::info("Filtered composite cached: {}", cache.filtered(*layer) != nullptr);
    }

    // Drag the sketch into the group
    forge_layer::LayerOrderingEngine ordering(stack, history, settings.drag_edge_fraction);
    ordering.set_on_change([&session]() { session.request_render(); });
    ordering.begin_drag(sketch_id);
    ordering.hover(details_id, 12.0, 24.0);
    const forge_layer::DropOutcome outcome = ordering.drop();
    spdlog::info("Drop: {}", outcome == forge_layer::DropOutcome::Reparented ? "reparented" : "moved/ignored");

    timers.advance(settings.refresh_interval * 2);
    scheduler.stop();
    pipeline.teardown();

    // ==========================================================================
    // Report
    // ==========================================================================
    std::cout << "\nHistory:\n";
    for (const auto& label : history.labels()) {
        std::cout << "  " << label << "\n";
    }
    std::cout << "\nPreview requests: " << pipeline.preview_requests()
              << ", service requests: " << service.requests_sent()
              << ", renders: " << renders
              << ", thumbnails: " << scheduler.thumbnails_rendered()
              << ", navigator refreshes: " << scheduler.navigator_refreshes() << "\n";

    if (forge_core::debug::total_error_count() > 0) {
        std::cout << "\n" << forge_core::debug::error_stats_summary();
    }

    session.unsubscribe(render_sub);
    session.unsubscribe(status_sub);
    forge_core::shutdown_logging();
    return 0;
}
