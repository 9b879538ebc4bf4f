// forge_filter FilterPipeline tests

#include <catch2/catch_test_macros.hpp>
#include <forge/filter/pipeline.hpp>
#include <forge/history/history.hpp>
#include <forge/layer/layer.hpp>
#include <forge/layer/layer_stack.hpp>
#include <forge/layer/ordering.hpp>

#include "support/fake_filter_service.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace forge_filter;
using namespace std::chrono_literals;
using forge_core::FilterError;
using forge_raster::Rgba;
using forge_raster::Surface;
using forge_test::FakeFilterService;

namespace {

constexpr Rgba ORIGINAL = Rgba::opaque(10, 20, 30);

FilterDef brightness_def() {
    FilterDef def;
    def.id = "brightness";
    def.name = "Brightness";
    ParamDef amount;
    amount.id = "amount";
    amount.type = ParamType::Range;
    amount.min = -100;
    amount.max = 100;
    amount.default_value = 0;
    def.params.push_back(amount);
    return def;
}

FilterDef invert_def() {
    FilterDef def;
    def.id = "invert";
    def.name = "Invert";
    return def;
}

FilterDef tint_def() {
    FilterDef def;
    def.id = "tint_warm";
    def.name = "Warm Tint";
    def.base_name = "Tint";
    def.expand_param = "mode";
    def.preset_params = nlohmann::json{{"mode", "warm"}};
    ParamDef mode;
    mode.id = "mode";
    mode.type = ParamType::Select;
    mode.options = {"warm", "cool"};
    ParamDef strength;
    strength.id = "strength";
    strength.type = ParamType::Range;
    strength.default_value = 0.25;
    def.params = {mode, strength};
    return def;
}

struct PipelineFixture {
    forge_history::HistoryJournal history;
    forge_core::TimerQueue timers;
    forge_editor::EditorSession editor{8, 8, history, timers};
    FakeFilterService service;
    FilterPipeline pipeline{editor, service, 150ms};
    forge_layer::Layer* layer = nullptr;

    PipelineFixture() {
        layer = &editor.layers().add_raster_layer("Paint");
        REQUIRE(layer->paint([](Surface& s) { s.fill(ORIGINAL); }));
    }

    [[nodiscard]] const Surface& pixels() const { return layer->surface(); }

    [[nodiscard]] Surface original() const { return Surface(8, 8, ORIGINAL); }
};

FilterError::Kind filter_error_kind(const forge_core::Error& err) {
    return err.as<FilterError>()->kind;
}

} // anonymous namespace

// =============================================================================
// Dialog Lifecycle
// =============================================================================

TEST_CASE("Opening a dialog claims the layer and waits for the debounce", "[filter][pipeline]") {
    PipelineFixture f;

    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
    REQUIRE(f.pipeline.state() == PipelineState::ParamsEditing);
    REQUIRE(f.layer->surface_owner() == forge_layer::SurfaceOwner::PreviewSession);
    REQUIRE(f.pipeline.session()->params["amount"] == 0);

    f.timers.advance(149ms);
    REQUIRE(f.service.call_count() == 0);
    f.timers.advance(1ms);
    REQUIRE(f.service.call_count() == 1);
    REQUIRE(f.service.last().request.filter_id == "brightness");
    REQUIRE(f.service.last().request.width == 8);
    REQUIRE(f.service.last().request.pixels == f.original().bytes());

    SECTION("painting is refused while the dialog is open") {
        REQUIRE_FALSE(f.layer->paint([](Surface& s) { s.fill(Rgba{}); }));
    }
}

TEST_CASE("Rapid parameter edits issue one request", "[filter][pipeline][debounce]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));

    for (int i = 1; i <= 10; ++i) {
        REQUIRE(f.pipeline.set_param("amount", i * 5));
        f.timers.advance(15ms);
    }
    REQUIRE(f.service.call_count() == 0);

    f.timers.advance(150ms);
    REQUIRE(f.service.call_count() == 1);
    REQUIRE(f.pipeline.preview_requests() == 1);
    REQUIRE(f.service.last().request.params["amount"] == 50);
}

TEST_CASE("Only the newest response is applied", "[filter][pipeline][sequence]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));

    REQUIRE(f.pipeline.set_param("amount", 10));
    f.timers.advance(150ms);
    REQUIRE(f.pipeline.set_param("amount", 20));
    f.timers.advance(150ms);
    REQUIRE(f.service.call_count() == 2);

    SECTION("newest first, then the stale one") {
        f.service.respond_fill(1, 200);
        f.service.respond_fill(0, 100);
        REQUIRE(f.pixels().pixel(3, 3) == Rgba::opaque(200, 200, 200));
    }

    SECTION("stale one first, then the newest") {
        f.service.respond_fill(0, 100);
        REQUIRE(f.pixels() == f.original());
        f.service.respond_fill(1, 200);
        REQUIRE(f.pixels().pixel(3, 3) == Rgba::opaque(200, 200, 200));
    }

    REQUIRE(f.pipeline.stale_responses() == 1);
}

TEST_CASE("Every preview starts from the original pixels", "[filter][pipeline]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
    f.timers.advance(150ms);
    f.service.respond_fill(0, 200);

    REQUIRE(f.pipeline.set_param("amount", 40));
    f.timers.advance(150ms);
    REQUIRE(f.service.call_count() == 2);
    REQUIRE(f.service.last().request.pixels == f.original().bytes());
}

TEST_CASE("Cancel restores the original pixels exactly", "[filter][pipeline]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
    f.timers.advance(150ms);
    f.service.respond_fill(0, 77);
    REQUIRE(f.pixels() != f.original());

    REQUIRE(f.pipeline.cancel());
    REQUIRE(f.pixels() == f.original());
    REQUIRE(f.pipeline.state() == PipelineState::Idle);
    REQUIRE(f.layer->surface_owner() == forge_layer::SurfaceOwner::None);
    REQUIRE(f.history.size() == 0);
    REQUIRE(f.editor.last_status() == "Filter cancelled");

    SECTION("a pending debounce never fires") {
        REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
        REQUIRE(f.pipeline.close_dialog());
        f.timers.advance(1s);
        REQUIRE(f.service.call_count() == 1);
    }
}

TEST_CASE("Commit records one history entry", "[filter][pipeline][history]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
    REQUIRE(f.pipeline.set_param("amount", 30));
    f.timers.advance(150ms);
    f.service.respond_fill(0, 90);

    REQUIRE(f.pipeline.commit());
    REQUIRE(f.history.labels() == std::vector<std::string>{"Filter: Brightness"});
    REQUIRE_FALSE(f.history.entries()[0].structural);
    REQUIRE(f.pixels().pixel(0, 0) == Rgba::opaque(90, 90, 90));
    REQUIRE(f.layer->surface_owner() == forge_layer::SurfaceOwner::None);
    REQUIRE(f.editor.is_modified());
    REQUIRE(f.editor.last_status() == "Brightness applied");
}

TEST_CASE("Commit without a visible change records nothing", "[filter][pipeline][history]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));

    SECTION("before any preview") {
        REQUIRE(f.pipeline.commit());
    }

    SECTION("with a request still in flight") {
        f.timers.advance(150ms);
        REQUIRE(f.pipeline.commit());
        f.service.respond_fill(0, 50);
        REQUIRE(f.pipeline.stale_responses() == 1);
    }

    REQUIRE(f.history.size() == 0);
    REQUIRE(f.pixels() == f.original());
    REQUIRE_FALSE(f.editor.is_modified());
}

TEST_CASE("A failed preview keeps the dialog open", "[filter][pipeline][failure]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
    f.timers.advance(150ms);
    f.service.respond_fill(0, 120);

    REQUIRE(f.pipeline.set_param("amount", 99));
    f.timers.advance(150ms);
    f.service.fail(1, "kernel crashed");

    REQUIRE(f.pipeline.is_editing());
    REQUIRE(f.pixels() == f.original());
    REQUIRE(f.editor.last_status() == "Preview failed: kernel crashed");
    REQUIRE(f.history.size() == 0);

    SECTION("a later edit tries again") {
        REQUIRE(f.pipeline.set_param("amount", 5));
        f.timers.advance(150ms);
        f.service.respond_fill(2, 60);
        REQUIRE(f.pixels().pixel(1, 1) == Rgba::opaque(60, 60, 60));
    }
}

TEST_CASE("A wrongly sized preview result is not applied", "[filter][pipeline][failure]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
    f.timers.advance(150ms);
    f.service.respond(0, std::vector<std::uint8_t>(7, 1));

    REQUIRE(f.pipeline.is_editing());
    REQUIRE(f.pixels() == f.original());
}

TEST_CASE("Preview toggle", "[filter][pipeline]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
    f.timers.advance(150ms);
    f.service.respond_fill(0, 180);

    REQUIRE(f.pipeline.set_param("amount", 7));
    f.timers.advance(150ms);
    REQUIRE(f.service.call_count() == 2);

    REQUIRE(f.pipeline.set_preview_enabled(false));
    REQUIRE(f.pixels() == f.original());

    f.service.respond_fill(1, 33);
    REQUIRE(f.pixels() == f.original());

    REQUIRE(f.pipeline.set_param("amount", 8));
    f.timers.advance(1s);
    REQUIRE(f.service.call_count() == 2);

    REQUIRE(f.pipeline.set_preview_enabled(true));
    f.timers.advance(150ms);
    REQUIRE(f.service.call_count() == 3);
    REQUIRE(f.service.last().request.params["amount"] == 8);
}

TEST_CASE("Previews follow the selection", "[filter][pipeline][region]") {
    forge_history::HistoryJournal history;
    forge_core::TimerQueue timers;
    forge_editor::EditorSession editor(64, 64, history, timers);
    FakeFilterService service;
    FilterPipeline pipeline(editor, service, 150ms);

    forge_layer::Layer& layer = editor.layers().add_raster_layer("Paint");
    REQUIRE(layer.paint([](Surface& s) { s.fill(ORIGINAL); }));
    editor.set_selection(forge_editor::Selection{10, 10, 20, 20});

    REQUIRE(pipeline.open_filter_dialog(brightness_def()));
    timers.advance(150ms);
    REQUIRE(service.call_count() == 1);
    REQUIRE(service.last().request.width == 20);
    REQUIRE(service.last().request.height == 20);
    REQUIRE(service.last().request.pixels.size() == 20u * 20u * 4u);

    service.respond_fill(0, 255);
    REQUIRE(layer.surface().pixel(10, 10) == Rgba::opaque(255, 255, 255));
    REQUIRE(layer.surface().pixel(29, 29) == Rgba::opaque(255, 255, 255));
    REQUIRE(layer.surface().pixel(9, 10) == ORIGINAL);
    REQUIRE(layer.surface().pixel(30, 29) == ORIGINAL);
    REQUIRE(layer.surface().pixel(10, 30) == ORIGINAL);

    SECTION("a selection outside the layer sends nothing") {
        REQUIRE(pipeline.cancel());
        editor.set_selection(forge_editor::Selection{100, 100, 5, 5});
        REQUIRE(pipeline.open_filter_dialog(brightness_def()));
        timers.advance(150ms);
        REQUIRE(service.call_count() == 1);
        REQUIRE(pipeline.is_editing());
    }
}

// =============================================================================
// Parameters
// =============================================================================

TEST_CASE("Parameter editing", "[filter][pipeline][params]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(tint_def()));
    REQUIRE(f.pipeline.session()->params["mode"] == "warm");
    REQUIRE(f.pipeline.session()->params["strength"] == 0.25);

    SECTION("unknown parameters are rejected") {
        auto result = f.pipeline.set_param("sparkle", 1);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == forge_core::ErrorCode::InvalidArgument);
    }

    SECTION("strings that are not UTF-8 are rejected") {
        auto result = f.pipeline.set_param("mode", "\xff\xfe");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == forge_core::ErrorCode::InvalidArgument);
        REQUIRE(f.pipeline.session()->params["mode"] == "warm");

        f.timers.advance(1s);
        REQUIRE(f.service.call_count() == 1);
        REQUIRE(f.service.last().request.params["mode"] == "warm");
    }

    SECTION("reset restores defaults and presets") {
        REQUIRE(f.pipeline.set_param("mode", "cool"));
        REQUIRE(f.pipeline.set_param("strength", 0.9));
        REQUIRE(f.pipeline.reset_params());
        REQUIRE(f.pipeline.session()->params["mode"] == "warm");
        REQUIRE(f.pipeline.session()->params["strength"] == 0.25);
    }

    SECTION("the history label names the chosen mode") {
        REQUIRE(f.pipeline.set_param("mode", "cool"));
        f.timers.advance(150ms);
        f.service.respond_fill(0, 140);
        REQUIRE(f.pipeline.commit());
        REQUIRE(f.history.labels() == std::vector<std::string>{"Filter: Tint (Cool)"});
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("Pipeline state errors", "[filter][pipeline][errors]") {
    PipelineFixture f;

    SECTION("no session") {
        auto set = f.pipeline.set_param("amount", 1);
        REQUIRE(filter_error_kind(set.error()) == FilterError::Kind::NoSession);
        REQUIRE(set.error().code() == forge_core::ErrorCode::InvalidState);
        REQUIRE_FALSE(f.pipeline.commit());
        REQUIRE_FALSE(f.pipeline.cancel());
        REQUIRE_FALSE(f.pipeline.reset_params());
        REQUIRE_FALSE(f.pipeline.set_preview_enabled(false));
    }

    SECTION("second dialog") {
        REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
        auto again = f.pipeline.open_filter_dialog(tint_def());
        REQUIRE(filter_error_kind(again.error()) == FilterError::Kind::SessionActive);

        auto direct = f.pipeline.apply_direct(invert_def());
        REQUIRE(filter_error_kind(direct.error()) == FilterError::Kind::SessionActive);
        REQUIRE(f.pipeline.session()->filter.id == "brightness");
    }

    SECTION("group layers have no pixels") {
        f.editor.layers().create_group("Folder");
        f.editor.layers().set_active_index(0);
        auto opened = f.pipeline.open_filter_dialog(brightness_def());
        REQUIRE_FALSE(opened);
        REQUIRE(opened.error().code() == forge_core::ErrorCode::InvalidState);
    }

    SECTION("a surface held by a direct filter") {
        REQUIRE(f.pipeline.apply_direct(invert_def()));
        auto opened = f.pipeline.open_filter_dialog(brightness_def());
        REQUIRE(filter_error_kind(opened.error()) == FilterError::Kind::SurfaceBusy);
    }
}

// =============================================================================
// Direct Application
// =============================================================================

TEST_CASE("Filters without parameters apply directly", "[filter][pipeline][direct]") {
    PipelineFixture f;
    std::optional<forge_core::Result<void>> outcome;

    REQUIRE(f.pipeline.apply_direct(invert_def(), [&outcome](forge_core::Result<void> r) { outcome = std::move(r); }));
    REQUIRE(f.pipeline.direct_in_flight());
    REQUIRE_FALSE(f.history.is_capturing());
    REQUIRE(f.layer->surface_owner() == forge_layer::SurfaceOwner::DirectFilter);
    REQUIRE(f.service.call_count() == 1);

    SECTION("success") {
        f.service.respond(0, FakeFilterService::inverted(f.service.call(0).request.pixels));
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->is_ok());
        REQUIRE(f.pixels().pixel(0, 0) == Rgba::opaque(245, 235, 225));
        REQUIRE(f.history.labels() == std::vector<std::string>{"Filter: Invert"});
        REQUIRE(f.editor.last_status() == "Invert applied");
    }

    SECTION("failure aborts the capture") {
        f.service.fail(0, "Filter not found");
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->is_err());
        REQUIRE(outcome->error().message() == "Filter not found");
        REQUIRE(f.history.size() == 0);
        REQUIRE(f.history.aborted_count() == 1);
        REQUIRE(f.pixels() == f.original());
        REQUIRE(f.editor.last_status() == "Filter failed: Filter not found");
    }

    REQUIRE_FALSE(f.pipeline.direct_in_flight());
    REQUIRE(f.layer->surface_owner() == forge_layer::SurfaceOwner::None);
    REQUIRE_FALSE(f.history.is_capturing());
}

TEST_CASE("Edits while a direct filter runs keep both history entries", "[filter][pipeline][direct]") {
    PipelineFixture f;
    const forge_layer::LayerId paint = f.layer->id();
    const forge_layer::LayerId other = f.editor.layers().add_raster_layer("Other").id();
    REQUIRE(f.editor.layers().set_active_by_id(paint));

    REQUIRE(f.pipeline.apply_direct(invert_def()));

    forge_layer::LayerOrderingEngine ordering(f.editor.layers(), f.history);
    REQUIRE(ordering.move(paint, other, forge_layer::DropZone::InsertBefore) == forge_layer::DropOutcome::Moved);

    f.service.respond_fill(0, 200);
    REQUIRE(f.pixels().pixel(0, 0).r == 200);
    REQUIRE(f.history.labels() == std::vector<std::string>{"Move Layer", "Filter: Invert"});
    REQUIRE(f.history.aborted_count() == 0);
    REQUIRE_FALSE(f.history.is_capturing());
}

TEST_CASE("Opening a dialog for a parameterless filter applies it", "[filter][pipeline][direct]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.open_filter_dialog(invert_def()));
    REQUIRE_FALSE(f.pipeline.is_editing());
    REQUIRE(f.pipeline.direct_in_flight());
    f.service.respond_all_inverted();
    REQUIRE(f.history.size() == 1);
}

TEST_CASE("Direct application uses preset parameters", "[filter][pipeline][direct]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.apply_direct(tint_def()));
    REQUIRE(f.service.last().request.params == nlohmann::json{{"mode", "warm"}});
    f.service.respond_fill(0, 1);
    REQUIRE(f.history.labels() == std::vector<std::string>{"Filter: Tint (Warm)"});
}

TEST_CASE("Direct application over an empty region is a no-op", "[filter][pipeline][direct]") {
    PipelineFixture f;
    f.editor.set_selection(forge_editor::Selection{50, 50, 4, 4});

    bool done = false;
    REQUIRE(f.pipeline.apply_direct(invert_def(), [&done](forge_core::Result<void> r) { done = r.is_ok(); }));
    REQUIRE(done);
    REQUIRE(f.service.call_count() == 0);
    REQUIRE(f.history.size() == 0);
    REQUIRE_FALSE(f.history.is_capturing());
}

// =============================================================================
// Teardown
// =============================================================================

TEST_CASE("Teardown ignores late replies", "[filter][pipeline][teardown]") {
    PipelineFixture f;

    SECTION("preview") {
        REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
        f.timers.advance(150ms);
        f.pipeline.teardown();
        REQUIRE(f.pipeline.state() == PipelineState::Idle);

        f.service.respond_fill(0, 99);
        REQUIRE(f.pixels() == f.original());
        REQUIRE(f.pipeline.stale_responses() == 0);
    }

    SECTION("pending debounce") {
        REQUIRE(f.pipeline.open_filter_dialog(brightness_def()));
        f.pipeline.teardown();
        f.timers.advance(1s);
        REQUIRE(f.service.call_count() == 0);
    }

    SECTION("direct") {
        bool called = false;
        REQUIRE(f.pipeline.apply_direct(invert_def(), [&called](forge_core::Result<void>) { called = true; }));
        f.pipeline.teardown();
        REQUIRE_FALSE(f.history.is_capturing());

        f.service.respond_all_inverted();
        REQUIRE_FALSE(called);
        REQUIRE(f.pixels() == f.original());
        REQUIRE(f.history.size() == 0);
    }

    REQUIRE(f.layer->surface_owner() == forge_layer::SurfaceOwner::None);
}

TEST_CASE("Destroying the pipeline ignores late replies", "[filter][pipeline][teardown]") {
    forge_history::HistoryJournal history;
    forge_core::TimerQueue timers;
    forge_editor::EditorSession editor(4, 4, history, timers);
    FakeFilterService service;
    editor.layers().add_raster_layer("Paint");

    {
        FilterPipeline pipeline(editor, service, 0ms);
        REQUIRE(pipeline.open_filter_dialog(brightness_def()));
        timers.run_due();
        REQUIRE(service.call_count() == 1);
    }

    service.respond_fill(0, 10);
    REQUIRE(editor.layers().layer_at(0)->surface() == Surface(4, 4));
}
