// forge_filter effective region tests

#include <catch2/catch_test_macros.hpp>
#include <forge/filter/region.hpp>

#include <numbers>

using namespace forge_filter;
using forge_editor::Selection;
using forge_layer::Layer;
using forge_layer::LayerTransform;
using forge_raster::Rect;

TEST_CASE("Region without a selection is the whole layer", "[filter][region]") {
    auto layer = Layer::raster("L", 64, 48);

    REQUIRE(effective_region(*layer, std::nullopt) == Rect{0, 0, 64, 48});

    SECTION("zero-area selections count as none") {
        REQUIRE(effective_region(*layer, Selection{5, 5, 0, 10}) == Rect{0, 0, 64, 48});
        REQUIRE(effective_region(*layer, Selection{5, 5, 10, -1}) == Rect{0, 0, 64, 48});
    }
}

TEST_CASE("Region follows an untransformed selection", "[filter][region]") {
    auto layer = Layer::raster("L", 64, 64);
    REQUIRE(effective_region(*layer, Selection{10, 10, 20, 20}) == Rect{10, 10, 20, 20});
}

TEST_CASE("Fractional selections round outward", "[filter][region]") {
    auto layer = Layer::raster("L", 64, 64);
    REQUIRE(effective_region(*layer, Selection{10.5, 3.2, 4.0, 4.6}) == Rect{10, 3, 5, 5});
}

TEST_CASE("Region is clamped to the layer", "[filter][region]") {
    auto layer = Layer::raster("L", 32, 32);

    SECTION("partly outside") {
        REQUIRE(effective_region(*layer, Selection{-10, 20, 20, 40}) == Rect{0, 20, 10, 12});
    }

    SECTION("fully outside is empty") {
        REQUIRE(effective_region(*layer, Selection{100, 100, 10, 10}).is_empty());
        REQUIRE(effective_region(*layer, Selection{-50, 0, 10, 10}).is_empty());
    }
}

TEST_CASE("Region maps through the layer transform", "[filter][region]") {
    auto layer = Layer::raster("L", 64, 64);

    SECTION("offset") {
        layer->set_transform(LayerTransform::offset(100, 50));
        REQUIRE(effective_region(*layer, Selection{110, 60, 20, 20}) == Rect{10, 10, 20, 20});
    }

    SECTION("scale") {
        LayerTransform t;
        t.scale_x = 2.0;
        t.scale_y = 2.0;
        layer->set_transform(t);
        REQUIRE(effective_region(*layer, Selection{20, 20, 40, 40}) == Rect{10, 10, 20, 20});
    }

    SECTION("rotation uses the bounding box of the mapped corners") {
        LayerTransform t;
        t.translate_x = 64;
        t.rotation = std::numbers::pi / 2;
        layer->set_transform(t);
        REQUIRE(effective_region(*layer, Selection{44.5, 10.5, 9, 19}) == Rect{10, 10, 20, 10});
    }
}
