#include <drogon/drogon_test.h>
#include <image/watermark.hpp>
#include <support/errors.hpp>

#include <climits>
#include <cstdlib>

using namespace pictor;
using namespace pictor::image;

DROGON_TEST(OverlayScalesAgainstShorterSide)
{
    Size scaled = scaleOverlay(Size{1000, 1000}, Size{400, 400}, 20);
    CHECK(std::abs(scaled.width - 200) <= 1);
    CHECK(std::abs(scaled.height - 200) <= 1);

    // Landscape base: 20% of 500
    scaled = scaleOverlay(Size{2000, 500}, Size{800, 400}, 20);
    CHECK(scaled.width == 100);
    CHECK(scaled.height == 50);

    // Never enlarged beyond native size
    scaled = scaleOverlay(Size{4000, 4000}, Size{64, 32}, 50);
    CHECK(scaled.width == 64);
    CHECK(scaled.height == 32);

    // Never below a pixel
    scaled = scaleOverlay(Size{10, 10}, Size{300, 3}, 1);
    CHECK(scaled.width == 1);
    CHECK(scaled.height == 1);

    CHECK_THROWS_AS(scaleOverlay(Size{100, 100}, Size{0, 10}, 20), ServiceError);
}

DROGON_TEST(SingleModeAnchors)
{
    Size base{200, 100};
    Size mark{20, 10};
    CHECK(anchor(Gravity::SouthEast, base, mark) == (Placement{180, 90}));
    CHECK(anchor(Gravity::NorthWest, base, mark) == (Placement{0, 0}));
    CHECK(anchor(Gravity::Centre, base, mark) == (Placement{90, 45}));
    CHECK(anchor(Gravity::North, base, mark) == (Placement{90, 0}));
    CHECK(anchor(Gravity::West, base, mark) == (Placement{0, 45}));
    CHECK(anchor(Gravity::SouthWest, base, mark) == (Placement{0, 90}));

    // An overlay bigger than the base sticks to the top-left corner
    CHECK(anchor(Gravity::SouthEast, Size{10, 10}, Size{30, 30}) == (Placement{0, 0}));

    WatermarkSpec spec;
    WatermarkLayout single = layout(base, mark, spec);
    REQUIRE(single.placements().size() == 1);
    CHECK(single.placements().front() == (Placement{180, 90}));
}

DROGON_TEST(TileModeGrid)
{
    WatermarkSpec spec;
    spec.mode = WatermarkMode::Tile;
    spec.spacing = 10;
    spec.position = Gravity::Centre;

    WatermarkLayout grid = layout(Size{200, 200}, Size{50, 50}, spec);
    CHECK(grid.columns == 4);
    CHECK(grid.rows == 4);
    CHECK(grid.stepX == 60);
    CHECK(grid.stepY == 60);

    auto placements = grid.placements();
    REQUIRE(placements.size() == 16);
    CHECK(placements.front() == (Placement{0, 0}));
    CHECK(placements[1] == (Placement{60, 0}));
    CHECK(placements.back() == (Placement{180, 180}));

    spec.spacing = 0;
    WatermarkLayout tight = layout(Size{100, 30}, Size{25, 10}, spec);
    CHECK(tight.columns == 4);
    CHECK(tight.rows == 3);

    WatermarkLayout pixel = layout(Size{3, 2}, Size{1, 1}, spec);
    CHECK(pixel.placements().size() == 6);
}

DROGON_TEST(TileModeHugeSpacing)
{
    WatermarkSpec spec;
    spec.mode = WatermarkMode::Tile;
    spec.spacing = INT_MAX - 10;

    WatermarkLayout grid = layout(Size{200, 200}, Size{50, 50}, spec);
    CHECK(grid.stepX == INT_MAX);
    CHECK(grid.stepY == INT_MAX);
    CHECK(grid.columns == 1);
    CHECK(grid.rows == 1);
    REQUIRE(grid.placements().size() == 1);
    CHECK(grid.placements().front() == (Placement{0, 0}));

    spec.spacing = 10000000;
    WatermarkLayout wide = layout(Size{8192, 8192}, Size{1638, 1638}, spec);
    CHECK(wide.stepX == 10001638);
    CHECK(wide.columns == 1);
    CHECK(wide.rows == 1);
}
