#include <common/extent.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace lwgpu;

TEST_CASE("Empty extents", "[extent]")
{
    REQUIRE(isEmpty(Extent2i{0, 0}));
    REQUIRE(isEmpty(Extent2i{0, 300}));
    REQUIRE(isEmpty(Extent2i{640, 0}));
    REQUIRE(isEmpty(Extent2i{-1, 300}));
    REQUIRE_FALSE(isEmpty(Extent2i{1, 1}));
    REQUIRE(isEmpty(Extent2u{0u, 10u}));
}

TEST_CASE("Extent conversion and measures", "[extent]")
{
    constexpr Extent2i framebuffer{800, 600};
    constexpr Extent2u surface(framebuffer);

    STATIC_REQUIRE(surface == Extent2u{800u, 600u});
    STATIC_REQUIRE(area(framebuffer) == 480000);
    REQUIRE(aspectRatio(framebuffer) == 800.0f / 600.0f);
}
