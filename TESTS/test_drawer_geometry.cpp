#include "doctest/doctest.h"

#include <cmath>
#include <limits>
#include <optional>

#include "core/drawer_geometry.hpp"

using drawerkit::Direction;
using drawerkit::TransitionState;
namespace geometry = drawerkit::geometry;

TEST_CASE("expanded offset is zero for any percent and direction") {
    for (Direction direction : {Direction::Left, Direction::Right}) {
        for (std::optional<double> percent : {std::optional<double>{}, std::optional<double>{0.0},
                                              std::optional<double>{0.6}, std::optional<double>{3.0}}) {
            CHECK(geometry::resolve_offset(TransitionState::Expanded, percent, direction, 320.0) == doctest::Approx(0.0));
        }
    }
}

TEST_CASE("collapsed offset sits one content width off the drawer's edge") {
    CHECK(geometry::resolve_offset(TransitionState::Collapsed, std::nullopt, Direction::Left, 320.0) == doctest::Approx(-320.0));
    CHECK(geometry::resolve_offset(TransitionState::Collapsed, std::nullopt, Direction::Right, 320.0) == doctest::Approx(320.0));
}

TEST_CASE("transition offset interpolates linearly between collapsed and expanded") {
    CHECK(geometry::resolve_offset(TransitionState::InTransition, 0.0, Direction::Left, 200.0) == doctest::Approx(-200.0));
    CHECK(geometry::resolve_offset(TransitionState::InTransition, 0.25, Direction::Left, 200.0) == doctest::Approx(-150.0));
    CHECK(geometry::resolve_offset(TransitionState::InTransition, 1.0, Direction::Left, 200.0) == doctest::Approx(0.0));
    CHECK(geometry::resolve_offset(TransitionState::InTransition, 0.25, Direction::Right, 200.0) == doctest::Approx(150.0));
}

TEST_CASE("transition offset degrades to zero without a usable percent") {
    CHECK(geometry::resolve_offset(TransitionState::InTransition, std::nullopt, Direction::Left, 200.0) == doctest::Approx(0.0));
    CHECK(geometry::resolve_offset(TransitionState::InTransition, 1.5, Direction::Right, 200.0) == doctest::Approx(0.0));
    CHECK(geometry::resolve_offset(TransitionState::InTransition, -0.1, Direction::Left, 200.0) == doctest::Approx(0.0));
}

TEST_CASE("offset with a degenerate width is zero") {
    CHECK(geometry::resolve_offset(TransitionState::Collapsed, std::nullopt, Direction::Left, 0.0) == doctest::Approx(0.0));
    CHECK(geometry::resolve_offset(TransitionState::Collapsed, std::nullopt, Direction::Right, -10.0) == doctest::Approx(0.0));
    CHECK(geometry::resolve_offset(TransitionState::Collapsed, std::nullopt, Direction::Left,
                                   std::numeric_limits<double>::quiet_NaN()) == doctest::Approx(0.0));
}

TEST_CASE("dim opacity follows state when dimming is enabled") {
    CHECK(geometry::resolve_dim_opacity(TransitionState::Collapsed, std::nullopt, 0.4, true) == doctest::Approx(0.0));
    CHECK(geometry::resolve_dim_opacity(TransitionState::Expanded, std::nullopt, 0.4, true) == doctest::Approx(0.4));
    CHECK(geometry::resolve_dim_opacity(TransitionState::InTransition, 0.5, 0.4, true) == doctest::Approx(0.2));
    CHECK(geometry::resolve_dim_opacity(TransitionState::InTransition, std::nullopt, 0.4, true) == doctest::Approx(0.0));
}

TEST_CASE("dim opacity is zero when dimming is disabled") {
    CHECK(geometry::resolve_dim_opacity(TransitionState::Expanded, std::nullopt, 0.4, false) == doctest::Approx(0.0));
    CHECK(geometry::resolve_dim_opacity(TransitionState::InTransition, 0.9, 0.4, false) == doctest::Approx(0.0));
}

TEST_CASE("content width and portrait extent") {
    CHECK(geometry::content_width(400.0, 0.9) == doctest::Approx(360.0));
    CHECK(geometry::content_width(400.0, 0.0) == doctest::Approx(360.0));
    CHECK(geometry::content_width(400.0, 2.0) == doctest::Approx(400.0));
    CHECK(geometry::content_width(0.0, 0.9) == doctest::Approx(0.0));
    CHECK(geometry::portrait_extent(1280, 720) == 720);
    CHECK(geometry::portrait_extent(390, 844) == 390);
    CHECK(geometry::portrait_extent(-5, 100) == 0);
}
