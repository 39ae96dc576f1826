#include "doctest/doctest.h"

#include "utils/settle_tween.hpp"

TEST_CASE("zero-duration tween lands immediately") {
    SettleTween tween;
    tween.start(0.0, 1.0, 0.0);
    CHECK_FALSE(tween.active);
    CHECK(tween.value() == doctest::Approx(1.0));
    CHECK_FALSE(tween.advance(0.016));
}

TEST_CASE("ease-in-out tween is symmetric about its midpoint") {
    SettleTween tween;
    tween.start(0.0, 1.0, 1.0);
    tween.advance(0.25);
    const double quarter = tween.value();
    tween.advance(0.25);
    CHECK(tween.value() == doctest::Approx(0.5));
    tween.advance(0.25);
    CHECK(tween.value() == doctest::Approx(1.0 - quarter));
    CHECK(tween.advance(0.5));
    CHECK(tween.value() == doctest::Approx(1.0));
    CHECK_FALSE(tween.active);
}

TEST_CASE("linear tween tracks elapsed time") {
    SettleTween tween;
    tween.curve = SettleCurve::Linear;
    tween.start(1.0, 0.0, 0.5);
    tween.advance(0.1);
    CHECK(tween.value() == doctest::Approx(0.8));
}

TEST_CASE("negative frame time does not move the tween") {
    SettleTween tween;
    tween.start(0.0, 1.0, 1.0);
    tween.advance(-3.0);
    CHECK(tween.value() == doctest::Approx(0.0));
    CHECK(tween.active);
}
