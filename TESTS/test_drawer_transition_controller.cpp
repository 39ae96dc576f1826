#include "doctest/doctest.h"

#include <vector>

#include "core/drawer_transition_controller.hpp"
#include "stubs/recording_drawer_handler.hpp"

using drawerkit::Direction;
using drawerkit::DrawerConfig;
using drawerkit::DrawerTransitionController;
using drawerkit::GesturePhase;
using drawerkit::GestureSample;
using drawerkit::GestureSource;
using drawerkit::TransitionState;

namespace {

DrawerConfig config_for(Direction direction) {
    DrawerConfig config;
    config.direction = direction;
    config.background_dimmed = true;
    return config;
}

struct CountingListener {
    std::vector<bool> seen;
    drawerkit::DrawerState::Listener fn() {
        return [this](bool expanded) { seen.push_back(expanded); };
    }
};

} // namespace

TEST_CASE("controller starts collapsed with no transition percent") {
    DrawerTransitionController controller(config_for(Direction::Left));
    CHECK(controller.state() == TransitionState::Collapsed);
    CHECK_FALSE(controller.percent().has_value());
    CHECK_FALSE(controller.is_expanded().has_value());
    CHECK_FALSE(controller.gesture_active());
    CHECK(controller.resolved_offset(300.0) == doctest::Approx(-300.0));
    CHECK(controller.resolved_dim_opacity(0.4) == doctest::Approx(0.0));
}

TEST_CASE("accepted gesture percent always lies in [0,1]") {
    for (double extent : {1.0, 50.0, 320.0, 1024.0}) {
        for (double delta : {0.0, 0.25, 1.0, 17.0, 49.5, 50.0, 320.0, 900.0, 1024.0, 4000.0}) {
            DrawerTransitionController controller(config_for(Direction::Left));
            controller.on_gesture_changed(delta, extent, false, true);
            if (delta <= extent) {
                REQUIRE(controller.percent().has_value());
                CHECK(*controller.percent() == doctest::Approx(delta / extent));
            }
            if (controller.percent()) {
                CHECK(*controller.percent() >= 0.0);
                CHECK(*controller.percent() <= 1.0);
                CHECK(controller.state() == TransitionState::InTransition);
            } else {
                CHECK(controller.state() == TransitionState::Collapsed);
            }
        }
    }
}

TEST_CASE("non-positive axis length is a no-op") {
    RecordingDrawerHandler handler;
    DrawerTransitionController controller(config_for(Direction::Left), &handler);
    controller.on_gesture_changed(20.0, 0.0, false, true);
    controller.on_gesture_changed(20.0, -100.0, false, true);
    CHECK(controller.state() == TransitionState::Collapsed);
    CHECK_FALSE(controller.percent().has_value());
    CHECK_FALSE(controller.gesture_active());
    CHECK(handler.updates.empty());
}

TEST_CASE("drag past the full extent is ignored") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.on_gesture_changed(40.0, 100.0, false, true);
    controller.on_gesture_changed(150.0, 100.0, false, true);
    REQUIRE(controller.percent().has_value());
    CHECK(*controller.percent() == doctest::Approx(0.4));
}

TEST_CASE("gesture updates reach the rendering layer with the animated flag") {
    RecordingDrawerHandler handler;
    DrawerTransitionController controller(config_for(Direction::Left), &handler);
    controller.on_gesture_changed(25.0, 100.0, false, true);
    controller.on_gesture_changed(30.0, 100.0, false, false);
    REQUIRE(handler.updates.size() == 2);
    CHECK(handler.updates[0].animated);
    CHECK_FALSE(handler.updates[1].animated);
    CHECK(handler.updates[1].snapshot.state == TransitionState::InTransition);
    REQUIRE(handler.updates[1].snapshot.percent.has_value());
    CHECK(*handler.updates[1].snapshot.percent == doctest::Approx(0.30));
}

TEST_CASE("release at or past the threshold expands") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.on_gesture_changed(30.0, 100.0, false, true);
    controller.on_gesture_ended(false);
    CHECK(controller.state() == TransitionState::Expanded);
    CHECK_FALSE(controller.percent().has_value());
    REQUIRE(controller.is_expanded().has_value());
    CHECK(*controller.is_expanded());
    CHECK_FALSE(controller.gesture_active());
}

TEST_CASE("release short of the threshold snaps back") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.on_gesture_changed(10.0, 100.0, false, true);
    controller.on_gesture_ended(false);
    CHECK(controller.state() == TransitionState::Collapsed);
    CHECK_FALSE(controller.percent().has_value());
    REQUIRE(controller.is_expanded().has_value());
    CHECK_FALSE(*controller.is_expanded());
}

TEST_CASE("inverse release compares the complement against the threshold") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.set_expanded(true);
    controller.on_gesture_changed(-20.0, 100.0, true, true);
    REQUIRE(controller.percent().has_value());
    CHECK(*controller.percent() == doctest::Approx(0.80));
    controller.on_gesture_ended(true);
    CHECK(controller.state() == TransitionState::Expanded);
    CHECK(*controller.is_expanded());
}

TEST_CASE("inverse release past the threshold collapses") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.set_expanded(true);
    controller.on_gesture_changed(-60.0, 100.0, true, true);
    controller.on_gesture_ended(true);
    CHECK(controller.state() == TransitionState::Collapsed);
    CHECK_FALSE(*controller.is_expanded());
}

TEST_CASE("snap target polarity") {
    CHECK(DrawerTransitionController::snap_target(0.30, false, 0.225));
    CHECK(DrawerTransitionController::snap_target(0.225, false, 0.225));
    CHECK_FALSE(DrawerTransitionController::snap_target(0.10, false, 0.225));
    CHECK(DrawerTransitionController::snap_target(0.80, true, 0.225));
    CHECK_FALSE(DrawerTransitionController::snap_target(0.50, true, 0.225));
}

TEST_CASE("gesture end without a transition is a no-op") {
    RecordingDrawerHandler handler;
    DrawerTransitionController controller(config_for(Direction::Left), &handler);
    controller.on_gesture_ended(false);
    controller.on_gesture_ended(true);
    CHECK(controller.state() == TransitionState::Collapsed);
    CHECK_FALSE(controller.is_expanded().has_value());
    CHECK(handler.settles.empty());
}

TEST_CASE("left drawer ignores a further push to the left while collapsed") {
    RecordingDrawerHandler handler;
    DrawerTransitionController controller(config_for(Direction::Left), &handler);
    controller.on_gesture_changed(-30.0, 100.0, false, true);
    CHECK(controller.state() == TransitionState::Collapsed);
    CHECK_FALSE(controller.percent().has_value());
    CHECK_FALSE(controller.gesture_active());
    CHECK(handler.updates.empty());
}

TEST_CASE("right drawer opens with leftward motion and rejects rightward motion") {
    DrawerTransitionController controller(config_for(Direction::Right));
    controller.on_gesture_changed(30.0, 100.0, false, true);
    CHECK(controller.state() == TransitionState::Collapsed);
    controller.on_gesture_changed(-30.0, 100.0, false, true);
    CHECK(controller.state() == TransitionState::InTransition);
    REQUIRE(controller.percent().has_value());
    CHECK(*controller.percent() == doctest::Approx(0.30));
}

TEST_CASE("open drawer ignores drags that would pull it further open") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.set_expanded(true);
    controller.on_gesture_changed(40.0, 100.0, true, true);
    CHECK(controller.state() == TransitionState::Expanded);
    CHECK_FALSE(controller.percent().has_value());
}

TEST_CASE("repeated expand requests notify once") {
    DrawerTransitionController controller(config_for(Direction::Left));
    CountingListener listener;
    controller.add_state_change_listener(listener.fn());
    controller.set_expanded(true);
    controller.set_expanded(true);
    REQUIRE(listener.seen.size() == 1);
    CHECK(listener.seen.front());
}

TEST_CASE("expand then collapse restores collapsed offset and opacity") {
    DrawerTransitionController controller(config_for(Direction::Left));
    const double offset_before = controller.resolved_offset(270.0);
    const double opacity_before = controller.resolved_dim_opacity(0.4, true);

    controller.set_expanded(true);
    CHECK(controller.resolved_offset(270.0) == doctest::Approx(0.0));
    CHECK(controller.resolved_dim_opacity(0.4, true) == doctest::Approx(0.4));

    controller.set_expanded(false);
    CHECK(controller.resolved_offset(270.0) == doctest::Approx(offset_before));
    CHECK(controller.resolved_dim_opacity(0.4, true) == doctest::Approx(opacity_before));
}

TEST_CASE("request during a live gesture waits for the gesture to end") {
    RecordingDrawerHandler handler;
    DrawerTransitionController controller(config_for(Direction::Left), &handler);
    CountingListener listener;
    controller.add_state_change_listener(listener.fn());

    controller.on_gesture_changed(30.0, 100.0, false, true);
    controller.set_expanded(true);
    CHECK(controller.state() == TransitionState::InTransition);
    REQUIRE(controller.percent().has_value());
    CHECK(*controller.percent() == doctest::Approx(0.30));
    CHECK_FALSE(controller.is_expanded().has_value());
    REQUIRE(controller.pending_request().has_value());
    CHECK(*controller.pending_request());
    CHECK(handler.settles.empty());
    CHECK(listener.seen.empty());

    controller.on_gesture_ended(false);
    CHECK(controller.state() == TransitionState::Expanded);
    CHECK_FALSE(controller.pending_request().has_value());
    REQUIRE(listener.seen.size() == 1);
    CHECK(listener.seen.front());
}

TEST_CASE("threshold decision wins over a request made during the gesture") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.on_gesture_changed(10.0, 100.0, false, true);
    controller.set_expanded(true);
    controller.on_gesture_ended(false);
    CHECK(controller.state() == TransitionState::Collapsed);
    CHECK_FALSE(*controller.is_expanded());
}

TEST_CASE("notification waits for the settle animation to complete") {
    RecordingDrawerHandler handler;
    handler.auto_complete = false;
    DrawerConfig config = config_for(Direction::Left);
    config.animation_duration = 0.3;
    DrawerTransitionController controller(config, &handler);
    CountingListener listener;
    controller.add_state_change_listener(listener.fn());

    controller.set_expanded(true);
    CHECK(controller.state() == TransitionState::Expanded);
    CHECK_FALSE(controller.percent().has_value());
    CHECK(controller.settling());
    REQUIRE(handler.settles.size() == 1);
    CHECK(handler.settles[0].duration == doctest::Approx(0.3));
    CHECK(handler.settles[0].target.state == TransitionState::Expanded);
    CHECK(listener.seen.empty());

    handler.complete_all();
    CHECK_FALSE(controller.settling());
    REQUIRE(listener.seen.size() == 1);
    CHECK(listener.seen.front());
}

TEST_CASE("gesture takes over an in-flight settle") {
    RecordingDrawerHandler handler;
    handler.auto_complete = false;
    DrawerTransitionController controller(config_for(Direction::Left), &handler);
    CountingListener listener;
    controller.add_state_change_listener(listener.fn());

    controller.set_expanded(true);
    REQUIRE(handler.pending.size() == 1);
    auto stale = handler.pending.front();
    handler.pending.clear();

    controller.on_gesture_changed(-50.0, 100.0, true, true);
    CHECK(controller.gesture_active());
    CHECK_FALSE(controller.settling());
    CHECK(controller.state() == TransitionState::InTransition);

    stale();
    CHECK(listener.seen.empty());
    CHECK(controller.state() == TransitionState::InTransition);

    controller.on_gesture_ended(true);
    handler.complete_all();
    CHECK(controller.state() == TransitionState::Collapsed);
    REQUIRE(listener.seen.size() == 1);
    CHECK_FALSE(listener.seen.front());
}

TEST_CASE("cancelled gesture settles back to where it started") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.set_expanded(true);
    controller.on_gesture_changed(-70.0, 100.0, true, true);
    controller.on_gesture_cancelled();
    CHECK_FALSE(controller.gesture_active());
    CHECK(controller.state() == TransitionState::Expanded);
    CHECK(*controller.is_expanded());
}

TEST_CASE("cancelled gesture applies the request it held back") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.on_gesture_changed(60.0, 100.0, false, true);
    controller.set_expanded(true);
    controller.on_gesture_cancelled();
    CHECK(controller.state() == TransitionState::Expanded);
    CHECK_FALSE(controller.pending_request().has_value());
}

TEST_CASE("cancel without a live gesture does nothing") {
    RecordingDrawerHandler handler;
    DrawerTransitionController controller(config_for(Direction::Left), &handler);
    controller.on_gesture_cancelled();
    CHECK(handler.settles.empty());
    CHECK_FALSE(controller.is_expanded().has_value());
}

TEST_CASE("gesture sources map to the inverse flag") {
    DrawerTransitionController controller(config_for(Direction::Left));

    controller.handle_gesture(GestureSample{GesturePhase::Changed, 40.0}, GestureSource::Presenting, 100.0);
    REQUIRE(controller.percent().has_value());
    CHECK(*controller.percent() == doctest::Approx(0.40));
    controller.handle_gesture(GestureSample{GesturePhase::Ended, 40.0}, GestureSource::Presenting, 100.0);
    CHECK(controller.state() == TransitionState::Expanded);

    controller.handle_gesture(GestureSample{GesturePhase::Changed, -10.0}, GestureSource::Drawer, 100.0);
    REQUIRE(controller.percent().has_value());
    CHECK(*controller.percent() == doctest::Approx(0.90));
    controller.handle_gesture(GestureSample{GesturePhase::Ended, -10.0}, GestureSource::Drawer, 100.0);
    CHECK(controller.state() == TransitionState::Expanded);
}

TEST_CASE("background tap and disappearance collapse the drawer") {
    DrawerTransitionController controller(config_for(Direction::Right));
    controller.set_expanded(true);
    controller.on_background_tap();
    CHECK(controller.state() == TransitionState::Collapsed);

    controller.set_expanded(true);
    controller.on_disappear();
    CHECK(controller.state() == TransitionState::Collapsed);
    CHECK(controller.resolved_offset(200.0) == doctest::Approx(200.0));
}

TEST_CASE("removed listeners are not notified") {
    DrawerTransitionController controller(config_for(Direction::Left));
    CountingListener kept;
    CountingListener removed;
    controller.add_state_change_listener(kept.fn());
    const auto id = controller.add_state_change_listener(removed.fn());
    controller.remove_state_change_listener(id);
    controller.set_expanded(true);
    CHECK(kept.seen.size() == 1);
    CHECK(removed.seen.empty());
}

TEST_CASE("settle completion after the controller is gone is harmless") {
    RecordingDrawerHandler handler;
    handler.auto_complete = false;
    {
        DrawerTransitionController controller(config_for(Direction::Left), &handler);
        controller.set_expanded(true);
    }
    REQUIRE(handler.pending.size() == 1);
    handler.complete_all();
    CHECK(handler.pending.empty());
}

TEST_CASE("snap threshold and duration setters sanitize input") {
    DrawerTransitionController controller(config_for(Direction::Left));
    controller.set_snap_threshold(1.7);
    CHECK(controller.config().snap_threshold == doctest::Approx(1.0));
    controller.set_snap_threshold(0.5);
    controller.on_gesture_changed(40.0, 100.0, false, true);
    controller.on_gesture_ended(false);
    CHECK(controller.state() == TransitionState::Collapsed);

    controller.set_animation_duration(-2.0);
    CHECK(controller.config().animation_duration == doctest::Approx(0.0));
    controller.set_animation_duration(0.25);
    CHECK(controller.config().animation_duration == doctest::Approx(0.25));
}

TEST_CASE("listener re-requesting from its callback leaves every observer in agreement") {
    DrawerTransitionController controller;
    controller.add_state_change_listener([&](bool expanded) {
        if (expanded) {
            controller.set_expanded(false);
        }
    });
    CountingListener later;
    controller.add_state_change_listener(later.fn());

    controller.set_expanded(true);

    CHECK(controller.state() == TransitionState::Collapsed);
    REQUIRE(controller.is_expanded().has_value());
    CHECK_FALSE(*controller.is_expanded());
    REQUIRE(later.seen.size() == 2);
    CHECK(later.seen[0]);
    CHECK_FALSE(later.seen[1]);
}
