#include "core/drawer_transition_controller.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "core/drawer_geometry.hpp"
#include "utils/log.hpp"

namespace drawerkit {

namespace {

std::string describe(bool expanded) {
    return expanded ? "expand" : "collapse";
}

}

DrawerTransitionController::DrawerTransitionController(const DrawerConfig& config,
                                                       DrawerEventHandler* handler)
    : config_(sanitized(config)),
      handler_(handler),
      alive_(std::make_shared<bool>(true)) {}

DrawerTransitionController::~DrawerTransitionController() {
    *alive_ = false;
}

bool DrawerTransitionController::snap_target(double percent, bool inverse, double threshold) {
    const double snap = inverse ? 1.0 - percent : percent;
    return inverse ? snap < threshold : snap >= threshold;
}

bool DrawerTransitionController::accepts_delta(double delta, bool reverse_direction) const {
    const double opening_sign = (config_.direction == Direction::Left) ? 1.0 : -1.0;
    const double expected_sign = reverse_direction ? -opening_sign : opening_sign;
    return delta * expected_sign >= 0.0;
}

void DrawerTransitionController::begin_gesture() {
    gesture_active_ = true;
    gesture_origin_ = (state_ == TransitionState::InTransition) ? TransitionState::Collapsed : state_;
    if (settling_) {
        // The pending completion becomes stale; the gesture owns the drawer now.
        ++settle_generation_;
        settling_ = false;
        log::debug("[DrawerTransitionController] Gesture took over an in-flight settle");
    }
}

void DrawerTransitionController::on_gesture_changed(double delta,
                                                    double axis_length,
                                                    bool reverse_direction,
                                                    bool animated) {
    if (!std::isfinite(axis_length) || axis_length <= 0.0 || !std::isfinite(delta)) {
        log::debug("[DrawerTransitionController] Ignoring sample with axis length " + std::to_string(axis_length));
        return;
    }
    if (!accepts_delta(delta, reverse_direction)) {
        log::debug("[DrawerTransitionController] Ignoring sample against the " +
                   std::string(to_string(config_.direction)) + " drawer's direction: " + std::to_string(delta));
        return;
    }

    const double raw_percent = std::fabs(delta) / axis_length;
    if (!geometry::is_valid_percent(raw_percent)) {
        return;
    }

    if (!gesture_active_) {
        begin_gesture();
    }
    state_ = TransitionState::InTransition;
    percent_ = reverse_direction ? 1.0 - raw_percent : raw_percent;

    if (handler_) {
        handler_->on_transition_update(snapshot(), animated);
    }
}

void DrawerTransitionController::on_gesture_ended(bool inverse) {
    if (!percent_) {
        return;
    }
    const double percent = *percent_;
    const bool target = snap_target(percent, inverse, config_.snap_threshold);
    log::debug("[DrawerTransitionController] Gesture ended at " + std::to_string(percent) +
               (inverse ? " (inverse)" : "") + ", snapping to " + describe(target));

    gesture_active_ = false;
    if (pending_request_) {
        log::debug("[DrawerTransitionController] Dropping request made during the gesture");
        pending_request_.reset();
    }
    set_expanded(target);
}

void DrawerTransitionController::on_gesture_cancelled() {
    if (!gesture_active_) {
        return;
    }
    gesture_active_ = false;
    const bool target = pending_request_ ? *pending_request_ : (gesture_origin_ == TransitionState::Expanded);
    pending_request_.reset();
    log::debug("[DrawerTransitionController] Gesture cancelled, settling to " + describe(target));
    set_expanded(target);
}

void DrawerTransitionController::handle_gesture(const GestureSample& sample,
                                                GestureSource source,
                                                double axis_length) {
    const bool inverse = (source == GestureSource::Drawer);
    switch (sample.phase) {
    case GesturePhase::Changed:
        on_gesture_changed(sample.translation, axis_length, inverse, true);
        break;
    case GesturePhase::Ended:
        on_gesture_ended(inverse);
        break;
    case GesturePhase::Cancelled:
        on_gesture_cancelled();
        break;
    }
}

void DrawerTransitionController::set_expanded(bool expanded) {
    if (gesture_active_) {
        pending_request_ = expanded;
        log::debug("[DrawerTransitionController] Deferring " + describe(expanded) + " request while a gesture is live");
        return;
    }
    model_.set_request(expanded);
    begin_settle(expanded);
}

void DrawerTransitionController::on_background_tap() {
    set_expanded(false);
}

void DrawerTransitionController::on_disappear() {
    set_expanded(false);
}

void DrawerTransitionController::begin_settle(bool expanded) {
    state_ = expanded ? TransitionState::Expanded : TransitionState::Collapsed;
    percent_.reset();
    settling_ = true;
    const std::uint64_t generation = ++settle_generation_;

    std::weak_ptr<bool> alive = alive_;
    auto completion = [this, alive, generation, expanded]() {
        auto token = alive.lock();
        if (!token || !*token) {
            return;
        }
        finish_settle(generation, expanded);
    };

    if (!handler_) {
        completion();
        return;
    }
    handler_->on_settle(snapshot(), config_.animation_duration, std::move(completion));
}

void DrawerTransitionController::finish_settle(std::uint64_t generation, bool expanded) {
    if (generation != settle_generation_) {
        log::debug("[DrawerTransitionController] Ignoring stale settle completion");
        return;
    }
    settling_ = false;
    if (model_.notify_if_changed(expanded)) {
        log::info("[DrawerTransitionController] Drawer " + std::string(expanded ? "expanded" : "collapsed"));
    }
}

DrawerSnapshot DrawerTransitionController::snapshot() const {
    DrawerSnapshot snap;
    snap.state = state_;
    snap.percent = percent_;
    snap.direction = config_.direction;
    return snap;
}

double DrawerTransitionController::resolved_offset(double content_width) const {
    return geometry::resolve_offset(state_, percent_, config_.direction, content_width);
}

double DrawerTransitionController::resolved_dim_opacity(double max_opacity, bool dim_enabled) const {
    return geometry::resolve_dim_opacity(state_, percent_, max_opacity, dim_enabled);
}

double DrawerTransitionController::resolved_dim_opacity(double max_opacity) const {
    return resolved_dim_opacity(max_opacity, config_.background_dimmed);
}

DrawerState::ListenerId DrawerTransitionController::add_state_change_listener(DrawerState::Listener listener) {
    return model_.add_listener(std::move(listener));
}

void DrawerTransitionController::remove_state_change_listener(DrawerState::ListenerId id) {
    model_.remove_listener(id);
}

void DrawerTransitionController::set_animation_duration(double seconds) {
    config_.animation_duration = (std::isfinite(seconds) && seconds > 0.0) ? seconds : 0.0;
}

void DrawerTransitionController::set_snap_threshold(double threshold) {
    DrawerConfig next = config_;
    next.snap_threshold = threshold;
    config_.snap_threshold = sanitized(next).snap_threshold;
}

void DrawerTransitionController::set_background_dimmed(bool dimmed) {
    config_.background_dimmed = dimmed;
}

}
