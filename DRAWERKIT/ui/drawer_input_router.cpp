#include "ui/drawer_input_router.hpp"

#include <cstdlib>
#include <string>

#include "core/drawer_transition_controller.hpp"
#include "ui/slide_over_panel.hpp"
#include "utils/log.hpp"
#include "utils/sdl_pointer_utils.hpp"

namespace drawerkit::ui {

DrawerInputRouter::DrawerInputRouter(DrawerTransitionController& controller, const SlideOverPanel& panel)
    : controller_(controller),
      panel_(panel) {}

bool DrawerInputRouter::handle_event(const SDL_Event& e) {
    if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
        cancel();
        return false;
    }

    const auto pointer = sdl::pointer_from_event(e, panel_.screen_width(), panel_.screen_height());
    if (!pointer) {
        return false;
    }
    if (tracking_ && (pointer->touch != touch_ || (touch_ && pointer->finger != finger_))) {
        return tracking_;
    }

    switch (pointer->phase) {
    case sdl::PointerPhase::Down:
        return begin(pointer->point, pointer->touch, pointer->finger);
    case sdl::PointerPhase::Motion:
        return move(pointer->point);
    case sdl::PointerPhase::Up:
        return end(pointer->point);
    }
    return false;
}

bool DrawerInputRouter::in_edge_zone(const SDL_Point& p) const {
    const int margin = controller_.config().edge_drag_margin;
    if (controller_.direction() == Direction::Left) {
        return p.x >= 0 && p.x <= margin;
    }
    return p.x < panel_.screen_width() && p.x >= panel_.screen_width() - margin;
}

bool DrawerInputRouter::begin(const SDL_Point& p, bool touch, SDL_FingerID finger) {
    if (tracking_) {
        return true;
    }
    switch (controller_.state()) {
    case TransitionState::Expanded:
        source_ = GestureSource::Drawer;
        tap_candidate_ = panel_.is_point_on_scrim(p.x, p.y);
        break;
    case TransitionState::Collapsed:
        if (!in_edge_zone(p)) {
            return false;
        }
        source_ = GestureSource::Presenting;
        tap_candidate_ = false;
        break;
    case TransitionState::InTransition:
        return false;
    }

    tracking_ = true;
    dragging_ = false;
    touch_ = touch;
    finger_ = finger;
    press_ = p;
    return true;
}

bool DrawerInputRouter::move(const SDL_Point& p) {
    if (!tracking_) {
        return false;
    }
    const int dx = p.x - press_.x;
    const int dy = p.y - press_.y;
    if (!dragging_) {
        const int slop = controller_.config().tap_slop;
        if (std::abs(dx) <= slop && std::abs(dy) <= slop) {
            return true;
        }
        dragging_ = true;
        tap_candidate_ = false;
        log::debug("[DrawerInputRouter] Drag started (" + std::string(to_string(source_)) + ")");
    }
    GestureSample sample;
    sample.phase = GesturePhase::Changed;
    sample.translation = static_cast<double>(dx);
    controller_.handle_gesture(sample, source_, panel_.extent());
    return true;
}

bool DrawerInputRouter::end(const SDL_Point& p) {
    if (!tracking_) {
        return false;
    }
    if (dragging_) {
        GestureSample sample;
        sample.phase = GesturePhase::Ended;
        sample.translation = static_cast<double>(p.x - press_.x);
        controller_.handle_gesture(sample, source_, panel_.extent());
    } else if (tap_candidate_ && panel_.is_point_on_scrim(p.x, p.y)) {
        log::debug("[DrawerInputRouter] Scrim tapped");
        controller_.on_background_tap();
    }
    reset();
    return true;
}

void DrawerInputRouter::cancel() {
    if (!tracking_) {
        return;
    }
    if (dragging_) {
        GestureSample sample;
        sample.phase = GesturePhase::Cancelled;
        controller_.handle_gesture(sample, source_, panel_.extent());
    }
    reset();
}

void DrawerInputRouter::reset() {
    tracking_ = false;
    dragging_ = false;
    tap_candidate_ = false;
    touch_ = false;
    finger_ = 0;
}

}
