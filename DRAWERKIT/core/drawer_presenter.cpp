#include "core/drawer_presenter.hpp"

#include <string>
#include <utility>

#include "core/drawer_transition_controller.hpp"
#include "utils/log.hpp"

namespace drawerkit {

DrawerPresenter::DrawerPresenter(DrawerTransitionController& controller)
    : controller_(controller) {
    listener_id_ = controller_.add_state_change_listener([this](bool expanded) { handle_state_change(expanded); });
}

DrawerPresenter::~DrawerPresenter() {
    controller_.remove_state_change_listener(listener_id_);
}

double DrawerPresenter::transition_duration(bool animated) {
    return animated ? kLinearAnimationDuration : kDisabledAnimationDuration;
}

void DrawerPresenter::set_on_state_changed(StateCallback cb) { on_state_changed_ = std::move(cb); }
void DrawerPresenter::set_on_dismissed(DismissCallback cb) { on_dismissed_ = std::move(cb); }

void DrawerPresenter::present(bool animated) {
    if (presented_) {
        return;
    }
    presented_ = true;
    log::info("[DrawerPresenter] Presenting drawer" + std::string(animated ? " (animated)" : ""));
    controller_.set_animation_duration(transition_duration(animated));
    controller_.set_expanded(true);
}

void DrawerPresenter::dismiss(bool animated) {
    if (!presented_) {
        return;
    }
    controller_.set_animation_duration(transition_duration(animated));
    controller_.set_expanded(false);
}

void DrawerPresenter::handle_state_change(bool expanded) {
    if (on_state_changed_) {
        on_state_changed_(expanded);
    }
    if (expanded || !presented_) {
        return;
    }
    presented_ = false;
    log::info("[DrawerPresenter] Drawer dismissed");
    if (on_dismissed_) {
        on_dismissed_();
    }
}

}
