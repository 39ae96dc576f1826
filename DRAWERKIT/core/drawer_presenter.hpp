#pragma once

#include <functional>

#include "core/drawer_state.hpp"

namespace drawerkit {

class DrawerTransitionController;

// Presents and dismisses a drawer as a modal overlay. Collapsing the drawer by
// any means (tap, gesture, request) while presented dismisses it.
class DrawerPresenter {
public:
    static constexpr double kLinearAnimationDuration = 0.25;
    static constexpr double kDisabledAnimationDuration = 0.0;

    using StateCallback = std::function<void(bool expanded)>;
    using DismissCallback = std::function<void()>;

    explicit DrawerPresenter(DrawerTransitionController& controller);
    ~DrawerPresenter();

    DrawerPresenter(const DrawerPresenter&) = delete;
    DrawerPresenter& operator=(const DrawerPresenter&) = delete;

    void present(bool animated);
    void dismiss(bool animated);
    bool is_presented() const { return presented_; }

    void set_on_state_changed(StateCallback cb);
    void set_on_dismissed(DismissCallback cb);

    static double transition_duration(bool animated);

private:
    void handle_state_change(bool expanded);

    DrawerTransitionController& controller_;
    DrawerState::ListenerId listener_id_ = 0;
    bool presented_ = false;
    StateCallback on_state_changed_{};
    DismissCallback on_dismissed_{};
};

}
