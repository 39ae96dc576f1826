#pragma once

#include <SDL.h>

#include "core/drawer_types.hpp"

namespace drawerkit {
class DrawerTransitionController;
}

namespace drawerkit::ui {

class SlideOverPanel;

// Turns SDL mouse and touch events into drawer gesture samples. A press near
// the drawer's edge while collapsed starts the presenting gesture; a press
// anywhere while expanded starts the drawer gesture. A press and release on
// the scrim that stays within the tap slop collapses the drawer.
class DrawerInputRouter {
public:
    DrawerInputRouter(DrawerTransitionController& controller, const SlideOverPanel& panel);

    // Returns true when the event was consumed by the drawer.
    bool handle_event(const SDL_Event& e);

    void cancel();

    bool is_tracking() const { return tracking_; }
    bool is_dragging() const { return dragging_; }
    GestureSource source() const { return source_; }

private:
    bool begin(const SDL_Point& p, bool touch, SDL_FingerID finger);
    bool move(const SDL_Point& p);
    bool end(const SDL_Point& p);
    bool in_edge_zone(const SDL_Point& p) const;
    void reset();

    DrawerTransitionController& controller_;
    const SlideOverPanel& panel_;

    bool tracking_ = false;
    bool dragging_ = false;
    bool tap_candidate_ = false;
    bool touch_ = false;
    SDL_FingerID finger_ = 0;
    GestureSource source_ = GestureSource::Drawer;
    SDL_Point press_{0, 0};
};

}
