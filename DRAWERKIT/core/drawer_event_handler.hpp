#pragma once

#include <functional>

#include "core/drawer_types.hpp"

namespace drawerkit {

// Implemented by the rendering layer and handed to DrawerTransitionController.
class DrawerEventHandler {
public:
    using Completion = std::function<void()>;

    virtual ~DrawerEventHandler() = default;

    // Gesture-driven update. `animated` is true while a drag is live-tracking.
    virtual void on_transition_update(const DrawerSnapshot& snapshot, bool animated) = 0;

    // Animate to the settled `target` over `duration_seconds` and call
    // `completion` once on the UI thread when done. Completion may be called
    // synchronously.
    virtual void on_settle(const DrawerSnapshot& target, double duration_seconds, Completion completion) = 0;
};

}
