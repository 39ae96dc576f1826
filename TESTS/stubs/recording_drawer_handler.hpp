#pragma once

#include <utility>
#include <vector>

#include "core/drawer_event_handler.hpp"

// Records everything the controller asks of the rendering layer. With
// auto_complete off, settle completions are held until complete_all().
class RecordingDrawerHandler : public drawerkit::DrawerEventHandler {
public:
    struct Update {
        drawerkit::DrawerSnapshot snapshot;
        bool animated = false;
    };

    struct Settle {
        drawerkit::DrawerSnapshot target;
        double duration = 0.0;
    };

    void on_transition_update(const drawerkit::DrawerSnapshot& snapshot, bool animated) override {
        updates.push_back(Update{snapshot, animated});
    }

    void on_settle(const drawerkit::DrawerSnapshot& target, double duration_seconds, Completion completion) override {
        settles.push_back(Settle{target, duration_seconds});
        if (auto_complete) {
            completion();
        } else {
            pending.push_back(std::move(completion));
        }
    }

    void complete_all() {
        auto ready = std::move(pending);
        pending.clear();
        for (auto& completion : ready) {
            completion();
        }
    }

    bool auto_complete = true;
    std::vector<Update> updates;
    std::vector<Settle> settles;
    std::vector<Completion> pending;
};
