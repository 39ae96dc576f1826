#include "core/drawer_state.hpp"

#include <algorithm>
#include <utility>

namespace drawerkit {

DrawerState::ListenerId DrawerState::add_listener(Listener listener) {
    if (!listener) {
        return 0;
    }
    const ListenerId id = next_id_++;
    listeners_.push_back(Entry{id, std::move(listener)});
    return id;
}

void DrawerState::remove_listener(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const Entry& e) { return e.id == id; }),
                     listeners_.end());
}

void DrawerState::clear_listeners() {
    listeners_.clear();
}

bool DrawerState::notify_if_changed(bool expanded) {
    if (last_notified_ && *last_notified_ == expanded) {
        return false;
    }
    last_notified_ = expanded;
    if (notifying_) {
        queued_ = expanded;
        return true;
    }

    struct RoundGuard {
        explicit RoundGuard(DrawerState& s) : state(s) { state.notifying_ = true; }
        ~RoundGuard() {
            state.notifying_ = false;
            state.queued_.reset();
        }
        DrawerState& state;
    } guard(*this);

    DrawerRequest next = expanded;
    while (next) {
        const bool value = *next;
        queued_.reset();
        // Listeners may add or remove listeners from inside the callback.
        const auto snapshot = listeners_;
        for (const auto& entry : snapshot) {
            entry.listener(value);
        }
        next = queued_;
        if (next && *next == value) {
            break;
        }
    }
    return true;
}

}
