#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "core/drawer_types.hpp"

namespace drawerkit {

// Host-facing expand/collapse request plus the observers interested in it.
class DrawerState {
public:
    using Listener = std::function<void(bool expanded)>;
    using ListenerId = std::size_t;

    ListenerId add_listener(Listener listener);
    void remove_listener(ListenerId id);
    void clear_listeners();
    std::size_t listener_count() const { return listeners_.size(); }

    const DrawerRequest& request() const { return request_; }
    void set_request(bool expanded) { request_ = expanded; }

    const DrawerRequest& last_notified() const { return last_notified_; }

    // Fires every listener once if `expanded` differs from what they last saw.
    // A change raised from inside a listener is delivered after the current
    // round finishes, so every listener sees the values in order.
    bool notify_if_changed(bool expanded);

private:
    struct Entry {
        ListenerId id = 0;
        Listener listener;
    };

    DrawerRequest request_{};
    DrawerRequest last_notified_{};
    std::vector<Entry> listeners_;
    ListenerId next_id_ = 1;
    bool notifying_ = false;
    DrawerRequest queued_{};
};

}
