#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "core/drawer_config.hpp"
#include "core/drawer_event_handler.hpp"
#include "core/drawer_state.hpp"
#include "core/drawer_types.hpp"

namespace drawerkit {

class DrawerTransitionController {
public:
    explicit DrawerTransitionController(const DrawerConfig& config = DrawerConfig{},
                                        DrawerEventHandler* handler = nullptr);
    ~DrawerTransitionController();

    DrawerTransitionController(const DrawerTransitionController&) = delete;
    DrawerTransitionController& operator=(const DrawerTransitionController&) = delete;

    // `delta` is the signed translation since the gesture started, `axis_length`
    // the drawer's full extent. `reverse_direction` is set for drags on the open
    // drawer, whose motion closes it.
    void on_gesture_changed(double delta, double axis_length, bool reverse_direction, bool animated);
    void on_gesture_ended(bool inverse);
    void on_gesture_cancelled();
    void handle_gesture(const GestureSample& sample, GestureSource source, double axis_length);

    void set_expanded(bool expanded);
    void on_background_tap();
    void on_disappear();

    DrawerRequest is_expanded() const { return model_.request(); }
    TransitionState state() const { return state_; }
    const std::optional<double>& percent() const { return percent_; }
    Direction direction() const { return config_.direction; }
    DrawerSnapshot snapshot() const;

    bool gesture_active() const { return gesture_active_; }
    bool settling() const { return settling_; }
    const DrawerRequest& pending_request() const { return pending_request_; }

    double resolved_offset(double content_width) const;
    double resolved_dim_opacity(double max_opacity, bool dim_enabled) const;
    double resolved_dim_opacity(double max_opacity) const;

    DrawerState::ListenerId add_state_change_listener(DrawerState::Listener listener);
    void remove_state_change_listener(DrawerState::ListenerId id);

    const DrawerConfig& config() const { return config_; }
    void set_animation_duration(double seconds);
    void set_snap_threshold(double threshold);
    void set_background_dimmed(bool dimmed);

    static bool snap_target(double percent, bool inverse, double threshold);

private:
    void begin_gesture();
    void begin_settle(bool expanded);
    void finish_settle(std::uint64_t generation, bool expanded);
    bool accepts_delta(double delta, bool reverse_direction) const;

    DrawerConfig config_;
    DrawerEventHandler* handler_ = nullptr;
    DrawerState model_;

    TransitionState state_ = TransitionState::Collapsed;
    std::optional<double> percent_{};

    bool gesture_active_ = false;
    TransitionState gesture_origin_ = TransitionState::Collapsed;
    DrawerRequest pending_request_{};

    bool settling_ = false;
    std::uint64_t settle_generation_ = 0;
    std::shared_ptr<bool> alive_;
};

}
