#pragma once

#include <SDL.h>

#include <functional>

#include "core/drawer_config.hpp"
#include "core/drawer_event_handler.hpp"
#include "core/drawer_types.hpp"
#include "ui/drawer_tokens.hpp"
#include "utils/settle_tween.hpp"

namespace drawerkit::ui {

// SDL host for a drawer: lays out the sliding content and the scrim behind it,
// runs settle animations requested by the controller and draws both layers.
class SlideOverPanel : public DrawerEventHandler {
public:
    using RenderFunction = std::function<void(SDL_Renderer*, const SDL_Rect& content_rect)>;

    explicit SlideOverPanel(const DrawerConfig& config, const DrawerTokens& tokens = DrawerTokens::Default());

    void on_transition_update(const DrawerSnapshot& snapshot, bool animated) override;
    void on_settle(const DrawerSnapshot& target, double duration_seconds, Completion completion) override;

    void set_render_function(RenderFunction fn);
    void set_tokens(const DrawerTokens& tokens) { tokens_ = tokens; }
    void set_background_dimmed(bool dimmed) { config_.background_dimmed = dimmed; }
    void set_settle_curve(SettleCurve curve) { tween_.curve = curve; }

    void update(double dt_seconds);
    void layout(int screen_w, int screen_h);
    void render(SDL_Renderer* renderer) const;

    // Snapshot currently on screen, including an in-flight settle.
    DrawerSnapshot displayed() const;
    bool is_settling() const { return tween_.active; }

    double extent() const { return extent_; }
    double content_width() const;
    double offset() const;
    double scrim_opacity() const;
    double shadow_opacity() const;

    SDL_Rect content_rect() const;
    SDL_Color scrim_color() const;
    bool is_point_inside_content(int x, int y) const;
    bool is_point_on_scrim(int x, int y) const;

    int screen_width() const { return screen_w_; }
    int screen_height() const { return screen_h_; }

private:
    double openness() const;
    void finish_settle();

    DrawerConfig config_;
    DrawerTokens tokens_;
    RenderFunction render_function_{};

    DrawerSnapshot snapshot_{};
    DrawerSnapshot settle_target_{};
    SettleTween tween_{};
    bool tracking_ = false;
    Completion settle_completion_{};

    int screen_w_ = 0;
    int screen_h_ = 0;
    double extent_ = 0.0;
};

}
