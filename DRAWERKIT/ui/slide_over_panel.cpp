#include "ui/slide_over_panel.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "core/drawer_geometry.hpp"
#include "utils/log.hpp"

namespace drawerkit::ui {

namespace {

double openness_of(const DrawerSnapshot& snapshot) {
    switch (snapshot.state) {
    case TransitionState::Expanded:
        return 1.0;
    case TransitionState::Collapsed:
        return 0.0;
    case TransitionState::InTransition:
        return snapshot.percent.value_or(0.0);
    }
    return 0.0;
}

void fill_rect(SDL_Renderer* renderer, const SDL_Rect& rect, const SDL_Color& color) {
    if (color.a == 0 || rect.w <= 0 || rect.h <= 0) {
        return;
    }
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    SDL_RenderFillRect(renderer, &rect);
}

}

SlideOverPanel::SlideOverPanel(const DrawerConfig& config, const DrawerTokens& tokens)
    : config_(sanitized(config)),
      tokens_(tokens) {
    snapshot_.direction = config_.direction;
    settle_target_.direction = config_.direction;
    tween_.reset(0.0);
}

void SlideOverPanel::set_render_function(RenderFunction fn) { render_function_ = std::move(fn); }

void SlideOverPanel::on_transition_update(const DrawerSnapshot& snapshot, bool animated) {
    const double current = openness();
    if (tween_.active && !tracking_) {
        // A gesture took over a settle; the controller drops its completion.
        settle_completion_ = nullptr;
    }
    snapshot_ = snapshot;
    tracking_ = true;
    if (animated) {
        tween_.start(current, openness_of(snapshot), config_.animation_duration);
    } else {
        tween_.reset(openness_of(snapshot));
    }
}

void SlideOverPanel::on_settle(const DrawerSnapshot& target, double duration_seconds, Completion completion) {
    const double current = openness();
    tracking_ = false;
    settle_target_ = target;
    settle_completion_ = std::move(completion);
    snapshot_.state = TransitionState::InTransition;
    snapshot_.percent = current;
    tween_.start(current, openness_of(target), duration_seconds);
    log::debug("[SlideOverPanel] Settling to " + std::string(to_string(target.state)) +
               " over " + std::to_string(duration_seconds) + "s");
    if (!tween_.active) {
        finish_settle();
    }
}

void SlideOverPanel::finish_settle() {
    snapshot_ = settle_target_;
    tween_.reset(openness_of(settle_target_));
    if (settle_completion_) {
        auto completion = std::move(settle_completion_);
        settle_completion_ = nullptr;
        completion();
    }
}

void SlideOverPanel::update(double dt_seconds) {
    if (!tween_.advance(dt_seconds)) {
        return;
    }
    if (!tracking_) {
        finish_settle();
    }
}

void SlideOverPanel::layout(int screen_w, int screen_h) {
    screen_w_ = std::max(0, screen_w);
    screen_h_ = std::max(0, screen_h);
    extent_ = static_cast<double>(geometry::portrait_extent(screen_w_, screen_h_));
}

double SlideOverPanel::openness() const {
    if (tween_.active) {
        return tween_.value();
    }
    return openness_of(snapshot_);
}

DrawerSnapshot SlideOverPanel::displayed() const {
    if (!tween_.active) {
        return snapshot_;
    }
    DrawerSnapshot shown = snapshot_;
    shown.state = TransitionState::InTransition;
    shown.percent = std::clamp(tween_.value(), 0.0, 1.0);
    return shown;
}

double SlideOverPanel::content_width() const {
    return geometry::content_width(extent_, config_.content_width_ratio);
}

double SlideOverPanel::offset() const {
    const DrawerSnapshot shown = displayed();
    return geometry::resolve_offset(shown.state, shown.percent, config_.direction, content_width());
}

double SlideOverPanel::scrim_opacity() const {
    const DrawerSnapshot shown = displayed();
    if (shown.state == TransitionState::Collapsed) {
        return tokens_.background_clear_opacity;
    }
    return geometry::resolve_dim_opacity(shown.state, shown.percent,
                                         background_layer_opacity(tokens_, config_.background_dimmed),
                                         config_.background_dimmed);
}

double SlideOverPanel::shadow_opacity() const {
    const DrawerSnapshot shown = displayed();
    return geometry::resolve_dim_opacity(shown.state, shown.percent, tokens_.shadow_opacity, config_.background_dimmed);
}

SDL_Color SlideOverPanel::scrim_color() const {
    const DrawerSnapshot shown = displayed();
    const SDL_Color base = (shown.state == TransitionState::Collapsed) ? tokens_.background_clear_color
                                                                       : tokens_.background_dimmed_color;
    return with_opacity(base, scrim_opacity());
}

SDL_Rect SlideOverPanel::content_rect() const {
    const int width = static_cast<int>(std::lround(content_width()));
    const int shift = static_cast<int>(std::lround(offset()));
    SDL_Rect rect{0, 0, width, screen_h_};
    if (config_.direction == Direction::Left) {
        rect.x = shift;
    } else {
        rect.x = screen_w_ - width + shift;
    }
    return rect;
}

bool SlideOverPanel::is_point_inside_content(int x, int y) const {
    const SDL_Rect rect = content_rect();
    if (rect.w <= 0 || rect.h <= 0) {
        return false;
    }
    SDL_Point p{x, y};
    return SDL_PointInRect(&p, &rect) == SDL_TRUE;
}

bool SlideOverPanel::is_point_on_scrim(int x, int y) const {
    if (x < 0 || y < 0 || x >= screen_w_ || y >= screen_h_) {
        return false;
    }
    return !is_point_inside_content(x, y);
}

void SlideOverPanel::render(SDL_Renderer* renderer) const {
    if (!renderer) {
        return;
    }
    const DrawerSnapshot shown = displayed();
    if (shown.state == TransitionState::Collapsed && tokens_.background_clear_opacity <= 0.0) {
        return;
    }

    SDL_BlendMode previous_mode = SDL_BLENDMODE_NONE;
    SDL_GetRenderDrawBlendMode(renderer, &previous_mode);
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    fill_rect(renderer, SDL_Rect{0, 0, screen_w_, screen_h_}, scrim_color());

    const SDL_Rect content = content_rect();
    const SDL_Color shadow = with_opacity(tokens_.shadow_color, shadow_opacity());
    if (shadow.a > 0 && tokens_.shadow_blur > 0) {
        // Stacked translucent rings approximate the blur radius.
        const int rings = tokens_.shadow_blur;
        for (int i = rings; i > 0; --i) {
            SDL_Rect ring{content.x + tokens_.shadow_offset_x - i,
                          content.y + tokens_.shadow_offset_y - i,
                          content.w + 2 * i,
                          content.h + 2 * i};
            fill_rect(renderer, ring, with_opacity(shadow, 1.0 / static_cast<double>(rings + 1)));
        }
    }

    if (render_function_) {
        SDL_Rect previous_clip{0, 0, 0, 0};
        const bool had_clip = SDL_RenderIsClipEnabled(renderer) == SDL_TRUE;
        if (had_clip) {
            SDL_RenderGetClipRect(renderer, &previous_clip);
        }
        SDL_RenderSetClipRect(renderer, &content);
        render_function_(renderer, content);
        SDL_RenderSetClipRect(renderer, had_clip ? &previous_clip : nullptr);
    } else {
        fill_rect(renderer, content, SDL_Color{245, 245, 245, 255});
    }

    SDL_SetRenderDrawBlendMode(renderer, previous_mode);
}

}
