#include "core/drawer_geometry.hpp"

#include <algorithm>
#include <cmath>

namespace drawerkit::geometry {

namespace {

double transition_offset(const std::optional<double>& percent, double collapsed) {
    if (!percent || !is_valid_percent(*percent)) {
        return 0.0;
    }
    return collapsed * (1.0 - *percent);
}

}

bool is_valid_percent(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

double resolve_offset(TransitionState state,
                      const std::optional<double>& percent,
                      Direction direction,
                      double content_width) {
    if (!std::isfinite(content_width) || content_width <= 0.0) {
        return 0.0;
    }

    double offset = 0.0;
    switch (state) {
    case TransitionState::Expanded:
        return 0.0;
    case TransitionState::Collapsed:
        offset = content_width;
        break;
    case TransitionState::InTransition:
        offset = transition_offset(percent, content_width);
        break;
    }
    return direction == Direction::Left ? -offset : offset;
}

double resolve_dim_opacity(TransitionState state,
                           const std::optional<double>& percent,
                           double max_opacity,
                           bool dim_enabled) {
    if (!dim_enabled || !std::isfinite(max_opacity)) {
        return 0.0;
    }
    switch (state) {
    case TransitionState::Collapsed:
        return 0.0;
    case TransitionState::Expanded:
        return max_opacity;
    case TransitionState::InTransition:
        if (percent && is_valid_percent(*percent)) {
            return max_opacity * (*percent);
        }
        return 0.0;
    }
    return 0.0;
}

double content_width(double extent, double ratio) {
    if (!std::isfinite(extent) || extent <= 0.0) {
        return 0.0;
    }
    if (!std::isfinite(ratio) || ratio <= 0.0) {
        ratio = kDefaultContentWidthRatio;
    }
    return extent * std::min(ratio, 1.0);
}

int portrait_extent(int width, int height) {
    return std::max(0, std::min(width, height));
}

}
