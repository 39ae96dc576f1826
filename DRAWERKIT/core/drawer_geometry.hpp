#pragma once

#include <optional>

#include "core/drawer_types.hpp"

namespace drawerkit::geometry {

constexpr double kDefaultContentWidthRatio = 0.9;

// Signed horizontal offset of the panel. Expanded sits at 0, collapsed sits one
// content width off screen on the drawer's own edge.
double resolve_offset(TransitionState state,
                      const std::optional<double>& percent,
                      Direction direction,
                      double content_width);

double resolve_dim_opacity(TransitionState state,
                           const std::optional<double>& percent,
                           double max_opacity,
                           bool dim_enabled);

double content_width(double extent, double ratio);

// Width of the panel host regardless of device orientation.
int portrait_extent(int width, int height);

bool is_valid_percent(double value);

}
