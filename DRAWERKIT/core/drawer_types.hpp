#pragma once

#include <optional>

namespace drawerkit {

enum class Direction {
    Left = 0,
    Right = 1
};

enum class TransitionState {
    Expanded = 0,
    Collapsed = 1,
    InTransition = 2
};

enum class GesturePhase {
    Changed = 0,
    Ended = 1,
    Cancelled = 2
};

// Presenting: an external pan that pulls the drawer in from the edge.
// Drawer: a drag on the open drawer or its scrim.
enum class GestureSource {
    Presenting = 0,
    Drawer = 1
};

struct GestureSample {
    GesturePhase phase = GesturePhase::Changed;
    double translation = 0.0;
};

// true = expand, false = collapse, empty = nothing requested yet.
using DrawerRequest = std::optional<bool>;

struct DrawerSnapshot {
    TransitionState state = TransitionState::Collapsed;
    std::optional<double> percent{};
    Direction direction = Direction::Left;
};

const char* to_string(Direction direction);
const char* to_string(TransitionState state);
const char* to_string(GestureSource source);

}
