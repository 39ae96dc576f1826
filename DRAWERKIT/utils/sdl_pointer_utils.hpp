#pragma once

#include <SDL.h>

#include <optional>

namespace drawerkit::sdl {

enum class PointerPhase {
    Down,
    Motion,
    Up
};

struct PointerEvent {
    PointerPhase phase = PointerPhase::Motion;
    SDL_Point point{0, 0};
    bool touch = false;
    SDL_FingerID finger = 0;
};

bool is_pointer_event(const SDL_Event& e);

// Left mouse button and finger events, in window pixels. Touch coordinates are
// normalized by SDL and scaled by the viewport here. Mouse events synthesized
// from touch are skipped so a finger is not seen twice.
std::optional<PointerEvent> pointer_from_event(const SDL_Event& e, int viewport_w, int viewport_h);

}
