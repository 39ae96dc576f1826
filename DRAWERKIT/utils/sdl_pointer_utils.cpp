#include "utils/sdl_pointer_utils.hpp"

#include <cmath>

namespace drawerkit::sdl {

namespace {

int scale(float normalized, int size) {
    return static_cast<int>(std::lround(static_cast<double>(normalized) * static_cast<double>(size)));
}

}

bool is_pointer_event(const SDL_Event& e) {
    switch (e.type) {
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
    case SDL_MOUSEMOTION:
    case SDL_FINGERDOWN:
    case SDL_FINGERUP:
    case SDL_FINGERMOTION:
        return true;
    default:
        return false;
    }
}

std::optional<PointerEvent> pointer_from_event(const SDL_Event& e, int viewport_w, int viewport_h) {
    PointerEvent out;
    switch (e.type) {
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
        if (e.button.which == SDL_TOUCH_MOUSEID || e.button.button != SDL_BUTTON_LEFT) {
            return std::nullopt;
        }
        out.phase = (e.type == SDL_MOUSEBUTTONDOWN) ? PointerPhase::Down : PointerPhase::Up;
        out.point = SDL_Point{e.button.x, e.button.y};
        return out;
    case SDL_MOUSEMOTION:
        if (e.motion.which == SDL_TOUCH_MOUSEID) {
            return std::nullopt;
        }
        out.phase = PointerPhase::Motion;
        out.point = SDL_Point{e.motion.x, e.motion.y};
        return out;
    case SDL_FINGERDOWN:
    case SDL_FINGERUP:
    case SDL_FINGERMOTION:
        out.phase = (e.type == SDL_FINGERDOWN) ? PointerPhase::Down
                  : (e.type == SDL_FINGERUP)   ? PointerPhase::Up
                                               : PointerPhase::Motion;
        out.point = SDL_Point{scale(e.tfinger.x, viewport_w), scale(e.tfinger.y, viewport_h)};
        out.touch = true;
        out.finger = e.tfinger.fingerId;
        return out;
    default:
        return std::nullopt;
    }
}

}
