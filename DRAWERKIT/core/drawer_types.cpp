#include "core/drawer_types.hpp"

namespace drawerkit {

const char* to_string(Direction direction) {
    switch (direction) {
    case Direction::Left:  return "left";
    case Direction::Right: return "right";
    }
    return "left";
}

const char* to_string(TransitionState state) {
    switch (state) {
    case TransitionState::Expanded:     return "expanded";
    case TransitionState::Collapsed:    return "collapsed";
    case TransitionState::InTransition: return "in_transition";
    }
    return "collapsed";
}

const char* to_string(GestureSource source) {
    switch (source) {
    case GestureSource::Presenting: return "presenting";
    case GestureSource::Drawer:     return "drawer";
    }
    return "drawer";
}

}
