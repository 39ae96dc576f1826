#pragma once

#include <algorithm>
#include <cmath>

enum class SettleCurve {
    Linear = 0,
    EaseInOut = 1
};

// Fixed-duration tween between two scalar values, advanced by frame time.
struct SettleTween {
    double from = 0.0;
    double to = 0.0;
    double duration = 0.0;
    double elapsed = 0.0;
    SettleCurve curve = SettleCurve::EaseInOut;
    bool active = false;

    void reset(double value) {
        from     = value;
        to       = value;
        duration = 0.0;
        elapsed  = 0.0;
        active   = false;
    }

    void start(double start_value, double target, double seconds) {
        from     = start_value;
        to       = target;
        elapsed  = 0.0;
        duration = (std::isfinite(seconds) && seconds > 0.0) ? seconds : 0.0;
        active   = duration > 0.0 && std::fabs(target - start_value) > 1e-9;
        if (!active) {
            from = target;
        }
    }

    double progress() const {
        if (!active || duration <= 0.0) {
            return 1.0;
        }
        return std::clamp(elapsed / duration, 0.0, 1.0);
    }

    double value() const {
        const double t = progress();
        double eased = t;
        if (curve == SettleCurve::EaseInOut) {
            eased = (t < 0.5) ? 2.0 * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 2.0) / 2.0;
        }
        return from + (to - from) * eased;
    }

    // Returns true on the frame the tween reaches its target.
    bool advance(double dt) {
        if (!active) {
            return false;
        }
        if (!std::isfinite(dt) || dt < 0.0) {
            dt = 0.0;
        }
        elapsed += dt;
        if (elapsed >= duration) {
            elapsed = duration;
            from    = to;
            active  = false;
            return true;
        }
        return false;
    }
};
