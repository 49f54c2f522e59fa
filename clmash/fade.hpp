#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace clmash {

// Fade curve for envelopes / crossfades.
enum class fade_curve { Linear, SCurve };

// Map a normalized 0..1 parameter to a gain using the chosen curve.
// SCurve is the tanh sigmoid 0.5 * (1 + tanh(3t)) with t = 2x - 1.
[[nodiscard]] inline float apply_fade_curve(fade_curve curve, double x) noexcept
{
  x = std::clamp(x, 0.0, 1.0);
  switch (curve) {
    case fade_curve::Linear:
      return static_cast<float>(x);

    case fade_curve::SCurve:
      return static_cast<float>(0.5 * (1.0 + std::tanh(3.0 * (2.0 * x - 1.0))));
  }
  return static_cast<float>(x); // fallback
}

// Position of sample i within an n-sample window, linearly spaced over
// [0, 1] inclusive at both ends.
[[nodiscard]] inline double window_position(size_t i, size_t n) noexcept
{
  return n > 1 ? static_cast<double>(i) / static_cast<double>(n - 1) : 1.0;
}

}
