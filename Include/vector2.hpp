#pragma once

#include <glm/glm.hpp>
#include <glm/geometric.hpp>
#include <cmath>

// ============================================================
//  Vector2
// ============================================================

/// Double-precision 2-D vector used for positions, velocities and forces.
using Vector2 = glm::dvec2;

[[nodiscard]] inline bool isFinite(const Vector2& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

/**
 * Unit vector pointing along `v`.
 * Returns `fallback` when `v` has zero or non-finite length.
 */
[[nodiscard]] inline Vector2 directionOr(const Vector2& v, const Vector2& fallback) noexcept {
    const double len = glm::length(v);
    if (!(len > 0.0) || !std::isfinite(len))
        return fallback;
    return v / len;
}
