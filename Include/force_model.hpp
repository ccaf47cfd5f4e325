#pragma once

#include "graph.hpp"
#include <glm/geometric.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <span>
#include <vector>
#include <stdexcept>

// ============================================================
//  ForceParameters
// ============================================================

/**
 * Physical constants of the layout. The visually pleasing values are
 * empirical; these defaults settle a few dozen nodes within a few hundred
 * ticks. Only `gravityEnabled` is expected to change during a run.
 */
struct ForceParameters {
    double  repulsion     { 150.0 };
    double  spring        { 15.0  };
    double  restLength    { 1.0   };
    double  gravity       { 2.0   };
    bool    gravityEnabled{ false };
    Vector2 gravityCenter { 0.0, 0.0 };
    double  damping       { 0.95  };   // velocity kept per tick, in [0, 1)
    double  timeStep      { 0.01  };
    double  minDistance   { 0.1   };   // repulsion distance floor

    /// @throws std::domain_error on any out-of-range field.
    void validate() const {
        auto requireNonNegative = [](double v, const char* name) {
            if (!std::isfinite(v) || v < 0.0)
                throw std::domain_error(std::string(name) + " must be finite and non-negative.");
        };
        requireNonNegative(repulsion,  "repulsion");
        requireNonNegative(spring,     "spring");
        requireNonNegative(restLength, "restLength");
        requireNonNegative(gravity,    "gravity");

        if (!isFinite(gravityCenter))
            throw std::domain_error("gravityCenter must be finite.");
        if (!(damping >= 0.0 && damping < 1.0))
            throw std::domain_error("damping must be in [0, 1).");
        if (!std::isfinite(timeStep) || timeStep <= 0.0)
            throw std::domain_error("timeStep must be positive.");
        if (!std::isfinite(minDistance) || minDistance <= 0.0)
            throw std::domain_error("minDistance must be positive.");
    }
};

// ============================================================
//  ForceModel
// ============================================================

/**
 * Net force on every node. Pure: the result depends only on the node
 * positions, the edge list and the parameters.
 *
 * Complexity: O(|V|² + |E|), dominated by pairwise repulsion.
 */
class ForceModel {
public:
    using Forces = std::vector<Vector2>;

    /// Returns forces indexed by node id.
    [[nodiscard]] static Forces computeForces(const GraphState& state,
                                              const ForceParameters& params)
    {
        Forces forces(state.nodeCount(), Vector2{ 0.0 });

        addRepulsion(state, params, forces);
        addSprings  (state, params, forces);
        if (params.gravityEnabled)
            addGravity(state, params, forces);

        return forces;
    }

    /**
     * Coulomb-like repulsion, |F| = k_r / max(d, minDistance)².
     * Coincident nodes are separated along +x (lower id moves right).
     */
    static void addRepulsion(const GraphState& state,
                             const ForceParameters& params,
                             std::span<Vector2> forces)
    {
        const auto& nodes = state.nodes();
        const double floor = params.minDistance;

        for (std::size_t i = 0; i < nodes.size(); ++i) {
            for (std::size_t j = i + 1; j < nodes.size(); ++j) {
                const Vector2 delta = nodes[i].position - nodes[j].position;
                const Vector2 dir   = directionOr(delta, Vector2{ 1.0, 0.0 });
                const double  dist  = std::max(glm::length(delta), floor);

                const Vector2 force = dir * (params.repulsion / (dist * dist));

                forces[i] += force;
                forces[j] -= force;
            }
        }
    }

    /// Hooke springs along edges, |F| = k_s * (d - restLength).
    static void addSprings(const GraphState& state,
                           const ForceParameters& params,
                           std::span<Vector2> forces)
    {
        for (const Edge& e : state.edges()) {
            const Vector2 delta = state.node(e.b).position - state.node(e.a).position;
            const double  dist  = glm::length(delta);
            if (!(dist > 0.0)) continue;   // no direction to pull along

            // Positive when stretched: a moves toward b, b toward a.
            const Vector2 force = (delta / dist) * (params.spring * (dist - params.restLength));

            forces[e.a] += force;
            forces[e.b] -= force;
        }
    }

    /// Linear pull toward the gravity center, F = g * (c - p).
    static void addGravity(const GraphState& state,
                           const ForceParameters& params,
                           std::span<Vector2> forces)
    {
        const auto& nodes = state.nodes();
        for (std::size_t i = 0; i < nodes.size(); ++i)
            forces[i] += params.gravity * (params.gravityCenter - nodes[i].position);
    }
};
