#pragma once

#include "graph.hpp"
#include "force_model.hpp"
#include "logger.hpp"
#include <glm/geometric.hpp>
#include <sstream>
#include <span>
#include <stdexcept>

// ============================================================
//  StepReport
// ============================================================

struct StepReport {
    std::size_t correctedNodes{ 0 };    // nodes reset after a non-finite update
    double      totalSpeed    { 0.0 };  // sum of |v| after the step
};

// ============================================================
//  Integrator  –  damped semi-implicit Euler
// ============================================================

class Integrator {
public:
    /**
     * Advances every node by one time step:
     *
     *   v' = (v + F/m * dt) * damping
     *   p' = p + v' * dt
     *
     * Positions are not clamped. A node whose velocity or position comes out
     * non-finite is stopped (velocity zeroed, position restored if needed)
     * and reported as a numerical-instability warning; the rest of the graph
     * advances normally.
     *
     * @throws std::invalid_argument  forces.size() != state.nodeCount()
     */
    static StepReport step(GraphState& state,
                           std::span<const Vector2> forces,
                           const ForceParameters& params,
                           const Logger& log = Logger::warnings())
    {
        if (forces.size() != state.nodeCount())
            throw std::invalid_argument("Integrator::step: expected "
                                        + std::to_string(state.nodeCount())
                                        + " forces, got "
                                        + std::to_string(forces.size()) + ".");

        const double dt = params.timeStep;
        StepReport report;

        const auto nodes = state.nodes();
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            Node& n = nodes[i];
            const Vector2 previous = n.position;

            n.velocity  = (n.velocity + forces[i] / n.mass * dt) * params.damping;
            n.position += n.velocity * dt;

            if (!isFinite(n.velocity) || !isFinite(n.position)) {
                n.velocity = Vector2{ 0.0 };
                if (!isFinite(n.position))
                    n.position = previous;
                ++report.correctedNodes;
                reportInstability(n, log);
            }

            report.totalSpeed += glm::length(n.velocity);
        }
        return report;
    }

private:
    static void reportInstability(const Node& n, const Logger& log) {
        if (!log.enabled(LogLevel::Warning)) return;
        std::ostringstream msg;
        msg << "NumericalInstabilityWarning: node " << n.id()
            << " produced a non-finite state; velocity reset, position held at ("
            << n.position.x << ", " << n.position.y << ").";
        log.warn(msg.str());
    }
};
