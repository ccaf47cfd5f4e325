#pragma once

#include "graph.hpp"
#include "force_model.hpp"
#include "integrator.hpp"
#include "logger.hpp"
#include <cmath>
#include <cstdint>
#include <optional>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

// ============================================================
//  GraphTopology  –  construction parameters kept for restart
// ============================================================

struct GraphTopology {
    int      nodeCount{ 0 };
    EdgeList edges;
    bool     directed { false };   // only affects how a renderer draws edges
};

// ============================================================
//  RenderSnapshot  –  what an external renderer may read
// ============================================================

struct RenderSnapshot {
    struct NodeSample {
        Node::ID id;
        Vector2  position;
    };

    std::vector<NodeSample> nodes;
    std::vector<Edge>       edges;
    double                  zoom    { 1.0   };
    bool                    directed{ false };
    bool                    paused  { false };
};

enum class RunState { Running, Paused };

// ============================================================
//  SimulationController
// ============================================================

/**
 * Owns one simulation: graph state, force parameters, run state and the
 * renderer's zoom. Drive it with one tick() per frame; commands are plain
 * method calls that take effect at the next tick boundary.
 */
class SimulationController {
public:
    static constexpr double kDefaultZoom           = 25.0;
    static constexpr double kDefaultSpeedThreshold = 0.1;

    // ── Construction ─────────────────────────────────────────

    /**
     * @param log   Instability warnings go here; pass Logger::silent() to drop them.
     * @param seed  RNG seed for initial placement and restarts
     *              (defaults to random_device).
     * @throws InvalidTopologyError  bad node count or edge list.
     * @throws std::domain_error     bad parameters or bounds.
     */
    explicit SimulationController(GraphTopology topology,
                                  ForceParameters params = {},
                                  Bounds bounds = {},
                                  std::optional<std::uint64_t> seed = std::nullopt,
                                  Logger log = Logger::warnings())
        : topology_(std::move(topology)),
          params_(validated(params)),
          bounds_(bounds),
          rng_{ seed.value_or(std::random_device{}()) },
          log_(log),
          state_(GraphState::create(topology_.nodeCount, topology_.edges, bounds_, rng_))
    {}

    // ── Run state ────────────────────────────────────────────
    void pause()  noexcept { runState_ = RunState::Paused; }
    void resume() noexcept { runState_ = RunState::Running; }

    void togglePause() noexcept {
        runState_ = isPaused() ? RunState::Running : RunState::Paused;
    }

    [[nodiscard]] RunState runState() const noexcept { return runState_; }
    [[nodiscard]] bool     isPaused() const noexcept { return runState_ == RunState::Paused; }

    // ── Commands ─────────────────────────────────────────────

    /// Fresh random layout over the same topology. Run state is kept.
    void restart() {
        state_      = GraphState::create(topology_.nodeCount, topology_.edges, bounds_, rng_);
        tickCount_  = 0;
        lastReport_ = StepReport{};
        log_.debug("simulation restarted");
    }

    void toggleGravity() noexcept { params_.gravityEnabled = !params_.gravityEnabled; }

    /// Multiplies the renderer's view scale; ignored for non-positive factors.
    void adjustZoom(double factor) noexcept {
        if (!std::isfinite(factor) || factor <= 0.0) return;
        const double z = zoom_ * factor;
        if (std::isfinite(z) && z > 0.0)
            zoom_ = z;
    }

    // ── Core step ────────────────────────────────────────────

    /**
     * One force evaluation and one integration step, only while Running.
     * @return true if the state advanced.
     */
    bool tick() {
        if (isPaused()) return false;
        advance();
        return true;
    }

    /**
     * Runs the physics, paused or not, until the total node speed drops
     * below `speedThreshold` or `maxTicks` steps have been taken.
     * @return number of steps taken.
     */
    std::size_t settle(std::size_t maxTicks,
                       double speedThreshold = kDefaultSpeedThreshold)
    {
        std::size_t n = 0;
        while (n < maxTicks) {
            advance();
            ++n;
            if (lastReport_.totalSpeed < speedThreshold) break;
        }
        if (log_.enabled(LogLevel::Debug)) {
            std::ostringstream msg;
            msg << "settle: " << n << " ticks, total speed " << lastReport_.totalSpeed;
            log_.debug(msg.str());
        }
        return n;
    }

    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] const GraphState&      state()      const noexcept { return state_; }
    [[nodiscard]] const ForceParameters& parameters() const noexcept { return params_; }
    [[nodiscard]] const GraphTopology&   topology()   const noexcept { return topology_; }
    [[nodiscard]] const StepReport&      lastReport() const noexcept { return lastReport_; }

    [[nodiscard]] bool          gravityEnabled()    const noexcept { return params_.gravityEnabled; }
    [[nodiscard]] double        zoom()              const noexcept { return zoom_; }
    [[nodiscard]] std::uint64_t tickCount()         const noexcept { return tickCount_; }
    [[nodiscard]] std::uint64_t instabilityEvents() const noexcept { return instabilityEvents_; }

    /// Copy of everything a renderer needs for one frame.
    [[nodiscard]] RenderSnapshot snapshot() const {
        RenderSnapshot s;
        s.nodes.reserve(state_.nodeCount());
        for (const Node& n : state_.nodes())
            s.nodes.push_back({ n.id(), n.position });
        s.edges    = state_.edges();
        s.zoom     = zoom_;
        s.directed = topology_.directed;
        s.paused   = isPaused();
        return s;
    }

private:
    static const ForceParameters& validated(const ForceParameters& p) {
        p.validate();
        return p;
    }

    void advance() {
        const auto forces = ForceModel::computeForces(state_, params_);
        lastReport_ = Integrator::step(state_, forces, params_, log_);
        instabilityEvents_ += lastReport_.correctedNodes;
        ++tickCount_;
    }

    // Construction parameters
    GraphTopology   topology_;
    ForceParameters params_;
    Bounds          bounds_;

    std::mt19937_64 rng_;
    Logger          log_;

    // Simulation state (declared after rng_: built from it)
    GraphState      state_;
    RunState        runState_         { RunState::Running };
    double          zoom_             { kDefaultZoom };
    std::uint64_t   tickCount_        { 0 };
    std::uint64_t   instabilityEvents_{ 0 };
    StepReport      lastReport_;
};
