#pragma once

#include "vector2.hpp"
#include <vector>
#include <span>
#include <string>
#include <random>
#include <utility>
#include <stdexcept>
#include <cstdint>

// ============================================================
//  Errors
// ============================================================

/// Thrown when a graph is built from a bad node count or edge list.
class InvalidTopologyError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// ============================================================
//  Node
// ============================================================

class Node {
public:
    using ID = std::uint32_t;

    Vector2 position{ 0.0, 0.0 };
    Vector2 velocity{ 0.0, 0.0 };
    double  mass    { 1.0 };

    explicit Node(ID id) noexcept : id_(id) {}
    Node(ID id, Vector2 position) noexcept : position(position), id_(id) {}

    // Identity is fixed: a slot in a graph can never be overwritten by another node.
    Node(const Node&)            = default;
    Node(Node&&) noexcept        = default;
    Node& operator=(const Node&) = delete;
    Node& operator=(Node&&)      = delete;

    [[nodiscard]] ID id() const noexcept { return id_; }

private:
    ID id_;
};

// ============================================================
//  Edge
// ============================================================

struct Edge {
    Node::ID a;
    Node::ID b;

    Edge(Node::ID u, Node::ID v) noexcept : a(u), b(v) {}

    /// Canonical form: smaller ID first.
    [[nodiscard]] Edge canonical() const noexcept {
        return (a <= b) ? *this : Edge{ b, a };
    }

    bool operator==(const Edge& o) const noexcept {
        auto x = canonical(), y = o.canonical();
        return x.a == y.a && x.b == y.b;
    }
};

/// Raw edge list as supplied by callers, before validation.
using EdgeList = std::vector<std::pair<int, int>>;

// ============================================================
//  Bounds  –  region used for random initial placement
// ============================================================

struct Bounds {
    Vector2 min{ -2.0, -2.0 };
    Vector2 max{  2.0,  2.0 };

    void validate() const {
        if (!isFinite(min) || !isFinite(max) || !(min.x < max.x) || !(min.y < max.y))
            throw std::domain_error("Bounds must satisfy min < max on both axes.");
    }

    [[nodiscard]] bool contains(const Vector2& p) const noexcept {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }
};

// ============================================================
//  GraphState
// ============================================================

/**
 * Nodes (indexed by identifier) plus the ordered edge list.
 * Topology is fixed after create(); only node positions and velocities
 * change, and only through Integrator::step.
 */
class GraphState {
public:
    // ── Construction ─────────────────────────────────────────

    /**
     * Builds a graph with `nodeCount` nodes scattered uniformly inside
     * `bounds`, all at rest.
     *
     * @throws InvalidTopologyError  nodeCount <= 0, an endpoint outside
     *                               [0, nodeCount), or a self-loop.
     * @throws std::domain_error     degenerate bounds.
     */
    template <typename Rng>
    static GraphState create(int nodeCount,
                             std::span<const std::pair<int, int>> edges,
                             const Bounds& bounds,
                             Rng& rng)
    {
        requirePositiveCount(nodeCount);
        bounds.validate();

        GraphState g;
        g.edges_ = checkedEdges(nodeCount, edges);

        std::uniform_real_distribution<double> rx{ bounds.min.x, bounds.max.x };
        std::uniform_real_distribution<double> ry{ bounds.min.y, bounds.max.y };

        g.nodes_.reserve(static_cast<std::size_t>(nodeCount));
        for (int i = 0; i < nodeCount; ++i) {
            const double x = rx(rng);
            const double y = ry(rng);
            g.nodes_.emplace_back(static_cast<Node::ID>(i), Vector2{ x, y });
        }
        return g;
    }

    /**
     * Builds a graph at rest with node i at `positions[i]`.
     * Same topology checks as create(); positions must be finite.
     */
    static GraphState place(std::span<const Vector2> positions,
                            std::span<const std::pair<int, int>> edges = {})
    {
        const int nodeCount = static_cast<int>(positions.size());
        requirePositiveCount(nodeCount);

        GraphState g;
        g.edges_ = checkedEdges(nodeCount, edges);

        g.nodes_.reserve(positions.size());
        for (std::size_t i = 0; i < positions.size(); ++i) {
            if (!isFinite(positions[i]))
                throw std::domain_error("Position of node " + std::to_string(i) + " is not finite.");
            g.nodes_.emplace_back(static_cast<Node::ID>(i), positions[i]);
        }
        return g;
    }

    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] std::size_t nodeCount() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t edgeCount() const noexcept { return edges_.size(); }

    [[nodiscard]] const std::vector<Node>& nodes() const noexcept { return nodes_; }
    /// Fixed-size mutable view: node state can change, the node set cannot.
    [[nodiscard]]       std::span<Node>    nodes()       noexcept { return nodes_; }

    [[nodiscard]] const std::vector<Edge>& edges() const noexcept { return edges_; }

    [[nodiscard]] const Node& node(Node::ID id) const { return nodes_.at(id); }
    [[nodiscard]]       Node& node(Node::ID id)       { return nodes_.at(id); }

    /// Sum of node speeds; the layout is considered settled when this is small.
    [[nodiscard]] double totalSpeed() const noexcept {
        double s = 0.0;
        for (const Node& n : nodes_) s += glm::length(n.velocity);
        return s;
    }

private:
    GraphState() = default;

    static void requirePositiveCount(int nodeCount) {
        if (nodeCount <= 0)
            throw InvalidTopologyError("Node count must be positive, got "
                                       + std::to_string(nodeCount) + ".");
    }

    static std::vector<Edge> checkedEdges(int nodeCount,
                                          std::span<const std::pair<int, int>> edges)
    {
        std::vector<Edge> out;
        out.reserve(edges.size());
        for (const auto& [u, v] : edges) {
            if (u < 0 || u >= nodeCount || v < 0 || v >= nodeCount)
                throw InvalidTopologyError("Edge (" + std::to_string(u) + ", "
                                           + std::to_string(v)
                                           + ") references a node outside [0, "
                                           + std::to_string(nodeCount) + ").");
            if (u == v)
                throw InvalidTopologyError("Self-loop on node "
                                           + std::to_string(u) + ".");
            out.emplace_back(static_cast<Node::ID>(u), static_cast<Node::ID>(v));
        }
        return out;
    }

    std::vector<Node> nodes_;   // nodes_[i].id() == i
    std::vector<Edge> edges_;
};
