#pragma once

#include "simulation_controller.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>

// ============================================================
//  Topology generators
// ============================================================

/// Ring 0 - 1 - ... - (n-1) - 0.
[[nodiscard]] inline GraphTopology cycleGraph(int n) {
    if (n < 3)
        throw InvalidTopologyError("A cycle needs at least 3 nodes.");

    GraphTopology t;
    t.nodeCount = n;
    t.edges.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i + 1 < n; ++i)
        t.edges.emplace_back(i, i + 1);
    t.edges.emplace_back(n - 1, 0);
    return t;
}

/**
 * Path 0 - 1 - ... - (n-1) plus `chords` extra edges between random
 * distinct nodes. Chords may repeat existing edges.
 */
[[nodiscard]] inline GraphTopology chainWithRandomChords(int n, int chords,
                                                         std::optional<std::uint64_t> seed = std::nullopt,
                                                         bool directed = false)
{
    if (n < 2)
        throw InvalidTopologyError("A chain needs at least 2 nodes.");
    if (chords < 0)
        throw std::domain_error("Chord count must be non-negative.");

    GraphTopology t;
    t.nodeCount = n;
    t.directed  = directed;
    for (int i = 0; i + 1 < n; ++i)
        t.edges.emplace_back(i, i + 1);

    std::mt19937_64 rng{ seed.value_or(std::random_device{}()) };
    std::uniform_int_distribution<int> pick{ 0, n - 1 };

    for (int k = 0; k < chords; ++k) {
        const int a = pick(rng);
        int b = pick(rng);
        while (b == a) b = pick(rng);
        t.edges.emplace_back(a, b);
    }
    return t;
}

// ── Erdős–Rényi G(n, p) generator ────────────────────────
/**
 * Each of the n(n-1)/2 possible undirected edges is present
 * independently with probability `p`.
 *
 * @param n     Number of vertices.
 * @param p     Edge probability ∈ [0, 1].
 * @param seed  RNG seed (defaults to random_device).
 */
[[nodiscard]] inline GraphTopology erdosRenyi(int n, double p,
                                              std::optional<std::uint64_t> seed = std::nullopt)
{
    if (n <= 0)
        throw InvalidTopologyError("Node count must be positive.");
    if (!(p >= 0.0 && p <= 1.0))
        throw std::domain_error("Edge probability p must be in [0, 1].");

    GraphTopology t;
    t.nodeCount = n;

    std::mt19937_64 rng{ seed.value_or(std::random_device{}()) };
    std::bernoulli_distribution coin{ p };

    for (int i = 0; i < n; ++i)
        for (int j = i + 1; j < n; ++j)
            if (coin(rng))
                t.edges.emplace_back(i, j);
    return t;
}
