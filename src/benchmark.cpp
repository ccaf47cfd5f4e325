/**
 * benchmark.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Tick cost against graph size. Repulsion is all-pairs, so the per-tick time
 * should grow roughly with |V|².
 *
 * Output: output/benchmark.csv
 *   Columns: N, edges, tick_us
 */

#include "graph_generators.hpp"
#include "simulation_controller.hpp"
#include "exporter.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs  = std::filesystem;
namespace chr = std::chrono;

// ── Configuration ─────────────────────────────────────────────────────────────

struct BenchConfig {
    std::vector<int> vertexCounts{ 10, 25, 50, 100, 200, 400, 800 };

    // p = targetDegree / N  →  sparse graphs
    double targetDegree = 3.0;

    int ticks = 200;

    std::uint64_t graphSeed  = 42;
    std::uint64_t layoutSeed = 7;

    fs::path outputDir = "output";
};

// ── Timing helper ─────────────────────────────────────────────────────────────

/// Mean wall time of one tick in microseconds.
static double measureTickUs(SimulationController& sim, int ticks) {
    const auto t0 = chr::steady_clock::now();
    for (int i = 0; i < ticks; ++i)
        sim.tick();
    const auto t1 = chr::steady_clock::now();

    return static_cast<double>(
        chr::duration_cast<chr::nanoseconds>(t1 - t0).count()) / 1000.0 / ticks;
}

// ── Result record ─────────────────────────────────────────────────────────────

struct BenchResult {
    int         N;
    std::size_t edges;
    double      tickUs;
};

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    const BenchConfig cfg;

    std::cout << "Force-directed layout tick benchmark\n"
              << "====================================\n"
              << "Ticks per run      : " << cfg.ticks        << '\n'
              << "Target avg degree  : " << cfg.targetDegree << "\n\n"
              << std::left
              << std::setw(8)  << "N"
              << std::setw(10) << "|E|"
              << "Tick (us)\n"
              << std::string(40, '-') << '\n';

    std::vector<BenchResult> results;
    results.reserve(cfg.vertexCounts.size());

    try {
        for (int N : cfg.vertexCounts) {
            const double p = std::min(cfg.targetDegree / static_cast<double>(N), 1.0);
            GraphTopology topo = erdosRenyi(N, p, cfg.graphSeed);
            const std::size_t edgeCount = topo.edges.size();

            SimulationController sim{ std::move(topo), ForceParameters{}, Bounds{}, cfg.layoutSeed };
            const double us = measureTickUs(sim, cfg.ticks);
            results.push_back({ N, edgeCount, us });

            std::cout << std::left  << std::fixed << std::setprecision(2)
                      << std::setw(8)  << N
                      << std::setw(10) << edgeCount
                      << us << '\n';
        }

        // ── Export CSV ────────────────────────────────────────
        const fs::path csvPath = DataExporter::ensureDir(cfg.outputDir) / "benchmark.csv";
        std::ofstream  csv     = DataExporter::openFile(csvPath);

        csv << "N,edges,tick_us\n"
            << std::fixed << std::setprecision(4);

        for (const auto& r : results)
            csv << r.N     << ','
                << r.edges << ','
                << r.tickUs << '\n';

        DataExporter::checkStream(csv, csvPath);
        std::cout << "\nResults saved to: " << csvPath << '\n';
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
