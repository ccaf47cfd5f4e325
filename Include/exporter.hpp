#pragma once

#include "graph.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <span>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

/// Total node speed recorded after one physics step.
struct SpeedSample {
    std::uint64_t tick      { 0 };    // controller tick count after the step
    double        totalSpeed{ 0.0 };
};

/**
 * DataExporter
 * ─────────────────────────────────────────────────────────────
 * Writes a finished layout and its convergence curve to CSV for
 * plotting. Output is never read back by this program.
 *
 * All methods are static and throw std::runtime_error on I/O failure.
 */
class DataExporter {
public:
    // ── Public API ────────────────────────────────────────────

    /**
     * Output format (nodes.csv):
     *   node_id,x,y,vx,vy
     *   0,1.234567,-0.402113,0.000012,-0.000003
     */
    static void exportNodes(const GraphState& g,
                            const fs::path&   outputDir)
    {
        const fs::path path = ensureDir(outputDir) / "nodes.csv";
        std::ofstream  file = openFile(path);

        file << "node_id,x,y,vx,vy\n";
        file << std::fixed << std::setprecision(6);

        for (const Node& v : g.nodes())
            file << v.id()         << ','
                 << v.position.x   << ','
                 << v.position.y   << ','
                 << v.velocity.x   << ','
                 << v.velocity.y   << '\n';

        checkStream(file, path);
    }

    /**
     * Output format (edges.csv), in construction order:
     *   source,target
     *   0,1
     */
    static void exportEdges(const GraphState& g,
                            const fs::path&   outputDir)
    {
        const fs::path path = ensureDir(outputDir) / "edges.csv";
        std::ofstream  file = openFile(path);

        file << "source,target\n";

        for (const Edge& e : g.edges())
            file << e.a << ',' << e.b << '\n';

        checkStream(file, path);
    }

    /**
     * Total node speed per recorded step, stamped with the controller's
     * tick count. Paused frames produce no row; a restart starts the
     * count again from 1.
     *
     * Output format (metrics.csv):
     *   tick,total_speed
     *   1,38.120004
     */
    static void exportMetrics(std::span<const SpeedSample> curve,
                              const fs::path&              outputDir)
    {
        const fs::path path = ensureDir(outputDir) / "metrics.csv";
        std::ofstream  file = openFile(path);

        file << "tick,total_speed\n";
        file << std::fixed << std::setprecision(6);

        for (const SpeedSample& s : curve)
            file << s.tick << ',' << s.totalSpeed << '\n';

        checkStream(file, path);
    }

    static void exportAll(const GraphState&            g,
                          std::span<const SpeedSample> curve,
                          const fs::path&              outputDir)
    {
        exportNodes  (g, outputDir);
        exportEdges  (g, outputDir);
        exportMetrics(curve, outputDir);
    }

    /// Creates the directory (and any parents) if it does not yet exist.
    static fs::path ensureDir(const fs::path& dir) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec)
            throw std::runtime_error("DataExporter: cannot create directory '"
                                     + dir.string() + "': " + ec.message());
        return dir;
    }

    /// Opens a file for writing; throws on failure.
    static std::ofstream openFile(const fs::path& path) {
        std::ofstream f{ path };
        if (!f.is_open())
            throw std::runtime_error("DataExporter: cannot open '"
                                     + path.string() + "' for writing.");
        return f;
    }

    /// Verifies the stream is still healthy after all writes.
    static void checkStream(const std::ofstream& f, const fs::path& path) {
        if (!f.good())
            throw std::runtime_error("DataExporter: I/O error while writing '"
                                     + path.string() + "'.");
    }
};
