#include "commands.hpp"
#include "exporter.hpp"
#include "graph_generators.hpp"
#include "logger.hpp"
#include "simulation_controller.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// ── Run parameters ───────────────────────────────────────────────────────────

struct Config {
    // Graph
    std::string  graph        = "cycle";   // cycle | chain | random
    int          numVertices  = 20;
    int          chords       = -1;        // chain only; -1 → numVertices / 3
    double       edgeProb     = 0.15;      // random only
    bool         directed     = false;

    // Physics
    ForceParameters params;

    // Run
    int          maxTicks     = 1000;
    bool         settleFirst  = false;
    std::size_t  settleLimit  = 100000;

    // Input / output
    std::optional<fs::path> script;
    fs::path     outputDir    = "output";
    bool         quiet        = false;

    // Reproducibility
    std::uint64_t graphSeed   = 42;
    std::uint64_t layoutSeed  = 7;
};

// ── Helpers ──────────────────────────────────────────────────────────────────

static void printUsage(std::ostream& os, const char* argv0) {
    os << "Usage: " << argv0 << " [options]\n"
       << "  --graph <cycle|chain|random>  topology (default cycle)\n"
       << "  --nodes <n>                   node count (default 20)\n"
       << "  --chords <k>                  extra random edges for chain\n"
       << "  --edge-prob <p>               edge probability for random\n"
       << "  --directed                    mark edges as directed\n"
       << "  --ticks <n>                   frames to run (default 1000)\n"
       << "  --gravity                     start with gravity enabled\n"
       << "  --damping <d>                 velocity kept per tick, [0, 1)\n"
       << "  --dt <s>                      time step (default 0.01)\n"
       << "  --settle                      run to equilibrium before the loop\n"
       << "  --seed <u64>                  layout seed (default 7)\n"
       << "  --graph-seed <u64>            topology seed (default 42)\n"
       << "  --script <file>               frame-stamped commands\n"
       << "  --out <dir>                   CSV output directory\n"
       << "  --quiet                       warnings and errors only\n";
}

/// Parses argv into `cfg`; throws std::invalid_argument on bad input.
static void parseArgs(int argc, char** argv, Config& cfg) {
    auto value = [&](int& i) -> std::string_view {
        if (i + 1 >= argc)
            throw std::invalid_argument(std::string("missing value for ") + argv[i]);
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if      (arg == "--graph")      cfg.graph       = std::string(value(i));
        else if (arg == "--nodes")      cfg.numVertices = std::stoi(std::string(value(i)));
        else if (arg == "--chords")     cfg.chords      = std::stoi(std::string(value(i)));
        else if (arg == "--edge-prob")  cfg.edgeProb    = std::stod(std::string(value(i)));
        else if (arg == "--directed")   cfg.directed    = true;
        else if (arg == "--ticks")      cfg.maxTicks    = std::stoi(std::string(value(i)));
        else if (arg == "--gravity")    cfg.params.gravityEnabled = true;
        else if (arg == "--damping")    cfg.params.damping  = std::stod(std::string(value(i)));
        else if (arg == "--dt")         cfg.params.timeStep = std::stod(std::string(value(i)));
        else if (arg == "--settle")     cfg.settleFirst = true;
        else if (arg == "--seed")       cfg.layoutSeed  = std::stoull(std::string(value(i)));
        else if (arg == "--graph-seed") cfg.graphSeed   = std::stoull(std::string(value(i)));
        else if (arg == "--script")     cfg.script      = fs::path(std::string(value(i)));
        else if (arg == "--out")        cfg.outputDir   = fs::path(std::string(value(i)));
        else if (arg == "--quiet")      cfg.quiet       = true;
        else throw std::invalid_argument("unknown option " + std::string(arg));
    }

    if (cfg.maxTicks < 0)
        throw std::invalid_argument("--ticks must be non-negative");
}

static GraphTopology buildTopology(const Config& cfg) {
    if (cfg.graph == "cycle") {
        GraphTopology t = cycleGraph(cfg.numVertices);
        t.directed = cfg.directed;
        return t;
    }
    if (cfg.graph == "chain") {
        const int chords = cfg.chords >= 0 ? cfg.chords : cfg.numVertices / 3;
        return chainWithRandomChords(cfg.numVertices, chords, cfg.graphSeed, cfg.directed);
    }
    if (cfg.graph == "random") {
        GraphTopology t = erdosRenyi(cfg.numVertices, cfg.edgeProb, cfg.graphSeed);
        t.directed = cfg.directed;
        return t;
    }
    throw std::invalid_argument("unknown graph kind '" + cfg.graph + "'");
}

/**
 * Script format, one command per line:
 *   <frame> <command>      e.g.  "120 gravity_toggle"
 * Blank lines and lines starting with '#' are skipped. Unknown command
 * names are kept and later ignored by dispatch().
 */
static std::multimap<int, std::string> loadScript(const fs::path& path, const Logger& log) {
    std::ifstream in{ path };
    if (!in.is_open())
        throw std::runtime_error("cannot open script '" + path.string() + "'");

    std::multimap<int, std::string> script;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::istringstream ss{ line };
        std::string first;
        if (!(ss >> first) || first.front() == '#') continue;

        int frame = 0;
        std::string name;
        try {
            frame = std::stoi(first);
        } catch (const std::exception&) {
            log.warn(path.string() + ":" + std::to_string(lineNo) + ": bad frame '" + first + "', line skipped");
            continue;
        }
        if (!(ss >> name)) {
            log.warn(path.string() + ":" + std::to_string(lineNo) + ": missing command, line skipped");
            continue;
        }
        script.emplace(frame, name);
    }
    return script;
}

// ── Entry point ──────────────────────────────────────────────────────────────

int main(int argc, char** argv) {
    Config cfg;
    try {
        parseArgs(argc, argv, cfg);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n\n";
        printUsage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }

    const Logger log{ &std::clog, cfg.quiet ? LogLevel::Warning : LogLevel::Info };

    try {
        // ── 1. Build graph ───────────────────────────────────
        GraphTopology topo = buildTopology(cfg);
        {
            std::ostringstream msg;
            msg << "[1/4] " << cfg.graph << " graph: |V| = " << topo.nodeCount
                << "   |E| = " << topo.edges.size()
                << (topo.directed ? "   (directed)" : "");
            log.info(msg.str());
        }

        // ── 2. Simulation ────────────────────────────────────
        SimulationController sim{ std::move(topo), cfg.params, Bounds{}, cfg.layoutSeed, log };

        std::multimap<int, std::string> script;
        if (cfg.script)
            script = loadScript(*cfg.script, log);

        if (cfg.settleFirst) {
            const std::size_t n = sim.settle(cfg.settleLimit);
            log.info("[2/4] settled after " + std::to_string(n) + " ticks");
        } else {
            log.info("[2/4] starting from a random layout");
        }

        // ── 3. Frame loop ────────────────────────────────────
        log.info("[3/4] running " + std::to_string(cfg.maxTicks) + " frames");

        std::vector<SpeedSample> speedCurve;
        speedCurve.reserve(static_cast<std::size_t>(cfg.maxTicks));

        bool running = true;
        for (int frame = 0; running && frame < cfg.maxTicks; ++frame) {
            const auto [first, last] = script.equal_range(frame);
            for (auto it = first; it != last && running; ++it) {
                running = dispatch(sim, it->second);
                log.debug("frame " + std::to_string(frame) + ": " + it->second);
            }
            if (!running) break;

            if (sim.tick())
                speedCurve.push_back({ sim.tickCount(), sim.lastReport().totalSpeed });

            if ((frame + 1) % 100 == 0) {
                std::ostringstream msg;
                msg << "  frame " << std::setw(5) << (frame + 1)
                    << "  |  tick " << std::setw(5) << sim.tickCount()
                    << "  |  speed = " << std::fixed << std::setprecision(4)
                    << std::setw(10) << sim.lastReport().totalSpeed
                    << (sim.isPaused() ? "  (paused)" : "")
                    << (sim.gravityEnabled() ? "  gravity" : "");
                log.info(msg.str());
            }
        }

        if (sim.instabilityEvents() > 0)
            log.warn(std::to_string(sim.instabilityEvents()) + " numerical instability corrections during the run");

        // ── 4. Export results ────────────────────────────────
        DataExporter::exportAll(sim.state(), speedCurve, cfg.outputDir);
        log.info("[4/4] wrote " + (cfg.outputDir / "nodes.csv").string() + ", "
                 + (cfg.outputDir / "edges.csv").string() + ", "
                 + (cfg.outputDir / "metrics.csv").string());
    } catch (const std::exception& e) {
        log.error(e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
