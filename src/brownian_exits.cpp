// src/brownian_exits.cpp
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include "flag_parse.h"
#include "segment_csv.h"
#include "simulation.h"

struct CliOptions {
    SimulationParams sim;
    std::string output_csv = "brownian_paths.csv";
};

void print_usage() {
    std::cout << "Usage: brownian_exits [options]\n"
              << "Simulate Brownian motions with domain exits\n"
              << "Options:\n"
              << "  --domain-x-min X      Minimum x value of domain (default: 0.0)\n"
              << "  --domain-x-max X      Maximum x value of domain (default: 1.0)\n"
              << "  --domain-y-min Y      Minimum y value of domain (default: 0.0)\n"
              << "  --domain-y-max Y      Maximum y value of domain (default: 1.0)\n"
              << "  --max-exits N         Maximum number of exits to simulate (default: 50000)\n"
              << "  --paths-per-thread N  Number of simultaneous paths per thread (default: 100)\n"
              << "  --step-size S         Standard deviation of each step (default: 0.05)\n"
              << "  --seed N              Random seed for reproducibility (default: random)\n"
              << "  --threads N           Number of threads to use (default: all available)\n"
              << "  --thread-local-buffers  Buffer segments per thread, merge after the run\n"
              << "  --output-csv FILE     Output CSV file for path segments (default: brownian_paths.csv)\n"
              << "  --version             Show version information\n"
              << "  --help                Show this help message\n";
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    opts.sim.max_global_exits = 50000;
    opts.sim.step_size = 0.05;
    opts.sim.verbose = true;

    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigurationError("missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--domain-x-min") {
            opts.sim.domain_x.first = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--domain-x-max") {
            opts.sim.domain_x.second = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--domain-y-min") {
            opts.sim.domain_y.first = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--domain-y-max") {
            opts.sim.domain_y.second = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--max-exits") {
            opts.sim.max_global_exits = parse_long_flag(arg, value(i, arg));
        } else if (arg == "--paths-per-thread") {
            opts.sim.paths_per_thread = parse_int_flag(arg, value(i, arg));
        } else if (arg == "--step-size") {
            opts.sim.step_size = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--seed") {
            opts.sim.seed = parse_seed_flag(arg, value(i, arg));
        } else if (arg == "--threads") {
            opts.sim.num_threads = parse_int_flag(arg, value(i, arg));
        } else if (arg == "--thread-local-buffers") {
            opts.sim.aggregation = AggregationMode::ThreadLocal;
        } else if (arg == "--output-csv") {
            opts.output_csv = value(i, arg);
        } else if (arg == "--version") {
            std::cout << "brownian_exits 1.0\n";
            std::exit(0);
        } else if (arg == "--help") {
            print_usage();
            std::exit(0);
        } else {
            throw ConfigurationError("unknown option " + arg);
        }
    }

    return opts;
}

void print_summary(const SimulationSummary& summary) {
    std::cout << "\nResults:\n"
              << "Total path segments: " << summary.total_segments << "\n"
              << "Total unique paths: " << summary.unique_paths << "\n"
              << "Total exits: " << summary.total_exits << "\n";
    for (const auto& entry : summary.exits_by_boundary) {
        std::cout << "  " << boundary_label(entry.first) << ": " << entry.second << "\n";
    }

    const StepStats& s = summary.steps_per_path;
    std::cout << "\nSteps per path:\n"
              << std::fixed << std::setprecision(2)
              << "  Length:  " << s.count << "\n"
              << "  Mean:    " << s.mean << "\n"
              << "  Minimum: " << s.min << "\n"
              << "  25%:     " << s.q25 << "\n"
              << "  Median:  " << s.median << "\n"
              << "  75%:     " << s.q75 << "\n"
              << "  Maximum: " << s.max << "\n";
}

int main(int argc, char* argv[]) {
    try {
        CliOptions opts = parse_args(argc, argv);
        validate(opts.sim);
        const SimulationParams& params = opts.sim;

        std::cout << "Simulation Parameters:\n"
                  << "---------------------\n"
                  << "Domain X: (" << params.domain_x.first << ", " << params.domain_x.second << ")\n"
                  << "Domain Y: (" << params.domain_y.first << ", " << params.domain_y.second << ")\n"
                  << "Max Exits: " << params.max_global_exits << "\n"
                  << "Paths per Thread: " << params.paths_per_thread << "\n"
                  << "Step Size: " << params.step_size << "\n"
                  << "Number of Threads: " << resolve_thread_count(params) << "\n"
                  << "Random Seed: " << (params.seed ? std::to_string(*params.seed) : "random") << "\n\n";

        std::vector<Segment> segments = simulate(params);

        write_segments_csv(opts.output_csv, segments);
        std::cout << "\nSaved path segments to: " << opts.output_csv << "\n";

        print_summary(summarize(segments));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
