// src/plot_paths.cpp
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include "flag_parse.h"
#include "path_plot.h"
#include "segment_csv.h"

struct PlotParams {
    std::string input_csv;
    std::string plot_output = "brownian_paths.svg";
    int n_paths = 5;
    std::pair<double, double> domain_x = {0.0, 1.0};
    std::pair<double, double> domain_y = {0.0, 1.0};
    std::optional<std::uint64_t> seed;
};

void print_usage() {
    std::cout << "Usage: plot_paths --input-csv FILE [options]\n"
              << "Plot randomly chosen paths from a brownian_exits CSV file\n"
              << "Options:\n"
              << "  --input-csv FILE    Input csv file for the path data\n"
              << "  --plot-output FILE  Output SVG file (default: brownian_paths.svg)\n"
              << "  --n-paths N         Number of random paths to plot (default: 5)\n"
              << "  --domain-x-min X    Minimum x value of domain (default: 0.0)\n"
              << "  --domain-x-max X    Maximum x value of domain (default: 1.0)\n"
              << "  --domain-y-min Y    Minimum y value of domain (default: 0.0)\n"
              << "  --domain-y-max Y    Maximum y value of domain (default: 1.0)\n"
              << "  --seed N            Seed for the path selection (default: random)\n"
              << "  --version           Show version information\n"
              << "  --help              Show this help message\n";
}

PlotParams parse_args(int argc, char* argv[]) {
    PlotParams params;

    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigurationError("missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input-csv") {
            params.input_csv = value(i, arg);
        } else if (arg == "--plot-output") {
            params.plot_output = value(i, arg);
        } else if (arg == "--n-paths") {
            params.n_paths = parse_int_flag(arg, value(i, arg));
        } else if (arg == "--domain-x-min") {
            params.domain_x.first = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--domain-x-max") {
            params.domain_x.second = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--domain-y-min") {
            params.domain_y.first = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--domain-y-max") {
            params.domain_y.second = parse_double_flag(arg, value(i, arg));
        } else if (arg == "--seed") {
            params.seed = parse_seed_flag(arg, value(i, arg));
        } else if (arg == "--version") {
            std::cout << "plot_paths 1.0\n";
            std::exit(0);
        } else if (arg == "--help") {
            print_usage();
            std::exit(0);
        } else {
            throw ConfigurationError("unknown option " + arg);
        }
    }

    if (params.input_csv.empty()) {
        throw ConfigurationError("--input-csv is required");
    }
    if (params.n_paths < 0) {
        throw ConfigurationError("invalid n_paths " + std::to_string(params.n_paths) + ": must not be negative");
    }
    return params;
}

int main(int argc, char* argv[]) {
    try {
        PlotParams params = parse_args(argc, argv);
        const Domain domain = Domain::from_bounds(params.domain_x, params.domain_y);

        std::vector<Segment> segments = read_segments_csv(params.input_csv);
        walk_rng rng = make_thread_rng(params.seed, 0);
        std::vector<long long> ids = select_paths(segments, params.n_paths, rng);

        save_paths_svg(params.plot_output, segments, ids, domain);
        std::cout << "Plot saved to: " << params.plot_output << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
