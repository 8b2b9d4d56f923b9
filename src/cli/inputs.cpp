#include "inputs.hpp"
#include "geneprio/evidence_io.hpp"
#include "geneprio/log_utils.hpp"

#include <chrono>
#include <iostream>

namespace geneprio {
namespace cli {

Inputs load_inputs(const Options& opts) {
    const auto t0 = std::chrono::steady_clock::now();
    Inputs in;

    if (!opts.config_file.empty()) {
        in.config = load_config(opts.config_file);
        if (opts.verbose) std::cerr << "Loaded config: " << opts.config_file << "\n";
    }
    if (opts.top_n > 0) in.config.sensitivity.top_n = opts.top_n;
    in.config.sensitivity.threads = opts.num_threads;
    in.config.validate();

    if (opts.verbose) {
        std::cerr << "Weights: " << in.config.weights.to_string() << "\n";
    }

    in.genes = read_gene_universe(opts.universe_file, &in.diagnostics);
    if (opts.verbose) {
        std::cerr << "Gene universe: " << in.genes.size() << " genes from "
                  << opts.universe_file << "\n";
    }

    for (const auto& [layer, path] : opts.evidence) {
        EvidenceTable table = read_evidence_table(path, layer_name(layer), &in.diagnostics);
        if (opts.verbose) {
            std::cerr << "Evidence " << layer_name(layer) << ": " << table.size()
                      << " rows from " << path << "\n";
        }
        in.evidence.set_layer(layer, std::move(table));
    }

    if (opts.verbose) {
        std::cerr << "Inputs loaded in "
                  << log_utils::format_elapsed(t0, std::chrono::steady_clock::now()) << "\n";
    }
    return in;
}

int run_command(Command command, int argc, char* argv[],
                const std::function<int(const Options&)>& body) {
    Options opts;
    try {
        opts = parse_args(command, argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != 0 && e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'geneprio " << command_name(command)
                      << " --help' for usage information.\n";
        }
        return e.exit_code();
    }

    try {
        return body(opts);
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
    } catch (const InputError& e) {
        std::cerr << "Input error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}

}  // namespace cli
}  // namespace geneprio
