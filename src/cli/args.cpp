#include "args.hpp"

#include <iostream>
#include <string>

namespace geneprio {
namespace cli {

const char* command_name(Command command) {
    switch (command) {
        case Command::SCORE: return "score";
        case Command::VALIDATE: return "validate";
        case Command::SENSITIVITY: return "sensitivity";
    }
    return "unknown";
}

const char* command_summary(Command command) {
    switch (command) {
        case Command::SCORE: return "Compute composite scores, quality flags and tiers";
        case Command::VALIDATE:
            return "Validate scoring against controls, QC and weight perturbation";
        case Command::SENSITIVITY: return "Rank stability under weight perturbation";
    }
    return "";
}

bool parse_command(const std::string& name, Command& out) {
    for (Command command : ALL_COMMANDS) {
        if (name == command_name(command)) {
            out = command;
            return true;
        }
    }
    return false;
}

void print_usage(Command command, const char* program_name) {
    std::cout << "Usage: " << program_name << " " << command_name(command)
              << " -u <universe.tsv> -e <layer>=<evidence.tsv> [-e ...] [options]\n\n";
    switch (command) {
        case Command::SCORE:
            std::cout << "Compute composite scores, quality flags and tiers.\n\n";
            break;
        case Command::VALIDATE:
            std::cout << "Score genes and validate against positive/negative controls,\n"
                      << "QC diagnostics and a weight-perturbation sweep.\n\n";
            break;
        case Command::SENSITIVITY:
            std::cout << "Run the weight-perturbation sweep only.\n\n";
            break;
    }
    std::cout << "Options:\n";
    std::cout << "  -u, --universe <file>    Gene universe TSV (gene_id, gene_symbol; .gz ok)\n";
    std::cout << "  -e, --evidence <l=file>  Evidence TSV for layer l (gene_id, score); repeatable\n";
    std::cout << "                           Layers: gnomad, expression, annotation, localization,\n";
    std::cout << "                                   animal_model, literature\n";
    std::cout << "  -c, --config <file>      JSON configuration (weights and thresholds)\n";
    std::cout << "  -o, --output <prefix>    Output prefix (default: geneprio)\n";
    if (command != Command::SCORE) {
        std::cout << "  -t, --threads <int>      Threads for the sensitivity sweep (default: auto)\n";
        std::cout << "  --top-n <int>            Genes compared per perturbation (default: config)\n";
    }
    if (command == Command::VALIDATE) {
        std::cout << "  --skip-sensitivity       Do not run the perturbation sweep\n";
        std::cout << "  --json                   Also write <prefix>.validation.json\n";
    }
    std::cout << "  -v, --verbose            Progress on stderr\n";
    std::cout << "  -h, --help               Show this help message\n";
}

Options parse_args(Command command, int argc, char* argv[]) {
    Options opts;
    opts.command = command;
    const char* program = "geneprio";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> long long {
            try {
                size_t idx = 0;
                long long parsed = std::stoll(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const std::invalid_argument&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            } catch (const std::out_of_range&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        const bool sweep_flags = command != Command::SCORE;
        const bool validate_flags = command == Command::VALIDATE;

        if (arg == "-h" || arg == "--help") {
            print_usage(command, program);
            throw ParseArgsExit(0);
        } else if (arg == "-u" || arg == "--universe") {
            opts.universe_file = require_value(arg);
        } else if (arg == "-e" || arg == "--evidence") {
            const std::string value = require_value(arg);
            const size_t eq = value.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == value.size()) {
                throw ParseArgsExit(1, "Error: --evidence expects <layer>=<file>, got " + value);
            }
            EvidenceLayer layer = EvidenceLayer::GNOMAD;
            try {
                layer = parse_layer(value.substr(0, eq));
            } catch (const ConfigurationError& e) {
                throw ParseArgsExit(1, std::string("Error: ") + e.what());
            }
            for (const auto& [seen, path] : opts.evidence) {
                if (seen == layer) {
                    throw ParseArgsExit(1, std::string("Error: Evidence layer given twice: ") +
                                               layer_name(layer));
                }
            }
            opts.evidence.emplace_back(layer, value.substr(eq + 1));
        } else if (arg == "-c" || arg == "--config") {
            opts.config_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_prefix = require_value(arg);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (sweep_flags && (arg == "-t" || arg == "--threads")) {
            const long long t = parse_int(arg, require_value(arg));
            if (t < 1) throw ParseArgsExit(1, "Error: --threads must be >= 1");
            opts.num_threads = static_cast<int>(t);
        } else if (sweep_flags && arg == "--top-n") {
            const long long n = parse_int(arg, require_value(arg));
            if (n < 1) throw ParseArgsExit(1, "Error: --top-n must be >= 1");
            opts.top_n = static_cast<size_t>(n);
        } else if (validate_flags && arg == "--skip-sensitivity") {
            opts.skip_sensitivity = true;
        } else if (validate_flags && arg == "--json") {
            opts.json = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.universe_file.empty()) {
        throw ParseArgsExit(1, "Error: No gene universe specified (-u)");
    }
    if (opts.evidence.empty()) {
        throw ParseArgsExit(1, "Error: No evidence tables specified (-e <layer>=<file>)");
    }
    if (opts.output_prefix.empty()) {
        throw ParseArgsExit(1, "Error: Output prefix must not be empty");
    }

    return opts;
}

}  // namespace cli
}  // namespace geneprio
