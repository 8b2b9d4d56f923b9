// geneprio: evidence-weighted gene prioritization
//
// Usage:
//   geneprio score -u genes.tsv -e gnomad=gnomad.tsv ...        Composite scores and tiers
//   geneprio validate -u genes.tsv -e ... [--skip-sensitivity]  Full validation report
//   geneprio sensitivity -u genes.tsv -e ...                    Weight-perturbation sweep

#include "args.hpp"
#include "inputs.hpp"
#include "geneprio/types.hpp"
#include "geneprio/version.h"

#include <cstring>
#include <iostream>

namespace {

using geneprio::cli::Command;

int dispatch(Command command, int argc, char* argv[]) {
    switch (command) {
        case Command::SCORE: return geneprio::cli::cmd_score(argc, argv);
        case Command::VALIDATE: return geneprio::cli::cmd_validate(argc, argv);
        case Command::SENSITIVITY: return geneprio::cli::cmd_sensitivity(argc, argv);
    }
    return 1;
}

void print_help(const char* program_name) {
    std::cout << "geneprio v" << GENEPRIO_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " <command> -u <universe.tsv> "
              << "-e <layer>=<evidence.tsv> [-e ...] [options]\n\n";
    std::cout << "Commands:\n";
    for (Command command : geneprio::cli::ALL_COMMANDS) {
        const std::string name = geneprio::cli::command_name(command);
        std::cout << "  " << name << std::string(13 - name.size(), ' ')
                  << geneprio::cli::command_summary(command) << "\n";
    }
    std::cout << "\nEvidence layers:";
    for (auto layer : geneprio::ALL_LAYERS) std::cout << " " << geneprio::layer_name(layer);
    std::cout << "\n";
    std::cout << "Each evidence table needs gene_id and score columns; scores lie in [0,1],\n"
                 "missing values (NA, empty) stay missing and are never imputed.\n";
    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        print_help(argv[0]);
        return 0;
    }

    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        std::cout << "geneprio " << GENEPRIO_VERSION << "\n";
        return 0;
    }

    Command command;
    if (geneprio::cli::parse_command(first_arg, command)) {
        return dispatch(command, argc - 1, argv + 1);
    }

    std::cerr << "Unknown command: " << first_arg << "\n";
    std::cerr << "Run 'geneprio --help' for usage information.\n";
    return 1;
}
