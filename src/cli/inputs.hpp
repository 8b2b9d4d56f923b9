#ifndef GENEPRIO_CLI_INPUTS_HPP
#define GENEPRIO_CLI_INPUTS_HPP

#include "args.hpp"
#include "geneprio/config.hpp"
#include "geneprio/scoring.hpp"

#include <functional>
#include <vector>

namespace geneprio {
namespace cli {

struct Inputs {
    PipelineConfig config;
    std::vector<Gene> genes;
    EvidenceSet evidence;
    Diagnostics diagnostics;    // reader-level data issues
};

// Load config (with CLI overrides), universe and evidence tables.
// Throws ConfigurationError / InputError.
Inputs load_inputs(const Options& opts);

// Parse arguments and run `body`, mapping every error to exit status 1.
int run_command(Command command, int argc, char* argv[],
                const std::function<int(const Options&)>& body);

// Subcommand entry points; argv[0] is the subcommand name
int cmd_score(int argc, char* argv[]);
int cmd_validate(int argc, char* argv[]);
int cmd_sensitivity(int argc, char* argv[]);

}  // namespace cli
}  // namespace geneprio

#endif  // GENEPRIO_CLI_INPUTS_HPP
