#ifndef GENEPRIO_CLI_ARGS_HPP
#define GENEPRIO_CLI_ARGS_HPP

#include "geneprio/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace geneprio {
namespace cli {

enum class Command {
    SCORE,
    VALIDATE,
    SENSITIVITY
};

const char* command_name(Command command);

// Subcommands in workflow order
constexpr Command ALL_COMMANDS[] = {Command::SCORE, Command::VALIDATE, Command::SENSITIVITY};

const char* command_summary(Command command);

// False when `name` is not a subcommand
bool parse_command(const std::string& name, Command& out);

// Thrown instead of calling exit(): 0 for --help, 1 for usage errors.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& msg = "")
        : std::runtime_error(msg), exit_code_(code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct Options {
    Command command = Command::SCORE;
    std::string config_file;                 // empty = built-in defaults
    std::string universe_file;
    std::vector<std::pair<EvidenceLayer, std::string>> evidence;
    std::string output_prefix = "geneprio";  // <prefix>.scores.tsv, <prefix>.validation.md, ...
    int num_threads = 0;                     // 0 = auto
    bool verbose = false;
    bool skip_sensitivity = false;           // validate only
    size_t top_n = 0;                        // 0 = take sensitivity.top_n from config
    bool json = false;                       // validate only: also write <prefix>.validation.json
};

void print_usage(Command command, const char* program_name);

// argv[0] is the subcommand name. Throws ParseArgsExit.
Options parse_args(Command command, int argc, char* argv[]);

}  // namespace cli
}  // namespace geneprio

#endif  // GENEPRIO_CLI_ARGS_HPP
