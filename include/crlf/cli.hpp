#pragma once

#include <crlf/result.hpp>
#include <crlf/config.hpp>
#include <crlf/log.hpp>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace crlf {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;       // bad arguments or configuration
constexpr int kExitFailures = 2;    // convert: at least one file failed

struct CliArgs {
    std::string command;                 // check, not, convert
    std::vector<std::string> operands;   // everything after the command
    std::filesystem::path root = ".";
    std::optional<std::string> config_path;
    std::optional<size_t> max_size;
    std::optional<log::Level> level;
    bool follow_symlinks = false;
    bool all = false;
    bool dry_run = false;
    bool no_color = false;
    bool help = false;
    bool version = false;
};

// Parse arguments, program name excluded. Options may appear anywhere;
// "--" ends option processing.
Result<CliArgs> parse_args(const std::vector<std::string>& argv);

// Effective config: ~/.crlf/config.toml, then --config or <root>/.crlf.toml,
// then the command-line options.
Result<Config> load_config(const CliArgs& args);

// Run check / not / convert. Report lines go to `out`.
Result<int> run_command(const CliArgs& args, std::ostream& out);

// Whole program: errors are written to `err` in CrlfError::format() form
// followed by the usage text, and yield kExitUsage.
int run_cli(const std::vector<std::string>& argv,
            std::ostream& out, std::ostream& err);

std::string usage_text();
std::string help_text();

} // namespace crlf
