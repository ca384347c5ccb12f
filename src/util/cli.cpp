#include <crlf/cli.hpp>
#include <crlf/config.hpp>
#include <crlf/line_ending.hpp>
#include <crlf/log.hpp>
#include <crlf/scanner.hpp>

#include <filesystem>
#include <ostream>
#include <stdexcept>

#ifndef CRLF_VERSION
#define CRLF_VERSION "0.0.0"
#endif

namespace crlf {

namespace fs = std::filesystem;

static const char* kUsageText = R"(Usage:
  crlf [options] check <glob_pattern> ...
  crlf [options] not <variant> <glob_pattern> ...
  crlf [options] convert <variant> <glob_pattern> ...
)";

static const char* kDetailsText = R"(
Commands:
  check    Analyze files and show their line ending variants.
  not      Analyze files and show those that DO NOT match the specified variant.
  convert  Convert line endings in files to a specific variant.

Options:
  -C, --root <dir>      Directory to scan (default: current directory)
      --config <file>   Use <file> instead of <root>/.crlf.toml
      --max-size <n>    Skip files larger than <n> bytes (default: 10 MiB)
      --follow-symlinks Descend into symlinked directories
      --all             Include hidden files and directories
  -n, --dry-run         With convert: report, but do not write
  -v, --verbose         Debug output
  -q, --quiet           Only warnings and errors
      --log-level <l>   trace, debug, info, warn or error
      --no-color        Disable colored log output
  -h, --help            Show this help
      --version         Show version

Variants:
  win, crlf    Windows style (record separator: \r\n)
  unix, lf     Unix/Linux/macOS style (record separator: \n)
  mac, cr      Classic Mac style (record separator: \r)

Line Ending Explanations:
  - LF (Line Feed, \n, 0x0A): Used by Unix, Linux, and modern macOS.
  - CRLF (Carriage Return + Line Feed, \r\n, 0x0D 0x0A): Used by Windows.
  - CR (Carriage Return, \r, 0x0D): Used by classic Mac OS (pre-OSX).

Mixed line endings occur when a file contains more than one type of
record separator, which can cause issues with some compilers and editors.

Glob Patterns:
  * matches any number of characters within a directory.
  ** matches any number of characters across directories.
  Example: "*.cpp", "src/**/*.hpp", "test_*.txt"

Configuration:
  ~/.crlf/config.toml, then <root>/.crlf.toml, then command-line options.
)";

static const char* kVariantHint = "Use win, unix, mac, crlf, lf, or cr.";

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

static Result<size_t> parse_size(const std::string& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return CrlfError{CrlfError::InvalidArg,
            "invalid size '" + s + "'", "expected a byte count, e.g. 1048576"};
    }
    try {
        return Result<size_t>::ok(static_cast<size_t>(std::stoull(s)));
    } catch (const std::out_of_range&) {
        return CrlfError{CrlfError::InvalidArg, "size '" + s + "' is out of range"};
    }
}

Result<CliArgs> parse_args(const std::vector<std::string>& argv) {
    CliArgs args;
    bool options_done = false;

    for (size_t i = 0; i < argv.size(); i++) {
        const std::string& a = argv[i];

        auto next_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argv.size()) {
                return CrlfError{CrlfError::InvalidArg,
                    "option " + flag + " requires a value"};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (options_done || a.empty() || a[0] != '-' || a == "-") {
            if (args.command.empty()) {
                args.command = a;
            } else {
                args.operands.push_back(a);
            }
            continue;
        }

        if (a == "--") {
            options_done = true;
        } else if (a == "-h" || a == "--help") {
            args.help = true;
        } else if (a == "--version") {
            args.version = true;
        } else if (a == "-C" || a == "--root") {
            auto v = next_value(a);
            CRLF_TRY(v);
            args.root = v.value();
        } else if (a == "--config") {
            auto v = next_value(a);
            CRLF_TRY(v);
            args.config_path = v.value();
        } else if (a == "--max-size") {
            auto v = next_value(a);
            CRLF_TRY(v);
            auto n = parse_size(v.value());
            CRLF_TRY(n);
            args.max_size = n.value();
        } else if (a == "--log-level") {
            auto v = next_value(a);
            CRLF_TRY(v);
            args.level = log::parse_level(v.value());
            if (!args.level) {
                return CrlfError{CrlfError::InvalidArg,
                    "unknown log level '" + v.value() + "'",
                    "use trace, debug, info, warn, or error"};
            }
        } else if (a == "--follow-symlinks") {
            args.follow_symlinks = true;
        } else if (a == "--all") {
            args.all = true;
        } else if (a == "-n" || a == "--dry-run") {
            args.dry_run = true;
        } else if (a == "-v" || a == "--verbose") {
            args.level = log::Debug;
        } else if (a == "-q" || a == "--quiet") {
            args.level = log::Warn;
        } else if (a == "--no-color") {
            args.no_color = true;
        } else {
            return CrlfError{CrlfError::InvalidArg,
                "unknown option: " + a, "see crlf --help"};
        }
    }

    return Result<CliArgs>::ok(std::move(args));
}

// ---------------------------------------------------------------------------
// Configuration layering
// ---------------------------------------------------------------------------

static Config cli_layer(const CliArgs& args) {
    Config cli;
    if (args.max_size) {
        cli.scan.max_file_size = *args.max_size;
        cli.max_file_size_set = true;
    }
    if (args.follow_symlinks) {
        cli.scan.follow_symlinks = true;
        cli.follow_symlinks_set = true;
    }
    if (args.all) {
        cli.scan.skip_hidden = false;
        cli.skip_hidden_set = true;
    }
    if (args.level) {
        cli.log_level = *args.level;
        cli.log_level_set = true;
    }
    if (args.no_color) {
        cli.log_color = false;
    }
    return cli;
}

Result<Config> load_config(const CliArgs& args) {
    std::optional<Config> global;
    auto global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        CRLF_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> project;
    if (args.config_path) {
        auto p = Config::load(*args.config_path);
        CRLF_TRY(p);
        project = std::move(p).value();
    } else {
        auto project_path = project_config_path(args.root.string());
        if (fs::exists(project_path, ec)) {
            auto p = Config::load(project_path);
            CRLF_TRY(p);
            project = std::move(p).value();
        }
    }

    return Result<Config>::ok(Config::effective(global, project, cli_layer(args)));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static Result<std::vector<std::string>> resolve_patterns(
    const std::vector<std::string>& operands, const Config& cfg,
    const std::string& usage)
{
    if (!operands.empty()) {
        return Result<std::vector<std::string>>::ok(operands);
    }
    if (!cfg.scan.patterns.empty()) {
        log::debug("using %zu pattern(s) from config", cfg.scan.patterns.size());
        return Result<std::vector<std::string>>::ok(cfg.scan.patterns);
    }
    return CrlfError{CrlfError::InvalidArg, "no glob patterns given",
        "usage: " + usage};
}

static Result<LineEnding> require_variant(const std::string& s) {
    auto v = parse_line_ending(s);
    if (!v) {
        return CrlfError{CrlfError::InvalidArg,
            "Invalid variant: " + s + ". " + kVariantHint};
    }
    return Result<LineEnding>::ok(*v);
}

static Result<int> run_check(const CliArgs& args, const Config& cfg,
                             std::ostream& out,
                             std::optional<LineEnding> exclude,
                             std::vector<std::string> operands,
                             const std::string& usage) {
    auto patterns = resolve_patterns(operands, cfg, usage);
    CRLF_TRY(patterns);

    auto opts = ScanOptions::from_config(cfg, args.root);
    opts.patterns = std::move(patterns).value();

    auto reports = check_files(opts, exclude);
    CRLF_TRY(reports);

    for (const auto& r : reports.value()) {
        out << format_report_line(r) << "\n";
    }
    return Result<int>::ok(kExitOk);
}

static Result<int> run_convert(const CliArgs& args, const Config& cfg,
                               std::ostream& out) {
    const std::string usage = "crlf convert <variant> <glob_pattern> ...";
    std::vector<std::string> operands = args.operands;

    LineEnding target = LineEnding::LF;
    std::optional<LineEnding> first;
    if (!operands.empty()) first = parse_line_ending(operands.front());

    if (first) {
        target = *first;
        operands.erase(operands.begin());
    } else if (cfg.convert_target) {
        target = *cfg.convert_target;
        log::debug("using target '%s' from config", line_ending_name(target));
        if (!operands.empty()) {
            log::debug("'%s' is not a variant, treating it as a pattern",
                       operands.front().c_str());
        }
    } else if (!operands.empty()) {
        return CrlfError{CrlfError::InvalidArg,
            "Invalid variant: " + operands.front() + ". " + kVariantHint};
    } else {
        return CrlfError{CrlfError::InvalidArg, "no target variant given",
            "usage: " + usage};
    }

    auto patterns = resolve_patterns(operands, cfg, usage);
    CRLF_TRY(patterns);

    auto opts = ScanOptions::from_config(cfg, args.root);
    opts.patterns = std::move(patterns).value();

    auto summary = convert_files(opts, target, args.dry_run);
    CRLF_TRY(summary);

    const auto& s = summary.value();
    for (const auto& path : s.converted) {
        if (args.dry_run) {
            out << "Would convert " << path << " to "
                << line_ending_name(target) << "\n";
        } else {
            out << "Converted " << path << " to "
                << line_ending_name(target) << "\n";
        }
    }

    log::info("%zu converted, %zu unchanged, %zu failed",
              s.converted.size(), s.unchanged.size(), s.failed.size());
    return Result<int>::ok(s.failed.empty() ? kExitOk : kExitFailures);
}

Result<int> run_command(const CliArgs& args, std::ostream& out) {
    auto cfg = load_config(args);
    CRLF_TRY(cfg);
    const auto& c = cfg.value();

    log::set_level(c.log_level);
    if (c.log_color) log::set_color_enabled(*c.log_color);
    log::debug("scanning %s", args.root.string().c_str());

    if (args.command == "check") {
        return run_check(args, c, out, std::nullopt, args.operands,
                         "crlf check <glob_pattern> ...");
    }

    if (args.command == "not") {
        const std::string usage = "crlf not <variant> <glob_pattern> ...";
        if (args.operands.empty()) {
            return CrlfError{CrlfError::InvalidArg, "missing variant",
                "usage: " + usage};
        }
        auto variant = require_variant(args.operands.front());
        CRLF_TRY(variant);
        std::vector<std::string> rest(args.operands.begin() + 1,
                                      args.operands.end());
        return run_check(args, c, out, variant.value(), std::move(rest), usage);
    }

    if (args.command == "convert") {
        return run_convert(args, c, out);
    }

    return CrlfError{CrlfError::InvalidArg,
        "Unknown command: " + args.command, "see crlf --help"};
}

std::string usage_text() {
    return kUsageText;
}

std::string help_text() {
    return std::string("Line Ending Utility (crlf)\n\n") + kUsageText + kDetailsText;
}

int run_cli(const std::vector<std::string>& argv,
            std::ostream& out, std::ostream& err) {
    auto args = parse_args(argv);
    if (args.is_err()) {
        err << args.error().format() << "\n\n" << usage_text();
        return kExitUsage;
    }

    if (args.value().version) {
        out << "crlf " << CRLF_VERSION << "\n";
        return kExitOk;
    }
    if (args.value().help || args.value().command.empty()) {
        out << help_text();
        return kExitOk;
    }

    auto result = run_command(args.value(), out);
    if (result.is_err()) {
        err << result.error().format() << "\n\n" << usage_text();
        return kExitUsage;
    }
    return result.value();
}

} // namespace crlf
