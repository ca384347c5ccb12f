#pragma once

#include <crlf/result.hpp>
#include <crlf/line_ending.hpp>
#include <crlf/log.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace crlf {

constexpr size_t kDefaultMaxFileSize = 10 * 1024 * 1024;

struct ScanConfig {
    size_t max_file_size = kDefaultMaxFileSize;
    bool follow_symlinks = false;
    bool skip_hidden = true;
    std::vector<std::string> patterns;   // used when none are given on the CLI
};

// Layered configuration: global > project > command line
// Later layers override earlier ones, but only for keys they set.
struct Config {
    ScanConfig scan;
    std::optional<LineEnding> convert_target;
    log::Level log_level = log::Info;
    std::optional<bool> log_color;       // unset: auto-detect from stderr

    // Track which fields were explicitly set (for merge)
    bool max_file_size_set = false;
    bool follow_symlinks_set = false;
    bool skip_hidden_set = false;
    bool patterns_set = false;
    bool log_level_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> cli
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& cli);
};

// Discover the global config file path: ~/.crlf/config.toml
std::string global_config_path();

// Project config file inside a scan root: <root>/.crlf.toml
std::string project_config_path(const std::string& root);

} // namespace crlf
