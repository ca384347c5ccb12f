#include <crlf/config.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdint>

namespace crlf {

static CrlfError type_error(const std::string& key, const char* expected) {
    return CrlfError{CrlfError::Config,
        "config key '" + key + "' must be " + expected};
}

static Status parse_scan(const toml::table& scan, Config& cfg) {
    if (auto node = scan["max-file-size"]) {
        auto v = node.value_exact<int64_t>();
        if (!v) return type_error("scan.max-file-size", "an integer");
        if (*v < 0) {
            return CrlfError{CrlfError::Config,
                "scan.max-file-size must not be negative",
                "got " + std::to_string(*v)};
        }
        cfg.scan.max_file_size = static_cast<size_t>(*v);
        cfg.max_file_size_set = true;
    }

    if (auto node = scan["follow-symlinks"]) {
        auto v = node.value_exact<bool>();
        if (!v) return type_error("scan.follow-symlinks", "a boolean");
        cfg.scan.follow_symlinks = *v;
        cfg.follow_symlinks_set = true;
    }

    if (auto node = scan["skip-hidden"]) {
        auto v = node.value_exact<bool>();
        if (!v) return type_error("scan.skip-hidden", "a boolean");
        cfg.scan.skip_hidden = *v;
        cfg.skip_hidden_set = true;
    }

    if (auto node = scan["patterns"]) {
        auto arr = node.as_array();
        if (!arr) return type_error("scan.patterns", "an array of strings");
        for (const auto& el : *arr) {
            auto s = el.value_exact<std::string>();
            if (!s) return type_error("scan.patterns", "an array of strings");
            cfg.scan.patterns.push_back(*s);
        }
        cfg.patterns_set = true;
    }

    return ok_status();
}

static Status parse_convert(const toml::table& convert, Config& cfg) {
    if (auto node = convert["target"]) {
        auto s = node.value_exact<std::string>();
        if (!s) return type_error("convert.target", "a string");
        auto target = parse_line_ending(*s);
        if (!target) {
            return CrlfError{CrlfError::Config,
                "unknown line ending '" + *s + "' in convert.target",
                "use win, unix, mac, crlf, lf, or cr"};
        }
        cfg.convert_target = *target;
    }
    return ok_status();
}

static Status parse_log(const toml::table& log_tbl, Config& cfg) {
    if (auto node = log_tbl["level"]) {
        auto s = node.value_exact<std::string>();
        if (!s) return type_error("log.level", "a string");
        auto lvl = log::parse_level(*s);
        if (!lvl) {
            return CrlfError{CrlfError::Config,
                "unknown log level '" + *s + "'",
                "use trace, debug, info, warn, or error"};
        }
        cfg.log_level = *lvl;
        cfg.log_level_set = true;
    }

    if (auto node = log_tbl["color"]) {
        auto v = node.value_exact<bool>();
        if (!v) return type_error("log.color", "a boolean");
        cfg.log_color = *v;
    }
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        CrlfError err{CrlfError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        return err;
    }

    Config cfg;

    // [scan] section
    if (auto scan = doc["scan"].as_table()) {
        CRLF_TRY(parse_scan(*scan, cfg));
    }

    // [convert] section
    if (auto convert = doc["convert"].as_table()) {
        CRLF_TRY(parse_convert(*convert, cfg));
    }

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        CRLF_TRY(parse_log(*log_tbl, cfg));
    }

    return Result<Config>::ok(std::move(cfg));
}

static Result<std::string> read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CrlfError{CrlfError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Result<Config> Config::load(const std::string& path) {
    return read_text(path)
        .and_then([](std::string& text) { return Config::parse(text); })
        .or_else([&](CrlfError& err) {
            if (err.file.empty()) err.file = path;
            return Result<Config>::err(std::move(err));
        });
}

void Config::merge(const Config& other) {
    if (other.max_file_size_set) {
        scan.max_file_size = other.scan.max_file_size;
        max_file_size_set = true;
    }
    if (other.follow_symlinks_set) {
        scan.follow_symlinks = other.scan.follow_symlinks;
        follow_symlinks_set = true;
    }
    if (other.skip_hidden_set) {
        scan.skip_hidden = other.scan.skip_hidden;
        skip_hidden_set = true;
    }
    // Patterns replace as a whole list, they do not accumulate
    if (other.patterns_set) {
        scan.patterns = other.scan.patterns;
        patterns_set = true;
    }

    if (other.convert_target.has_value()) {
        convert_target = other.convert_target;
    }

    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color.has_value()) {
        log_color = other.log_color;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.crlf/config.toml";
}

std::string project_config_path(const std::string& root) {
    return (std::filesystem::path(root) / ".crlf.toml").string();
}

} // namespace crlf
