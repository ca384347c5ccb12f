#include <crlf/scanner.hpp>
#include <crlf/glob.hpp>
#include <crlf/log.hpp>
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <cstdio>

namespace crlf {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

static bool is_hidden(const fs::path& p) {
    auto name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

static fs::path temp_sibling(const fs::path& path) {
    fs::path tmp = path;
    tmp += ".crlf-tmp";
    return tmp;
}

// ---------------------------------------------------------------------------
// ScanOptions
// ---------------------------------------------------------------------------

ScanOptions ScanOptions::from_config(const Config& cfg, const fs::path& root) {
    ScanOptions opts;
    opts.root = root;
    opts.max_file_size = cfg.scan.max_file_size;
    opts.follow_symlinks = cfg.scan.follow_symlinks;
    opts.skip_hidden = cfg.scan.skip_hidden;
    return opts;
}

// ---------------------------------------------------------------------------
// Walking
// ---------------------------------------------------------------------------

Result<std::vector<MatchedFile>> walk_files(const ScanOptions& options) {
    std::error_code ec;
    if (!fs::is_directory(options.root, ec)) {
        return CrlfError(CrlfError::IO,
            "scan root is not a directory: " + options.root.string(),
            "pass an existing directory with --root");
    }

    auto dir_opts = fs::directory_options::skip_permission_denied;
    if (options.follow_symlinks) {
        dir_opts |= fs::directory_options::follow_directory_symlink;
    }

    // Canonical directories already entered when following links. Each is
    // descended at most once.
    std::set<fs::path> visited_dirs;
    if (options.follow_symlinks) {
        visited_dirs.insert(fs::canonical(options.root, ec));
        if (ec) {
            return CrlfError(CrlfError::IO,
                "cannot resolve " + options.root.string() + ": " + ec.message());
        }
    }

    std::vector<MatchedFile> results;
    fs::recursive_directory_iterator it(options.root, dir_opts, ec);
    if (ec) {
        return CrlfError(CrlfError::IO,
            "cannot open directory " + options.root.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return CrlfError(CrlfError::IO,
                "error iterating directory: " + ec.message());
        }
        const auto& entry = *it;

        if (options.skip_hidden && is_hidden(entry.path())) {
            if (entry.is_directory(ec)) it.disable_recursion_pending();
            continue;
        }

        if (!options.follow_symlinks && entry.is_symlink(ec)) continue;

        if (options.follow_symlinks && entry.is_directory(ec)) {
            auto real = fs::canonical(entry.path(), ec);
            if (ec) {
                log::warn("cannot resolve %s: %s",
                          entry.path().string().c_str(), ec.message().c_str());
                ec.clear();
                it.disable_recursion_pending();
            } else if (!visited_dirs.insert(real).second) {
                log::debug("not descending into %s: already visited as %s",
                           entry.path().string().c_str(), real.string().c_str());
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file(ec)) {
            if (ec) {
                log::warn("cannot stat %s: %s",
                          entry.path().string().c_str(), ec.message().c_str());
                ec.clear();
            }
            continue;
        }

        auto rel = entry.path().lexically_relative(options.root).generic_string();
        auto idx = glob_first_match(options.patterns, rel);
        if (!idx) continue;

        log::trace("%s matched pattern '%s'", rel.c_str(),
                   options.patterns[*idx].c_str());
        results.push_back(MatchedFile{rel, entry.path(), *idx});
    }
    if (ec) {
        return CrlfError(CrlfError::IO,
            "error iterating directory: " + ec.message());
    }

    std::sort(results.begin(), results.end(),
              [](const MatchedFile& a, const MatchedFile& b) {
                  return a.rel_path < b.rel_path;
              });
    return Result<std::vector<MatchedFile>>::ok(std::move(results));
}

// ---------------------------------------------------------------------------
// File I/O
// ---------------------------------------------------------------------------

Result<std::string> read_file_bytes(const fs::path& path, size_t max_size) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return CrlfError(CrlfError::IO,
            "cannot stat " + path.string() + ": " + ec.message());
    }
    if (size > max_size) {
        return CrlfError(CrlfError::TooLarge,
            path.string() + " is " + std::to_string(size) +
            " bytes, limit is " + std::to_string(max_size),
            "raise scan.max-file-size or pass --max-size");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return CrlfError(CrlfError::IO, "cannot open file: " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return CrlfError(CrlfError::IO, "error reading file: " + path.string());
    }

    auto bytes = ss.str();
    // The file may have grown since it was stat'ed
    if (bytes.size() > max_size) {
        return CrlfError(CrlfError::TooLarge,
            path.string() + " exceeds " + std::to_string(max_size) + " bytes");
    }
    return Result<std::string>::ok(std::move(bytes));
}

Status write_file_bytes(const fs::path& path, const std::string& bytes) {
    auto tmp = temp_sibling(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return CrlfError(CrlfError::IO,
                "cannot create temporary file: " + tmp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (out.fail()) {
            std::error_code rm_ec;
            fs::remove(tmp, rm_ec);
            return CrlfError(CrlfError::IO, "error writing file: " + tmp.string());
        }
    }

    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (!ec) fs::permissions(tmp, perms, ec);
    if (ec) {
        log::debug("could not copy permissions to %s: %s",
                   tmp.string().c_str(), ec.message().c_str());
        ec.clear();
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return CrlfError(CrlfError::IO,
            "cannot replace " + path.string() + ": " + ec.message());
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Batch operations
// ---------------------------------------------------------------------------

Result<std::vector<FileReport>> check_files(const ScanOptions& options,
                                            std::optional<LineEnding> exclude) {
    auto files = walk_files(options);
    CRLF_TRY(files);

    std::vector<FileReport> reports;
    for (const auto& f : files.value()) {
        auto info = read_file_bytes(f.abs_path, options.max_file_size)
            .map([](std::string& bytes) { return detect_line_endings(bytes); });
        if (info.is_err()) {
            log::warn("skipping %s: %s", f.rel_path.c_str(),
                      info.error().message.c_str());
            continue;
        }
        if (exclude && info.value().variant == *exclude) continue;

        reports.push_back(FileReport{f.rel_path, info.value()});
    }

    log::debug("checked %zu file(s), %zu reported",
               files.value().size(), reports.size());
    return Result<std::vector<FileReport>>::ok(std::move(reports));
}

Result<ConvertSummary> convert_files(const ScanOptions& options,
                                     LineEnding target,
                                     bool dry_run) {
    if (target == LineEnding::Mixed || target == LineEnding::None) {
        return CrlfError(CrlfError::InvalidArg,
            std::string("cannot convert to '") + line_ending_name(target) + "'",
            "target must be lf, crlf or cr");
    }

    auto files = walk_files(options);
    CRLF_TRY(files);

    ConvertSummary summary;
    for (const auto& f : files.value()) {
        auto content = read_file_bytes(f.abs_path, options.max_file_size);
        if (content.is_err()) {
            log::warn("skipping %s: %s", f.rel_path.c_str(),
                      content.error().message.c_str());
            summary.failed.push_back(ConvertFailure{f.rel_path, content.error()});
            continue;
        }

        auto converted = convert_line_endings(content.value(), target);
        if (converted.is_err()) {
            log::error("%s: %s", f.rel_path.c_str(),
                       converted.error().message.c_str());
            summary.failed.push_back(ConvertFailure{f.rel_path, converted.error()});
            continue;
        }

        if (converted.value() == content.value()) {
            summary.unchanged.push_back(f.rel_path);
            continue;
        }

        if (!dry_run) {
            auto written = write_file_bytes(f.abs_path, converted.value());
            if (written.is_err()) {
                log::error("%s", written.error().message.c_str());
                summary.failed.push_back(ConvertFailure{f.rel_path, written.error()});
                continue;
            }
        }
        summary.converted.push_back(f.rel_path);
    }

    return Result<ConvertSummary>::ok(std::move(summary));
}

std::string format_report_line(const FileReport& report) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "LF: %-3zu | CRLF: %-3zu | CR: %-3zu | %-6s | ",
                  report.info.lf_count, report.info.crlf_count,
                  report.info.cr_count, line_ending_name(report.info.variant));
    return std::string(buf) + report.path;
}

} // namespace crlf
