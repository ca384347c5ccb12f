#pragma once

#include <crlf/result.hpp>
#include <crlf/config.hpp>
#include <crlf/line_ending.hpp>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace crlf {

struct ScanOptions {
    std::filesystem::path root = ".";
    std::vector<std::string> patterns;
    size_t max_file_size = kDefaultMaxFileSize;
    bool follow_symlinks = false;
    bool skip_hidden = true;

    // Scan settings from an effective config; patterns are left empty.
    static ScanOptions from_config(const Config& cfg,
                                   const std::filesystem::path& root);
};

struct MatchedFile {
    std::string rel_path;            // relative to root, '/' separated
    std::filesystem::path abs_path;
    size_t pattern_index = 0;        // first pattern that matched
};

struct FileReport {
    std::string path;
    LineEndingInfo info;
};

struct ConvertFailure {
    std::string path;
    CrlfError error;
};

struct ConvertSummary {
    std::vector<std::string> converted;   // rewritten (or would be, on dry run)
    std::vector<std::string> unchanged;   // already in the target style
    std::vector<ConvertFailure> failed;
};

// Enumerate regular files under options.root that match one of
// options.patterns. Sorted by rel_path.
Result<std::vector<MatchedFile>> walk_files(const ScanOptions& options);

// Read an entire file as raw bytes. TooLarge if it exceeds max_size.
Result<std::string> read_file_bytes(const std::filesystem::path& path,
                                    size_t max_size);

// Replace a file's contents via a temporary sibling and rename.
Status write_file_bytes(const std::filesystem::path& path,
                        const std::string& bytes);

// Detect every matched file. Files whose variant equals `exclude` are
// left out of the result. Unreadable files are warned about and skipped.
Result<std::vector<FileReport>> check_files(
    const ScanOptions& options,
    std::optional<LineEnding> exclude = std::nullopt);

// Convert every matched file to `target`, writing only files whose bytes
// change. With dry_run nothing is written.
Result<ConvertSummary> convert_files(const ScanOptions& options,
                                     LineEnding target,
                                     bool dry_run = false);

// "LF: 3   | CRLF: 0   | CR: 0   | lf     | src/main.cpp"
std::string format_report_line(const FileReport& report);

} // namespace crlf
