#pragma once

#include <crlf/result.hpp>
#include <string>
#include <optional>
#include <cstddef>

namespace crlf {

enum class LineEnding {
    LF,      // "\n" only
    CRLF,    // "\r\n" only
    CR,      // lone "\r" only
    Mixed,   // more than one of the above
    None,    // no terminators at all
};

// Canonical lowercase tag: lf, crlf, cr, mixed, none
const char* line_ending_name(LineEnding v);

// Case-sensitive aliases: lf/unix, crlf/win, cr/mac.
// Mixed and None are not valid targets and never parse.
std::optional<LineEnding> parse_line_ending(const std::string& s);

// Terminator bytes for LF, CRLF and CR; empty for Mixed and None.
std::string line_ending_terminator(LineEnding v);

struct LineEndingInfo {
    LineEnding variant = LineEnding::None;
    size_t lf_count = 0;
    size_t crlf_count = 0;
    size_t cr_count = 0;

    // Build from counters; the variant is derived, never supplied.
    static LineEndingInfo from_counts(size_t lf, size_t crlf, size_t cr);

    bool operator==(const LineEndingInfo& o) const;
    bool operator!=(const LineEndingInfo& o) const;
};

// Single pass: "\r\n" counts once as CRLF, never as CR plus LF.
LineEndingInfo detect_line_endings(const std::string& content);

// Rewrite every terminator in `content` to the terminator of `target`,
// copying all other bytes through. Returns a new buffer; content is
// untouched.
// Errors: InvalidArg for Mixed/None targets, OutOfMemory when the output
// cannot be allocated.
Result<std::string> convert_line_endings(const std::string& content,
                                         LineEnding target);

} // namespace crlf
