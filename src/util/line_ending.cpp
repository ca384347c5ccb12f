#include <crlf/line_ending.hpp>
#include <new>

namespace crlf {

const char* line_ending_name(LineEnding v) {
    switch (v) {
        case LineEnding::LF:    return "lf";
        case LineEnding::CRLF:  return "crlf";
        case LineEnding::CR:    return "cr";
        case LineEnding::Mixed: return "mixed";
        case LineEnding::None:  return "none";
    }
    return "unknown";
}

std::optional<LineEnding> parse_line_ending(const std::string& s) {
    if (s == "lf" || s == "unix") return LineEnding::LF;
    if (s == "crlf" || s == "win") return LineEnding::CRLF;
    if (s == "cr" || s == "mac") return LineEnding::CR;
    return std::nullopt;
}

std::string line_ending_terminator(LineEnding v) {
    switch (v) {
        case LineEnding::LF:   return "\n";
        case LineEnding::CRLF: return "\r\n";
        case LineEnding::CR:   return "\r";
        default:               return "";
    }
}

LineEndingInfo LineEndingInfo::from_counts(size_t lf, size_t crlf, size_t cr) {
    LineEndingInfo info;
    info.lf_count = lf;
    info.crlf_count = crlf;
    info.cr_count = cr;

    int kinds = (lf > 0) + (crlf > 0) + (cr > 0);
    if (kinds > 1) {
        info.variant = LineEnding::Mixed;
    } else if (lf > 0) {
        info.variant = LineEnding::LF;
    } else if (crlf > 0) {
        info.variant = LineEnding::CRLF;
    } else if (cr > 0) {
        info.variant = LineEnding::CR;
    } else {
        info.variant = LineEnding::None;
    }
    return info;
}

bool LineEndingInfo::operator==(const LineEndingInfo& o) const {
    return variant == o.variant && lf_count == o.lf_count &&
           crlf_count == o.crlf_count && cr_count == o.cr_count;
}

bool LineEndingInfo::operator!=(const LineEndingInfo& o) const {
    return !(*this == o);
}

LineEndingInfo detect_line_endings(const std::string& content) {
    size_t lf = 0, crlf = 0, cr = 0;

    size_t i = 0;
    while (i < content.size()) {
        char c = content[i];
        if (c == '\r') {
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                crlf++;
                i += 2;
                continue;
            }
            cr++;
        } else if (c == '\n') {
            lf++;
        }
        i++;
    }

    return LineEndingInfo::from_counts(lf, crlf, cr);
}

Result<std::string> convert_line_endings(const std::string& content,
                                         LineEnding target) {
    if (target == LineEnding::Mixed || target == LineEnding::None) {
        return CrlfError{CrlfError::InvalidArg,
            std::string("cannot convert to '") + line_ending_name(target) + "'",
            "target must be lf, crlf or cr"};
    }

    const std::string term = line_ending_terminator(target);

    try {
        std::string out;
        // Enough for LF/CR targets; CRLF may grow once
        out.reserve(content.size());

        size_t i = 0;
        while (i < content.size()) {
            char c = content[i];
            if (c == '\r') {
                out += term;
                bool pair = i + 1 < content.size() && content[i + 1] == '\n';
                i += pair ? 2 : 1;
            } else if (c == '\n') {
                out += term;
                i++;
            } else {
                out.push_back(c);
                i++;
            }
        }

        return Result<std::string>::ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return CrlfError{CrlfError::OutOfMemory,
            "out of memory converting " + std::to_string(content.size()) +
            "-byte buffer to " + line_ending_name(target)};
    }
}

} // namespace crlf
