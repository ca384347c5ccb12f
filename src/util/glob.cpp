#include <crlf/glob.hpp>
#include <new>
#include <utility>

namespace crlf {

// ---- Helpers ----

static std::string normalize_separators(const std::string& p) {
    std::string out(p);
    for (char& c : out) {
        if (c == '\\') c = '/';
    }
    return out;
}

// Worklist search over (pattern index, path index) states. Each state is
// expanded at most once, so the search is bounded by
// (pat.size() + 1) * (str.size() + 1) states regardless of how many
// wildcards the pattern holds.
class GlobSearch {
public:
    GlobSearch(const std::string& pat, const std::string& str)
        : pat_(pat), str_(str),
          visited_((pat.size() + 1) * (str.size() + 1), false) {}

    bool run() {
        push(0, 0);
        while (!work_.empty()) {
            auto [pi, si] = work_.back();
            work_.pop_back();
            if (step(pi, si)) return true;
        }
        return false;
    }

private:
    void push(size_t pi, size_t si) {
        size_t idx = pi * (str_.size() + 1) + si;
        if (visited_[idx]) return;
        visited_[idx] = true;
        work_.emplace_back(pi, si);
    }

    // Expand one state; returns true when it is an accepting state.
    bool step(size_t pi, size_t si) {
        if (pi == pat_.size()) return si == str_.size();

        if (pat_[pi] == '*' && pi + 1 < pat_.size() && pat_[pi + 1] == '*') {
            size_t rest = pi + 2;
            // Trailing '**' swallows everything left
            if (rest == pat_.size()) return true;

            if (pat_[rest] == '/') {
                // Zero directories, or resume after any later '/'
                push(rest + 1, si);
                for (size_t k = si; k < str_.size(); k++) {
                    if (str_[k] == '/') push(rest + 1, k + 1);
                }
            } else {
                for (size_t k = si; k <= str_.size(); k++) {
                    push(rest, k);
                }
            }
            return false;
        }

        if (pat_[pi] == '*') {
            // '*' consumes up to, never across, the next separator
            for (size_t k = si; k <= str_.size(); k++) {
                push(pi + 1, k);
                if (k < str_.size() && str_[k] == '/') break;
            }
            return false;
        }

        if (si == str_.size()) return false;
        if (pat_[pi] == str_[si]) push(pi + 1, si + 1);
        return false;
    }

    const std::string& pat_;
    const std::string& str_;
    std::vector<bool> visited_;
    std::vector<std::pair<size_t, size_t>> work_;
};

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path) {
    if (pattern.empty()) return path.empty();

    try {
        auto norm_pat = normalize_separators(pattern);
        auto norm_path = normalize_separators(path);

        if (norm_pat == "*" || norm_pat == "**") return true;

        return GlobSearch(norm_pat, norm_path).run();
    } catch (const std::bad_alloc&) {
        // Matching runs inside a filter loop; treat as "no match"
        return false;
    }
}

std::optional<size_t> glob_first_match(
    const std::vector<std::string>& patterns,
    const std::string& path)
{
    for (size_t i = 0; i < patterns.size(); i++) {
        if (glob_match(patterns[i], path)) return i;
    }
    return std::nullopt;
}

} // namespace crlf
