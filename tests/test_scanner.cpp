#include <catch2/catch.hpp>
#include <crlf/scanner.hpp>
#include <crlf/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace crlf;
namespace fs = std::filesystem;

// Scratch directory tree, removed on scope exit.
struct TempTree {
    fs::path root;

    explicit TempTree(const std::string& name)
        : root(fs::temp_directory_path() / ("crlf_test_" + name)) {
        fs::remove_all(root);
        fs::create_directories(root);
    }
    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const std::string& rel, const std::string& bytes) const {
        auto p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    std::string read(const std::string& rel) const {
        std::ifstream in(root / rel, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

static ScanOptions options_for(const TempTree& tree,
                               std::vector<std::string> patterns) {
    ScanOptions opts;
    opts.root = tree.root;
    opts.patterns = std::move(patterns);
    return opts;
}

// Quiet the skipped-file warnings these tests provoke on purpose.
struct ScopedLogLevel {
    log::Level saved;
    explicit ScopedLogLevel(log::Level lvl) : saved(log::get_level()) {
        log::set_level(lvl);
    }
    ~ScopedLogLevel() { log::set_level(saved); }
};

// ---- Walking ----

TEST_CASE("walk_files filters by pattern and sorts", "[scanner]") {
    TempTree tree("walk");
    tree.write("src/b.cpp", "b\n");
    tree.write("src/a.cpp", "a\n");
    tree.write("src/sub/c.cpp", "c\n");
    tree.write("README.md", "r\n");

    auto r = walk_files(options_for(tree, {"src/*.cpp"}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].rel_path == "src/a.cpp");
    REQUIRE(r.value()[1].rel_path == "src/b.cpp");

    auto deep = walk_files(options_for(tree, {"**/*.cpp"}));
    REQUIRE(deep.value().size() == 3);
    REQUIRE(deep.value()[2].rel_path == "src/sub/c.cpp");
}

TEST_CASE("walk_files records first matching pattern", "[scanner]") {
    TempTree tree("first_pattern");
    tree.write("docs/guide.md", "g\n");
    tree.write("notes.md", "n\n");

    auto r = walk_files(options_for(tree, {"docs/**", "**/*.md"}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].rel_path == "docs/guide.md");
    REQUIRE(r.value()[0].pattern_index == 0);
    REQUIRE(r.value()[1].rel_path == "notes.md");
    REQUIRE(r.value()[1].pattern_index == 1);
}

TEST_CASE("walk_files skips hidden entries unless asked", "[scanner]") {
    TempTree tree("hidden");
    tree.write(".git/config.txt", "x\n");
    tree.write(".env.txt", "x\n");
    tree.write("plain.txt", "x\n");

    auto visible = walk_files(options_for(tree, {"**"}));
    REQUIRE(visible.value().size() == 1);
    REQUIRE(visible.value()[0].rel_path == "plain.txt");

    auto opts = options_for(tree, {"**"});
    opts.skip_hidden = false;
    auto all = walk_files(opts);
    REQUIRE(all.value().size() == 3);
}

TEST_CASE("walk_files skips symlinks by default", "[scanner]") {
    TempTree tree("symlink_default");
    TempTree outside("symlink_default_target");
    tree.write("real/a.txt", "a\n");
    outside.write("b.txt", "b\n");
    fs::create_directory_symlink(outside.root, tree.root / "ext");
    fs::create_symlink(tree.root / "real" / "a.txt", tree.root / "alias.txt");

    auto r = walk_files(options_for(tree, {"**/*.txt"}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].rel_path == "real/a.txt");
}

TEST_CASE("walk_files follows linked directories when enabled", "[scanner]") {
    TempTree tree("symlink_follow");
    TempTree outside("symlink_follow_target");
    tree.write("real/a.txt", "a\n");
    outside.write("nested/b.txt", "b\n");
    fs::create_directory_symlink(outside.root, tree.root / "ext");

    auto opts = options_for(tree, {"**/*.txt"});
    opts.follow_symlinks = true;
    auto r = walk_files(opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].rel_path == "ext/nested/b.txt");
    REQUIRE(r.value()[1].rel_path == "real/a.txt");
}

TEST_CASE("walk_files visits a directory once through a link cycle", "[scanner]") {
    TempTree tree("symlink_cycle");
    tree.write("a/x.txt", "x\r\n");
    fs::create_directory_symlink("..", tree.root / "a" / "up");

    auto opts = options_for(tree, {"**/*.txt"});
    opts.follow_symlinks = true;
    auto r = walk_files(opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].rel_path == "a/x.txt");

    auto converted = convert_files(opts, LineEnding::LF);
    REQUIRE(converted.is_ok());
    REQUIRE(converted.value().converted == std::vector<std::string>{"a/x.txt"});
    REQUIRE(tree.read("a/x.txt") == "x\n");
}

TEST_CASE("walk_files missing root is IO error", "[scanner]") {
    ScanOptions opts;
    opts.root = "/nonexistent_dir_xyz_123";
    opts.patterns = {"*"};
    auto r = walk_files(opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrlfError::IO);
}

TEST_CASE("ScanOptions from config", "[scanner]") {
    Config cfg;
    cfg.scan.max_file_size = 5;
    cfg.scan.follow_symlinks = true;
    cfg.scan.skip_hidden = false;
    cfg.scan.patterns = {"ignored"};

    auto opts = ScanOptions::from_config(cfg, "root");
    REQUIRE(opts.root == fs::path("root"));
    REQUIRE(opts.max_file_size == 5);
    REQUIRE(opts.follow_symlinks);
    REQUIRE_FALSE(opts.skip_hidden);
    REQUIRE(opts.patterns.empty());
}

// ---- File I/O ----

TEST_CASE("read_file_bytes keeps raw bytes", "[scanner]") {
    TempTree tree("read");
    tree.write("bin.dat", std::string("a\r\n\0b\r", 6));

    auto r = read_file_bytes(tree.root / "bin.dat", 100);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::string("a\r\n\0b\r", 6));
}

TEST_CASE("read_file_bytes enforces size ceiling", "[scanner]") {
    TempTree tree("read_limit");
    tree.write("big.txt", std::string(32, 'x'));

    REQUIRE(read_file_bytes(tree.root / "big.txt", 32).is_ok());

    auto r = read_file_bytes(tree.root / "big.txt", 31);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrlfError::TooLarge);
}

TEST_CASE("read_file_bytes missing file is IO error", "[scanner]") {
    auto r = read_file_bytes("/nonexistent_dir_xyz_123/file.txt", 100);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrlfError::IO);
}

TEST_CASE("write_file_bytes replaces content", "[scanner]") {
    TempTree tree("write");
    tree.write("f.txt", "old content that is longer\n");

    auto s = write_file_bytes(tree.root / "f.txt", "new\r\n");
    REQUIRE(s.is_ok());
    REQUIRE(tree.read("f.txt") == "new\r\n");
    REQUIRE_FALSE(fs::exists(tree.root / "f.txt.crlf-tmp"));
}

TEST_CASE("write_file_bytes into missing directory fails", "[scanner]") {
    auto s = write_file_bytes("/nonexistent_dir_xyz_123/f.txt", "x");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == CrlfError::IO);
}

// ---- check ----

TEST_CASE("check_files reports counts per file", "[scanner]") {
    TempTree tree("check");
    tree.write("a.txt", "a\nb\r\nc\r");
    tree.write("b.txt", "x\r\ny\r\n");
    tree.write("c.txt", "no newline");

    auto r = check_files(options_for(tree, {"*.txt"}));
    REQUIRE(r.is_ok());
    const auto& reports = r.value();
    REQUIRE(reports.size() == 3);

    REQUIRE(reports[0].path == "a.txt");
    REQUIRE(reports[0].info == LineEndingInfo::from_counts(1, 1, 1));
    REQUIRE(reports[1].info.variant == LineEnding::CRLF);
    REQUIRE(reports[1].info.crlf_count == 2);
    REQUIRE(reports[2].info.variant == LineEnding::None);
}

TEST_CASE("check_files excludes the given variant", "[scanner]") {
    TempTree tree("check_not");
    tree.write("unix.txt", "a\nb\n");
    tree.write("win.txt", "a\r\nb\r\n");
    tree.write("mixed.txt", "a\nb\r\n");

    auto r = check_files(options_for(tree, {"*.txt"}), LineEnding::LF);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].path == "mixed.txt");
    REQUIRE(r.value()[1].path == "win.txt");
}

TEST_CASE("check_files skips oversized files", "[scanner]") {
    ScopedLogLevel quiet(log::Error);
    TempTree tree("check_big");
    tree.write("small.txt", "a\n");
    tree.write("large.txt", std::string(64, '\n'));

    auto opts = options_for(tree, {"*.txt"});
    opts.max_file_size = 16;
    auto r = check_files(opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].path == "small.txt");
}

// ---- convert ----

TEST_CASE("convert_files rewrites only changed files", "[scanner]") {
    TempTree tree("convert");
    tree.write("src/mixed.c", "a\nb\r\nc\r");
    tree.write("src/unix.c", "a\nb\n");
    tree.write("src/empty.c", "");
    tree.write("other.h", "x\r\n");

    auto r = convert_files(options_for(tree, {"src/**/*.c"}), LineEnding::LF);
    REQUIRE(r.is_ok());
    const auto& s = r.value();
    REQUIRE(s.converted == std::vector<std::string>{"src/mixed.c"});
    REQUIRE(s.unchanged == std::vector<std::string>{"src/empty.c", "src/unix.c"});
    REQUIRE(s.failed.empty());

    REQUIRE(tree.read("src/mixed.c") == "a\nb\nc\n");
    REQUIRE(tree.read("src/unix.c") == "a\nb\n");
    REQUIRE(tree.read("other.h") == "x\r\n");   // not matched
}

TEST_CASE("convert_files to CRLF then check is uniform", "[scanner]") {
    TempTree tree("convert_crlf");
    tree.write("a.txt", "1\n2\r3\r\n");
    tree.write("b.txt", "1\n");

    auto opts = options_for(tree, {"*.txt"});
    REQUIRE(convert_files(opts, LineEnding::CRLF).is_ok());

    auto remaining = check_files(opts, LineEnding::CRLF);
    REQUIRE(remaining.is_ok());
    REQUIRE(remaining.value().empty());
    REQUIRE(tree.read("a.txt") == "1\r\n2\r\n3\r\n");
}

TEST_CASE("convert_files dry run writes nothing", "[scanner]") {
    TempTree tree("convert_dry");
    tree.write("a.txt", "x\r\n");

    auto r = convert_files(options_for(tree, {"*.txt"}), LineEnding::LF, true);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().converted == std::vector<std::string>{"a.txt"});
    REQUIRE(tree.read("a.txt") == "x\r\n");
}

TEST_CASE("convert_files records oversized files as failed", "[scanner]") {
    ScopedLogLevel quiet(log::Error);
    TempTree tree("convert_big");
    tree.write("big.txt", std::string(64, '\r'));
    tree.write("ok.txt", "a\r");

    auto opts = options_for(tree, {"*.txt"});
    opts.max_file_size = 8;
    auto r = convert_files(opts, LineEnding::LF);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().converted == std::vector<std::string>{"ok.txt"});
    REQUIRE(r.value().failed.size() == 1);
    REQUIRE(r.value().failed[0].path == "big.txt");
    REQUIRE(r.value().failed[0].error.code == CrlfError::TooLarge);
    REQUIRE(tree.read("big.txt") == std::string(64, '\r'));
}

TEST_CASE("convert_files rejects Mixed target", "[scanner]") {
    TempTree tree("convert_mixed");
    auto r = convert_files(options_for(tree, {"*"}), LineEnding::Mixed);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrlfError::InvalidArg);
}

// ---- Report formatting ----

TEST_CASE("format_report_line layout", "[scanner]") {
    FileReport report{"src/main.cpp", LineEndingInfo::from_counts(12, 0, 0)};
    REQUIRE(format_report_line(report) ==
            "LF: 12  | CRLF: 0   | CR: 0   | lf     | src/main.cpp");

    FileReport mixed{"a b.txt", LineEndingInfo::from_counts(1, 1234, 1)};
    REQUIRE(format_report_line(mixed) ==
            "LF: 1   | CRLF: 1234 | CR: 1   | mixed  | a b.txt");
}
