// crlf: report and normalize line endings across a file tree.
//
//     crlf check "src/**/*.cpp"          # one report line per file
//     crlf not unix "**/*.txt"           # only files that are not LF
//     crlf convert lf "**/*.md"          # rewrite to LF in place

#include <crlf/cli.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return crlf::run_cli(args, std::cout, std::cerr);
}
