// tools/notation_check.cc
#include "notation/fen.hh"
#include "notation/usi.hh"

#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

using namespace notation;

static void usage(const char* argv0)
{
    std::cerr << "Usage:\n"
                 "  "
              << argv0
              << " [--fens FILE] [--usi FILE] [--promoted] [--quiet]\n"
                 "\n"
                 "Notes:\n"
                 "  Prints the canonical form of every valid line and reports invalid ones.\n"
                 "  Blank lines and text after '#' are ignored.\n"
                 "  --promoted keeps '~' markers on promoted pieces in FEN output.\n";
}

// strips comments and surrounding whitespace; false for an empty line
static bool clean_line(std::string& line)
{
    auto hash = line.find('#');
    if (hash != std::string::npos)
        line = line.substr(0, hash);

    auto l = line.find_first_not_of(" \t\r\n");
    auto r = line.find_last_not_of(" \t\r\n");
    if (l == std::string::npos)
        return false;
    line = line.substr(l, r - l + 1);
    return true;
}

struct Tally {
    int ok = 0;
    int bad = 0;
};

static bool check_fens(const std::string& path, const FenOptions& opts, bool quiet, Tally& tally)
{
    std::ifstream in(path);
    if (!in)
        return false;

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!clean_line(line))
            continue;

        auto setup = parse_fen(line);
        if (!setup) {
            std::cerr << path << ":" << lineno << ": " << fen_error_string(setup.error) << ": " << line << "\n";
            ++tally.bad;
            continue;
        }
        ++tally.ok;
        if (!quiet)
            std::cout << make_fen(*setup, opts) << "\n";
    }
    return true;
}

static bool check_usi(const std::string& path, bool quiet, Tally& tally)
{
    std::ifstream in(path);
    if (!in)
        return false;

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!clean_line(line))
            continue;

        auto move = shogi::parse_usi(line);
        if (!move) {
            std::cerr << path << ":" << lineno << ": invalid move: " << line << "\n";
            ++tally.bad;
            continue;
        }
        ++tally.ok;
        if (!quiet)
            std::cout << shogi::make_usi(*move) << "\n";
    }
    return true;
}

int main(int argc, char** argv)
{
    std::string fens_path, usi_path;
    FenOptions opts;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        if (!std::strcmp(argv[i], "--fens") && i + 1 < argc) {
            fens_path = argv[++i];
        } else if (!std::strcmp(argv[i], "--usi") && i + 1 < argc) {
            usi_path = argv[++i];
        } else if (!std::strcmp(argv[i], "--promoted")) {
            opts.promoted = true;
        } else if (!std::strcmp(argv[i], "--quiet")) {
            quiet = true;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    if (fens_path.empty() && usi_path.empty()) {
        usage(argv[0]);
        return 2;
    }

    Tally tally;
    if (!fens_path.empty() && !check_fens(fens_path, opts, quiet, tally)) {
        std::cerr << "Failed to open " << fens_path << "\n";
        return 1;
    }
    if (!usi_path.empty() && !check_usi(usi_path, quiet, tally)) {
        std::cerr << "Failed to open " << usi_path << "\n";
        return 1;
    }

    std::cerr << "checked " << (tally.ok + tally.bad) << " lines, " << tally.bad << " invalid\n";
    return tally.bad ? 1 : 0;
}
