#ifndef BLUR_ARGS_HPP
#define BLUR_ARGS_HPP

#include <cstddef>
#include <string>

struct BlurOptions {
    int radius = 10;
    double sigma = 10.0;
    size_t threads = 10;
    bool sequential = false;
    bool help = false;
    std::string input;
    std::string output;
};

void printUsage();

// <dir>/<stem>_blurred_<radius>x<sigma>.<ext>; empty if input has no extension
std::string defaultOutputPath(const std::string &input, int radius, double sigma);

// Fills opts from argv. Returns false (with a message on std::cerr) on bad
// input. When --help is given opts.help is set and nothing else is checked.
bool parseArgs(int argc, const char *const *argv, BlurOptions &opts);

#endif
