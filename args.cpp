#include "args.hpp"

#include <charconv>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

void printUsage() {
    std::cout <<
        "Usage: blur [--radius|-r <radius>] [--sigma|-s <sigma>] [--threads|-t <n_threads>]\n"
        "            [--sequential] <source> [<destination>] [--help|-h]\n\n"
        "   <source>            Path to original image.\n"
        "   <destination>       Path of the blurred image. Default is\n"
        "                       <source>_blurred_<radius>x<sigma>.\n\n"
        "   -r, --radius        Blur radius, 0..255. Default is 10px.\n"
        "   -s, --sigma         Gaussian blur standard deviation. Default is 10.\n"
        "   -t, --threads       Number of thread workers. Default is 10.\n"
        "   --sequential        Blur on the calling thread only.\n"
        "   -h, --help          Prints this help.\n";
}

std::string defaultOutputPath(const std::string &input, int radius, double sigma) {
    std::filesystem::path in(input);
    if (!in.has_extension() || !in.has_stem()) return std::string();

    // shortest text that round-trips: 10, 1.5, 1234567
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), sigma);
    std::string sigmaText(buf, res.ptr);

    std::string name = in.stem().string() + "_blurred_" + std::to_string(radius) +
                       "x" + sigmaText + in.extension().string();

    std::filesystem::path out = in;
    out.replace_filename(name);
    return out.string();
}

// ---- value parsers: whole string must be consumed ----

static bool parseLong(const char *flag, const char *text, long &value) {
    try {
        size_t used = 0;
        value = std::stol(text, &used);
        if (used == std::strlen(text)) return true;
    } catch (const std::exception &) {
    }
    std::cerr << "Expected a number after " << flag << ", got '" << text << "'\n";
    return false;
}

static bool parseDouble(const char *flag, const char *text, double &value) {
    try {
        size_t used = 0;
        value = std::stod(text, &used);
        if (used == std::strlen(text)) return true;
    } catch (const std::exception &) {
    }
    std::cerr << "Expected a float after " << flag << ", got '" << text << "'\n";
    return false;
}

static bool is(const char *arg, const char *lng, const char *shrt) {
    return !std::strcmp(arg, lng) || !std::strcmp(arg, shrt);
}

bool parseArgs(int argc, const char *const *argv, BlurOptions &opts) {
    if (argc > 9) {
        std::cerr << "Too many arguments\n";
        return false;
    }

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];

        if (is(arg, "--help", "-h")) {
            opts.help = true;
            return true;
        }

        if (is(arg, "--radius", "-r") || is(arg, "--sigma", "-s") ||
            is(arg, "--threads", "-t")) {
            if (i + 1 >= argc) {
                std::cerr << "Expected a value after " << arg << "\n";
                return false;
            }
            const char *val = argv[++i];

            if (is(arg, "--radius", "-r")) {
                long r = 0;
                if (!parseLong(arg, val, r)) return false;
                if (r < 0 || r > 255) {
                    std::cerr << "Radius must be in [0;255], got " << r << "\n";
                    return false;
                }
                opts.radius = static_cast<int>(r);
            } else if (is(arg, "--sigma", "-s")) {
                double s = 0.0;
                if (!parseDouble(arg, val, s)) return false;
                if (!(s > 0.0)) {
                    std::cerr << "Sigma must be positive, got " << s << "\n";
                    return false;
                }
                opts.sigma = s;
            } else {
                long t = 0;
                if (!parseLong(arg, val, t)) return false;
                if (t < 1) {
                    std::cerr << "Threads must be at least 1, got " << t << "\n";
                    return false;
                }
                opts.threads = static_cast<size_t>(t);
            }
        } else if (!std::strcmp(arg, "--sequential")) {
            opts.sequential = true;
        } else if (positional == 0) {
            opts.input = arg;
            ++positional;
        } else if (positional == 1) {
            opts.output = arg;
            ++positional;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }

    if (opts.input.empty()) {
        std::cerr << "Expected an original image\n";
        return false;
    }

    if (opts.output.empty()) {
        opts.output = defaultOutputPath(opts.input, opts.radius, opts.sigma);
        if (opts.output.empty()) {
            std::cerr << "Cannot derive output name from " << opts.input
                      << " (no extension), pass <destination>\n";
            return false;
        }
    }
    return true;
}
