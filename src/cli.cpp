/**
 * @file cli.cpp
 * @brief ch8pack command line interface.
 *
 * Packages CHIP-8 ROM images as calculator variables and extracts ROMs
 * from such variables.
 */

#include <ch8pack/ch8pack.hpp>

#include <cstdio>
#include <cstring>
#include <string>

using namespace ch8pack;

struct CliOptions {
    std::string input;
    std::string output;
    std::string calculator;
    std::string var_name;
    std::string folder = DEFAULT_FOLDER;
    bool has_var_name = false;
    bool extract = false;
    bool quiet = false;
};

static void print_version() {
    std::printf("ch8pack %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("CHIP-8 ROM packager for TI-89, TI-92 Plus and V200 (v%s)\n", version());
    std::printf("=========================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <rom> -c <calc> [-v name] [-f folder] [-o output] [-q]\n", prog_name);
    std::printf("  %s -x <package> [-o output] [-q]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -c, --calc <calc>      Target calculator: ti89, ti92p, v200\n");
    std::printf("  -v, --var-name <name>  On-calculator variable name, clipped to 8 characters\n");
    std::printf("                         (default: ROM filename without .ch8/.rom)\n");
    std::printf("  -f, --folder <folder>  On-calculator folder, clipped to 8 characters\n");
    std::printf("                         (default: %s)\n", DEFAULT_FOLDER);
    std::printf("  -o, --output <path>    Output file; the calculator extension is appended\n");
    std::printf("                         when packaging (default: ROM path)\n");
    std::printf("  -x, --extract          Recover the ROM from a package\n");
    std::printf("  -q, --quiet            Only report errors\n");
    std::printf("  -h, --help             Show this help message\n");
    std::printf("  -V, --version          Show version information\n\n");
    std::printf("Output:\n");
    std::printf("  Package: <output>.89y | .9xy | .v2y\n");
    std::printf("  Extract: <package without extension>.ch8\n\n");
    std::printf("Examples:\n");
    std::printf("  %s pong.ch8 -c ti89             # writes pong.89y\n", prog_name);
    std::printf("  %s pong.ch8 -c v200 -f games    # writes pong.v2y\n", prog_name);
    std::printf("  %s -x pong.89y                  # writes pong.ch8\n\n", prog_name);
}

static void print_error(Error error, const std::error_code& ec, const std::string& path) {
    if (error == Error::IoError) {
        std::fprintf(stderr, "Error: %s: %s\n", path.c_str(), ec.message().c_str());
    } else if (error == Error::InvalidSize) {
        std::fprintf(stderr, "Error: %s: %s (ROM larger than %zu bytes)\n", path.c_str(),
                     error_string(error), MAX_ROM_SIZE);
    } else {
        std::fprintf(stderr, "Error: %s: %s\n", path.c_str(), error_string(error));
    }
}

static int do_pack(const CliOptions& cli) {
    PackOptions options;
    if (!parse_calculator(cli.calculator, options.calculator)) {
        std::fprintf(stderr, "Error: Unknown calculator '%s' (expected ti89, ti92p or v200)\n",
                     cli.calculator.c_str());
        return 1;
    }
    options.folder = cli.folder;
    options.name = cli.has_var_name ? cli.var_name : default_var_name(cli.input);

    const std::string output_path = package_path(cli.input, cli.output, options.calculator);

    std::error_code ec;
    PackSummary summary;
    auto result = pack_file(cli.input, output_path, options, ec, &summary);
    if (result != Error::Ok) {
        print_error(result, ec, result == Error::IoError && summary.input_read ? output_path
                                                                                : cli.input);
        return 1;
    }

    if (summary.payload_size + TRAILER_SIZE > DEVICE_LOAD_LIMIT) {
        std::fprintf(stderr,
                     "Warning: compressed ROM (%zu bytes) exceeds the interpreter's %zu byte "
                     "load limit\n",
                     summary.payload_size, DEVICE_LOAD_LIMIT - TRAILER_SIZE);
    }

    if (!cli.quiet) {
        double ratio = summary.payload_size > 0 ? static_cast<double>(summary.rom_size) /
                                                      static_cast<double>(summary.payload_size)
                                                : 0.0;
        std::printf("Input:       %s (%zu bytes)\n", cli.input.c_str(), summary.rom_size);
        std::printf("Output:      %s (%zu bytes)\n", output_path.c_str(), summary.file_size);
        std::printf("Variable:    %.8s\\%.8s (%s)\n", options.folder.c_str(),
                    options.name.c_str(), calculator_name(options.calculator));
        std::printf("Payload:     %zu bytes\n", summary.payload_size);
        std::printf("Ratio:       %.2fx\n", ratio);
        std::printf("Tokens:      %zu literals (%zu escaped), %zu back-references (%zu bytes)\n",
                    summary.stats.literals, summary.stats.escaped_literals,
                    summary.stats.back_references, summary.stats.matched_bytes);
    }

    return 0;
}

static int do_extract(const CliOptions& cli) {
    const std::string output_path = cli.output.empty() ? extracted_rom_path(cli.input)
                                                       : cli.output;

    std::error_code ec;
    HeaderInfo info;
    auto result = unpack_file(cli.input, output_path, info, ec);
    if (result != Error::Ok) {
        print_error(result, ec, cli.input);
        return 1;
    }

    if (!cli.quiet) {
        std::printf("Input:       %s (%u bytes)\n", cli.input.c_str(),
                    static_cast<unsigned>(info.file_size));
        std::printf("Output:      %s\n", output_path.c_str());
        std::printf("Variable:    %s\\%s (%s)\n", info.folder.c_str(), info.name.c_str(),
                    calculator_name(info.calculator));
        std::printf("Version:     %u.%u.%u\n", static_cast<unsigned>(info.version_major),
                    static_cast<unsigned>(info.version_minor),
                    static_cast<unsigned>(info.version_patch));
    }

    return 0;
}

static bool is_option(const char* arg, const char* short_name, const char* long_name) {
    return std::strcmp(arg, short_name) == 0 || std::strcmp(arg, long_name) == 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    CliOptions cli;
    bool has_calculator = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (is_option(arg, "-h", "--help")) {
            print_help(argv[0]);
            return 0;
        } else if (is_option(arg, "-V", "--version")) {
            print_version();
            return 0;
        } else if (is_option(arg, "-x", "--extract")) {
            cli.extract = true;
        } else if (is_option(arg, "-q", "--quiet")) {
            cli.quiet = true;
        } else if (is_option(arg, "-c", "--calc") && has_value) {
            cli.calculator = argv[++i];
            has_calculator = true;
        } else if (is_option(arg, "-v", "--var-name") && has_value) {
            cli.var_name = argv[++i];
            cli.has_var_name = true;
        } else if (is_option(arg, "-f", "--folder") && has_value) {
            cli.folder = argv[++i];
        } else if (is_option(arg, "-o", "--output") && has_value) {
            cli.output = argv[++i];
        } else if (arg[0] != '-' && cli.input.empty()) {
            cli.input = arg;
        } else {
            std::fprintf(stderr, "Error: Unexpected argument: %s\n", arg);
            std::fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
            return 1;
        }
    }

    if (cli.input.empty()) {
        std::fprintf(stderr, "Error: No input file given\n");
        return 1;
    }

    if (cli.extract) {
        return do_extract(cli);
    }

    if (!has_calculator) {
        std::fprintf(stderr, "Error: Packaging requires a target calculator (-c ti89|ti92p|v200)\n");
        return 1;
    }

    return do_pack(cli);
}
