#include "cli/application.hpp"

#include "codec/diagnostics.hpp"
#include "codec/errors.hpp"
#include "codec/gif.hpp"
#include "codec/gif/structure.hpp"
#include "utils/file_io.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using gifrgb::codec::lzw::DictionaryFullPolicy;

enum class Command {
    Decode,
    Encode,
    Info,
    Help
};

struct Options {
    Command command {Command::Help};
    std::filesystem::path input;
    std::filesystem::path output;
    std::size_t width {0};
    bool hasWidth {false};
    std::size_t threads {0};
    bool verbose {false};
    bool traceCodes {false};
    bool noDictionaryReset {false};
};

void printUsage()
{
    std::cout << "Usage:\n"
              << "  gifrgb decode [-v] [-l] -i <input.gif|dir> -o <output.data|dir> [-t <n>]\n"
              << "  gifrgb encode -w <width> [-r] [-v] [-l] -i <input.data> -o <output.gif>\n"
              << "  gifrgb info -i <input.gif>\n"
              << "  gifrgb help\n"
              << "\n"
              << "Options:\n"
              << "  -w, --width          Width of the raw image in pixels (1-65535).\n"
              << "  -r, --no-dict-reset  Keep the full LZW dictionary instead of resetting it.\n"
              << "                       May compress highly repetitive images better.\n"
              << "  -v, --verbose        Print statistics.\n"
              << "  -l, --log            Print every LZW code in binary.\n"
              << "  -t, --threads        Worker threads for directory decoding; 0 = all cores.\n"
              << "\n"
              << "Raw images are packed RGB triples, left to right, top to bottom, without a\n"
              << "header (the '.data' format of GIMP). Only the first image of a GIF is used.\n"
              << "Existing output files are never overwritten.\n";
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

Command parseCommand(const std::string& argument)
{
    const auto lowered = toLower(argument);
    if (lowered == "decode" || lowered == "d") {
        return Command::Decode;
    }
    if (lowered == "encode" || lowered == "e") {
        return Command::Encode;
    }
    if (lowered == "info") {
        return Command::Info;
    }
    if (lowered == "help" || lowered == "--help" || lowered == "-h") {
        return Command::Help;
    }
    throw std::invalid_argument("Unknown command: " + argument);
}

std::size_t parseCount(const std::string& value, const char* what)
{
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + value);
    }
}

Options parseOptions(int argc, char** argv)
{
    Options options {};

    if (argc < 2) {
        return options;
    }

    options.command = parseCommand(argv[1]);
    if (options.command == Command::Help) {
        return options;
    }

    for (int index = 2; index < argc; ++index) {
        const std::string argument = argv[index];

        if ((argument == "--input" || argument == "-i") && index + 1 < argc) {
            options.input = std::filesystem::path(argv[++index]);
        } else if ((argument == "--output" || argument == "-o") && index + 1 < argc) {
            options.output = std::filesystem::path(argv[++index]);
        } else if ((argument == "--width" || argument == "-w") && index + 1 < argc) {
            options.width = parseCount(argv[++index], "width");
            options.hasWidth = true;
        } else if ((argument == "--threads" || argument == "-t") && index + 1 < argc) {
            options.threads = parseCount(argv[++index], "thread count");
        } else if (argument == "--no-dict-reset" || argument == "-r") {
            options.noDictionaryReset = true;
        } else if (argument == "--verbose" || argument == "-v") {
            options.verbose = true;
        } else if (argument == "--log" || argument == "-l") {
            options.traceCodes = true;
        } else if (argument == "--help" || argument == "-h") {
            options.command = Command::Help;
            return options;
        } else {
            throw std::invalid_argument("Unrecognized argument: " + argument);
        }
    }

    if (options.input.empty()) {
        throw std::invalid_argument("Missing required -i/--input argument");
    }
    if (options.command != Command::Info && options.output.empty()) {
        throw std::invalid_argument("Missing required -o/--output argument");
    }
    if (options.command == Command::Encode && !options.hasWidth) {
        throw std::invalid_argument("-w/--width is required when encoding");
    }
    return options;
}

void requireFreshOutput(const std::filesystem::path& output)
{
    if (std::filesystem::exists(output)) {
        throw std::runtime_error("Output file already exists: " + output.string());
    }
}

void decode(const Options& options, gifrgb::codec::Diagnostics& diagnostics)
{
    if (std::filesystem::is_directory(options.input)) {
        const auto report = gifrgb::codec::gif::decodeDirectory(
            options.input, options.output, options.threads, diagnostics);

        for (const auto& failure : report.failures) {
            std::cerr << failure.relativePath.generic_string() << ": " << failure.message << "\n";
        }
        std::cout << "Decoded " << report.converted << " file(s)";
        if (!report.failures.empty()) {
            std::cout << ", " << report.failures.size() << " failed";
        }
        std::cout << "\n";

        if (!report.failures.empty()) {
            throw std::runtime_error("Some files could not be decoded");
        }
        return;
    }

    if (!std::filesystem::is_regular_file(options.input)) {
        throw std::runtime_error("Input file not found: " + options.input.string());
    }
    requireFreshOutput(options.output);
    gifrgb::codec::gif::decodeFile(options.input, options.output, diagnostics);
}

void encode(const Options& options, gifrgb::codec::Diagnostics& diagnostics)
{
    if (!std::filesystem::is_regular_file(options.input)) {
        throw std::runtime_error("Input file not found: " + options.input.string());
    }
    requireFreshOutput(options.output);

    const auto policy = options.noDictionaryReset ? DictionaryFullPolicy::Freeze : DictionaryFullPolicy::Reset;
    gifrgb::codec::gif::encodeFile(options.input, options.output, options.width, policy, diagnostics);
}

void info(const Options& options)
{
    if (!std::filesystem::is_regular_file(options.input)) {
        throw std::runtime_error("Input file not found: " + options.input.string());
    }
    gifrgb::codec::gif::printStructure(gifrgb::utils::readBinaryFile(options.input), std::cout);
}

} // namespace

namespace gifrgb::cli {

int run(int argc, char** argv)
{
    try {
        const auto startTime = std::chrono::steady_clock::now();
        const auto options = parseOptions(argc, argv);

        codec::StreamDiagnostics diagnostics(std::cout, std::cerr, codec::Verbosity {options.verbose, options.traceCodes});

        switch (options.command) {
        case Command::Help:
            printUsage();
            return 0;
        case Command::Decode:
            decode(options, diagnostics);
            break;
        case Command::Encode:
            encode(options, diagnostics);
            break;
        case Command::Info:
            info(options);
            break;
        }

        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;
        char seconds[32];
        std::snprintf(seconds, sizeof(seconds), "%.1f", elapsed.count());
        diagnostics.info(std::string("time=") + seconds);
        return 0;
    } catch (const codec::GifError& error) {
        std::cerr << "Conversion error: " << error.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace gifrgb::cli
