/**
 * FixTree Verification Tool
 *
 * Quantize a dataset, rebuild a trained tree model in fixed point and check
 * that it predicts exactly like the floating model on quantized inputs.
 *
 * Usage:
 *   fixtree-verify --train train.csv --test test.csv --model forest.txt --bits 8
 *
 * Exit codes: 0 variants agree, 1 variants disagree, 2 usage or input error
 */

#include "fixtree/fixtree.hpp"
#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace fixtree;

namespace {

constexpr int EXIT_AGREE = 0;
constexpr int EXIT_DISAGREE = 1;
constexpr int EXIT_ERROR = 2;

void print_usage(const char* prog) {
    std::cout << "FixTree Verification Tool v" << Version::string << "\n\n";
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --train <path>            Training CSV (target in last column)\n";
    std::cout << "  --test <path>             Test CSV (target in last column)\n";
    std::cout << "  --model <path>            Model dump of the floating reference\n";
    std::cout << "  --quantized-model <path>  Model dump trained on quantized codes (optional)\n";
    std::cout << "  --header                  CSV files start with a header line\n";
    std::cout << "  --bits, -b <n>            Bits per feature code (default: 8)\n";
    std::cout << "  --output, -o <dir>        Artifact directory (default: ., empty = none)\n";
    std::cout << "  --name <name>             Run name (default: run)\n";
    std::cout << "  --threads <n>             Worker threads (default: -1 = all)\n";
    std::cout << "  --verbosity <n>           0 silent, 1 progress, 2 debug (default: 1)\n";
    std::cout << "  --version                 Print library info\n";
    std::cout << "  --help, -h                Show this help\n";
}

struct VerifyArgs {
    std::string train_path;
    std::string test_path;
    std::string model_path;
    std::string quantized_model_path;
    bool has_header = false;
    Config config = Config::hardware_default();
};

// Next argument as the value of option argv[i]
bool take_value(int argc, char** argv, int& i, std::string& out) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << argv[i] << " needs a value\n";
        return false;
    }
    out = argv[++i];
    return true;
}

bool parse_int(const std::string& text, const char* option, int32_t& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        out = value;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << option << " expects an integer, got '" << text << "'\n";
        return false;
    }
}

// false on --help, --version or a malformed command line
bool parse_args(int argc, char** argv, VerifyArgs& args, bool& usage_error) {
    usage_error = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--version") {
            print_info();
            return false;
        } else if (arg == "--header") {
            args.has_header = true;
        } else if (arg == "--train" || arg == "--test" || arg == "--model" ||
                   arg == "--quantized-model" || arg == "--output" || arg == "-o" ||
                   arg == "--name") {
            if (!take_value(argc, argv, i, value)) {
                usage_error = true;
                return false;
            }
            if (arg == "--train") args.train_path = value;
            else if (arg == "--test") args.test_path = value;
            else if (arg == "--model") args.model_path = value;
            else if (arg == "--quantized-model") args.quantized_model_path = value;
            else if (arg == "--name") args.config.run_name = value;
            else args.config.output_dir = value;
        } else if (arg == "--bits" || arg == "-b" || arg == "--threads" || arg == "--verbosity") {
            int32_t number = 0;
            if (!take_value(argc, argv, i, value) || !parse_int(value, arg.c_str(), number)) {
                usage_error = true;
                return false;
            }
            if (arg == "--threads") args.config.device.n_threads = number;
            else if (arg == "--verbosity") args.config.verbosity = number;
            else if (number < 0) {
                std::cerr << "Error: --bits must be positive\n";
                usage_error = true;
                return false;
            } else {
                args.config.quantization.bit_width = static_cast<uint32_t>(number);
            }
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            usage_error = true;
            return false;
        }
    }

    if (args.train_path.empty() || args.test_path.empty() || args.model_path.empty()) {
        std::cerr << "Error: --train, --test and --model are required\n";
        usage_error = true;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    VerifyArgs args;
    bool usage_error = false;

    if (!parse_args(argc, argv, args, usage_error)) {
        if (usage_error) {
            std::cerr << "Run '" << argv[0] << " --help' for usage\n";
            return EXIT_ERROR;
        }
        return EXIT_AGREE;
    }

    RunResult result;
    try {
        args.config.validate();

        Dataset dataset = Dataset::from_csv(args.train_path, args.test_path, args.has_header);
        ModelDump reference = ModelDump::load(args.model_path);
        ModelDump quantized;
        if (!args.quantized_model_path.empty()) {
            quantized = ModelDump::load(args.quantized_model_path);
        }

        Pipeline pipeline(args.config);
        result = pipeline.evaluate(dataset, reference,
                                   args.quantized_model_path.empty() ? nullptr : &quantized);
        pipeline.write_artifacts(result);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (!result.predictions.empty()) {
            // Artifacts failed, the comparison itself completed
            std::cerr << "Verdict: " << (result.accepted ? "equivalent" : "NOT equivalent") << "\n";
        }
        return EXIT_ERROR;
    }

    if (args.config.verbosity > 0) {
        result.report.write_summary(std::cout);
    }
    std::printf("%s: %s vs %s\n", result.accepted ? "EQUIVALENT" : "NOT EQUIVALENT",
                VARIANT_REFERENCE_QUANTIZED, VARIANT_FIXED_POINT);
    return result.accepted ? EXIT_AGREE : EXIT_DISAGREE;
}
