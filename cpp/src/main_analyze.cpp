#include "qorsense/common.hpp"
#include "qorsense/config.hpp"
#include "qorsense/errors.hpp"
#include "qorsense/logging.hpp"
#include "qorsense/preprocess.hpp"
#include "qorsense/serialization.hpp"
#include "qorsense/synthetic.hpp"
#include "qorsense/tasks.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitBadInput = 1;
constexpr int kExitInternal = 2;

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config <path>] [--sensor <id>] (--input <file|-> | --synthetic <kind>"
                 " [--length N] [--seed S])\n";
}

std::string read_input(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path);
    if (!file) {
        throw qorsense::InvalidInputError("cannot open input file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string sensor_id = "cli";
    std::optional<std::string> input_path;
    std::optional<std::string> synthetic_kind;
    std::string length_text = "1000";
    std::string seed_text = "42";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitOk;
        }
        if (!has_value) {
            print_usage(argv[0]);
            return kExitBadInput;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--sensor") {
            sensor_id = argv[++i];
        } else if (arg == "--input") {
            input_path = argv[++i];
        } else if (arg == "--synthetic") {
            synthetic_kind = argv[++i];
        } else if (arg == "--length") {
            length_text = argv[++i];
        } else if (arg == "--seed") {
            seed_text = argv[++i];
        } else {
            print_usage(argv[0]);
            return kExitBadInput;
        }
    }

    if (input_path.has_value() == synthetic_kind.has_value()) {
        print_usage(argv[0]);
        return kExitBadInput;
    }

    try {
        qorsense::EngineSettings settings;
        if (!config_path.empty()) {
            settings = qorsense::EngineSettings::from_toml(config_path);
        }
        qorsense::configure_logging(settings.logging);
        if (!config_path.empty()) {
            qorsense::get_logger("qorsense-analyze").info("config_loaded", {{"path", config_path}});
        }

        qorsense::RawSeries values;
        if (input_path) {
            values = qorsense::parse_series(read_input(*input_path));
        } else {
            const auto length = qorsense::parse_unsigned(length_text);
            const auto seed = qorsense::parse_unsigned(seed_text);
            if (!length || !seed || *length > std::numeric_limits<std::size_t>::max()) {
                throw qorsense::InvalidInputError("--length and --seed must be non-negative integers");
            }
            const auto kind = qorsense::signal_kind_from_string(*synthetic_kind);
            values = qorsense::to_raw_series(qorsense::generate_signal(kind, static_cast<std::size_t>(*length), *seed));
        }

        const auto outcome = qorsense::run_analysis_task(sensor_id, values, settings.analysis);
        std::cout << qorsense::to_json(outcome) << "\n";
        if (outcome.success) {
            return kExitOk;
        }
        return outcome.error_kind == qorsense::ErrorKind::kBadInput ? kExitBadInput : kExitInternal;
    } catch (const qorsense::AnalysisError& exc) {
        std::cerr << "qorsense-analyze error: " << exc.what() << "\n";
        return exc.kind() == qorsense::ErrorKind::kBadInput ? kExitBadInput : kExitInternal;
    } catch (const std::exception& exc) {
        std::cerr << "qorsense-analyze error: " << exc.what() << "\n";
        return kExitInternal;
    }
}
