/**
 * @file main.cpp
 * @brief FedCore aggregation tool
 *
 * Reads a JSON list of model updates (and optionally the previous global
 * model), aggregates them with the configured strategy and writes the
 * aggregation result as JSON.
 */
#include "federated/aggregation_config.h"
#include "federated/model_protocol.h"
#include "utils/config_manager.h"
#include "utils/json.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

using namespace fedcore;

struct CliOptions {
    std::string config_path;
    std::string updates_path;
    std::string previous_path;
    std::string output_path;
    std::string snapshot_path;
    std::string method;
};

void print_usage(const char* program) {
    std::cout << "FedCore Aggregation Tool\n\n";
    std::cout << "Usage: " << program << " --updates PATH [OPTIONS]\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  --updates PATH    JSON array of model updates (required)\n";
    std::cout << "  --config PATH     key = value configuration file\n";
    std::cout << "  --previous PATH   Previous global model (JSON)\n";
    std::cout << "  --method NAME     Override aggregation.method\n";
    std::cout << "  --output PATH     Write the aggregation result here (default: stdout)\n";
    std::cout << "  --snapshot PATH   Write the new global model as a compressed snapshot\n";
    std::cout << "  --help            Show this help message\n";
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--updates" && i + 1 < argc) {
            options.updates_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--previous" && i + 1 < argc) {
            options.previous_path = argv[++i];
        } else if (arg == "--method" && i + 1 < argc) {
            options.method = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            options.output_path = argv[++i];
        } else if (arg == "--snapshot" && i + 1 < argc) {
            options.snapshot_path = argv[++i];
        } else if (arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    if (options.updates_path.empty()) {
        std::cerr << "Error: --updates must be specified" << std::endl;
        std::exit(1);
    }

    return options;
}

std::vector<ModelUpdate> load_updates(const std::string& path) {
    utils::JsonValue json = utils::JsonParser::parseFile(path);
    const utils::JsonValue& list = json.isObject() ? json["updates"] : json;

    std::vector<ModelUpdate> updates;
    for (const auto& entry : list.asArray()) {
        updates.push_back(ModelUpdate::fromJson(entry));
    }
    return updates;
}

bool write_file(const std::string& path, const std::string& contents) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: cannot write " << path << std::endl;
        return false;
    }
    file << contents;
    return static_cast<bool>(file);
}

// Sends std::cout to another stream buffer for its lifetime
class CoutRedirect {
public:
    explicit CoutRedirect(std::streambuf* target) : saved_(std::cout.rdbuf(target)) {}
    ~CoutRedirect() { std::cout.rdbuf(saved_); }

    CoutRedirect(const CoutRedirect&) = delete;
    CoutRedirect& operator=(const CoutRedirect&) = delete;

    std::streambuf* saved() const { return saved_; }

private:
    std::streambuf* saved_;
};

int main(int argc, char* argv[]) {
    CliOptions options = parse_args(argc, argv);

    // Library progress lines go to stderr; stdout carries only the result document
    CoutRedirect redirect(std::cerr.rdbuf());
    std::ostream result_out(redirect.saved());

    auto& config = utils::ConfigManager::getInstance();
    if (!options.config_path.empty() && !config.loadFromFile(options.config_path)) {
        std::cerr << "Warning: continuing with default configuration" << std::endl;
    }

    try {
        AggregationConfig aggregation_config;
        aggregation_config.loadFromConfig();
        if (!options.method.empty()) {
            aggregation_config.method = options.method;
        }

        std::vector<ModelUpdate> updates = load_updates(options.updates_path);

        std::optional<GlobalModel> previous;
        if (!options.previous_path.empty()) {
            previous = GlobalModel::fromJson(utils::JsonParser::parseFile(options.previous_path));
        }

        auto aggregator = createAggregator(aggregation_config);
        std::cerr << "[FedCore] Aggregating " << updates.size() << " updates with "
                  << aggregator->name() << std::endl;

        AggregationResult result = aggregator->aggregate(updates, previous ? &*previous : nullptr);
        std::string output = result.toJson().dump();

        if (options.output_path.empty()) {
            result_out << output << std::endl;
        } else if (!write_file(options.output_path, output)) {
            return 1;
        }

        if (result.success && !options.snapshot_path.empty()) {
            std::vector<uint8_t> snapshot = result.global_model->serialize();
            if (!write_file(options.snapshot_path, std::string(snapshot.begin(), snapshot.end()))) {
                return 1;
            }
        }

        if (!result.success) {
            std::cerr << "[FedCore] Aggregation failed: " << result.error_message << std::endl;
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
