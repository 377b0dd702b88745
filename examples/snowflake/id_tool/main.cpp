#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "algorithms/snowflake/snowflake_config.h"
#include "algorithms/snowflake/snowflake_generator.h"
#include "algorithms/snowflake/snowflake_id.h"
#include "database/redis/redis_sequence_resolver.h"
#include "datetime/datetime.h"
#include "json/json_reader.h"
#include "json/json_value.h"
#include "logging/logging_config.h"
#include "logging/logging_manager.h"

namespace algorithms = flakeid::algorithms;
namespace datetime = flakeid::datetime;
namespace json = flakeid::json;
namespace logging = flakeid::logging;
namespace redis = flakeid::database::redis;

namespace {

constexpr std::string_view kUsage =
    "usage: flakeid_id_tool <config.json> generate [count]\n"
    "       flakeid_id_tool <config.json> decode <id>...\n"
    "       flakeid_id_tool <config.json> parse <id>...\n";

json::JsonValue LoadRoot(const std::string& path) {
    json::JsonReader reader;
    auto root = reader.ParseFile(path);
    if (!root.has_value() || !root->IsObject()) {
        throw std::runtime_error("Unable to read config file: " + path);
    }
    return *root;
}

void InitializeLogging(const json::JsonValue& root) {
    auto logging_section = root.Get("logging");
    if (!logging_section.has_value() || !logging_section->IsObject()) {
        return;
    }
    logging::LoggingManagerInstance().LoadConfig(
        logging::LoadLoggingConfigFromJson(*logging_section));
}

algorithms::SnowflakeValue ParseIdArgument(const std::string& text) {
    std::size_t consumed = 0;
    const auto value = std::stoull(text, &consumed, 10);
    if (consumed != text.size()) {
        throw std::invalid_argument("not a numeric id: " + text);
    }
    return value;
}

int Generate(const json::JsonValue& root, const std::vector<std::string>& args) {
    // The tool runs from a shell, so is_cli defaults to true unless the config says otherwise.
    algorithms::SnowflakeConfig defaults;
    defaults.is_cli = true;
    const auto config = algorithms::LoadSnowflakeConfigFromJson(root, std::move(defaults));

    auto generator =
        algorithms::CreateSnowflakeGenerator(config, redis::CreateSequenceResolver(config.sequence));

    const auto count = args.empty() ? 1UL : std::stoul(args.front());
    for (std::size_t i = 0; i < count; ++i) {
        std::cout << generator->NextId() << '\n';
    }
    return EXIT_SUCCESS;
}

int Decode(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        const algorithms::SnowflakeId id(ParseIdArgument(arg));
        const auto created_ms = static_cast<std::int64_t>(id.Seconds()) * 1000 +
                                algorithms::SnowflakeId::kTimestampOffset * 1000 +
                                id.Milliseconds();
        std::cout << id.Numeric() << " created_at=" << std::fixed << std::setprecision(3)
                  << id.CreatedAt() << " ("
                  << datetime::DateTime::Format(datetime::DateTime::FromUnixMilliseconds(created_ms),
                                                "%Y-%m-%dT%H:%M:%SZ", "UTC")
                  << ") server_id=" << id.ServerId() << " cli=" << std::boolalpha << id.IsCli()
                  << " sequence_id=" << id.SequenceId() << '\n';
    }
    return EXIT_SUCCESS;
}

int Parse(const json::JsonValue& root, const std::vector<std::string>& args) {
    const auto config = algorithms::LoadSnowflakeConfigFromJson(root);
    for (const auto& arg : args) {
        const auto parts = algorithms::SnowflakeGenerator::ParseId(ParseIdArgument(arg),
                                                                   config.arithmetic);
        std::cout << arg << " timestamp=" << parts.timestamp
                  << " datacenter=" << parts.datacenter << " worker_id=" << parts.worker_id
                  << " cli=" << std::boolalpha << parts.is_cli
                  << " sequence=" << parts.sequence << '\n';
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << kUsage;
        return EXIT_FAILURE;
    }

    const std::string config_path = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    try {
        const auto root = LoadRoot(config_path);
        InitializeLogging(root);

        if (command == "generate") {
            return Generate(root, args);
        }
        if (command == "decode") {
            return Decode(args);
        }
        if (command == "parse") {
            return Parse(root, args);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[flakeid] " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cerr << kUsage;
    return EXIT_FAILURE;
}
