#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <chrono>
#include "nlohmann/json.hpp"
#include "graph.hpp"
#include "config.hpp"
#include "queries.hpp"

using json = nlohmann::json;

static bool read_json(const char *path, json &out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Failed to open " << path << std::endl;
        return false;
    }
    try {
        f >> out;
    } catch (const std::exception &e) {
        std::cerr << "Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char *argv[]) {
    if (argc != 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <locations.json> <traffic.json> <queries.json> <output.json>" << std::endl;
        return 1;
    }

    json locations_json, traffic_json, queries_json;
    if (!read_json(argv[1], locations_json)) return 1;
    if (!read_json(argv[2], traffic_json)) return 1;
    if (!read_json(argv[3], queries_json)) return 1;

    GraphBuilder builder;
    Config config;
    try {
        builder.loadFromJson(locations_json, traffic_json);
        config = load_config(queries_json.contains("config") ? queries_json["config"] : json());
    } catch (const std::exception &e) {
        std::cerr << "Invalid input: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Loaded " << builder.locations().size() << " locations, "
              << builder.profile().patterns.size() << " traffic patterns" << std::endl;

    QueryProcessor processor(builder, config);

    json meta = queries_json.contains("meta") ? queries_json["meta"] : json::object();
    std::vector<json> results;
    int failed = 0;

    const json events = queries_json.contains("events") ? queries_json["events"] : json::array();
    for (const auto &query : events) {
        auto start_time = std::chrono::high_resolution_clock::now();

        json result = processor.process(query);

        auto end_time = std::chrono::high_resolution_clock::now();
        result["processing_time"] = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        if (result.contains("error")) {
            failed++;
            std::cerr << "Query " << result["id"].dump() << " failed: "
                      << result["error"].get<std::string>() << std::endl;
        }
        results.push_back(result);
    }

    std::cout << "Processed " << results.size() << " queries (" << failed << " failed)" << std::endl;

    std::ofstream output_file(argv[4]);
    if (!output_file.is_open()) {
        std::cerr << "Failed to open " << argv[4] << " for writing" << std::endl;
        return 1;
    }

    json output;
    output["meta"] = meta;
    output["results"] = results;
    output_file << output.dump(4) << std::endl;

    output_file.close();
    return 0;
}
