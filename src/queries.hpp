#pragma once
#include "graph.hpp"
#include "config.hpp"
#include <random>
#include "nlohmann/json.hpp"

// Answers driver queries against one loaded GraphBuilder. Each query builds
// its own dynamic graph; the only state carried between queries is the RNG.
class QueryProcessor {
public:
    QueryProcessor(const GraphBuilder &builder, const Config &cfg);

    // Never throws for a bad query: failures come back as {"id", "error"}.
    nlohmann::json process(const nlohmann::json &query);

private:
    nlohmann::json listLocations() const;
    nlohmann::json optimizeRoute(const nlohmann::json &query);
    nlohmann::json predictTraffic(const nlohmann::json &query) const;
    nlohmann::json estimateDelivery(const nlohmann::json &query) const;

    const GraphBuilder &builder;
    Config config;
    std::mt19937 rng;
};
