#pragma once
#include "graph.hpp"
#include <vector>
#include <string>
#include <random>
#include <optional>

enum class Algorithm { Dijkstra, AStar, Genetic, NearestNeighbor };

std::optional<Algorithm> parse_algorithm(const std::string &name);
std::string algorithm_name(Algorithm a);

struct TourResult {
    std::vector<std::string> route;
    double cost = 0.0;
    bool complete = true;   // false when not every requested stop was reached
    Algorithm algorithm = Algorithm::NearestNeighbor;
    bool fallback = false;  // requested algorithm was not a tour algorithm
    int num_stops = 0;
};

struct GAParams {
    int generations = 100;
    int population_size = 50;
    int tournament_size = 5;
    int elite_count = 5;
    double mutation_rate = 0.1;
};

TourResult nearest_neighbor_tour(const WeightedGraph &g, const std::string &start,
                                 const std::vector<std::string> &stops);

TourResult genetic_tour(const WeightedGraph &g, const std::string &start,
                        const std::vector<std::string> &stops,
                        std::mt19937 &rng, const GAParams &params = GAParams());

// std::nullopt algorithm (an unrecognised name) falls back to nearest neighbor,
// as do the single-destination algorithms.
TourResult optimize_multi_stop(const WeightedGraph &g, const std::string &start,
                               const std::vector<std::string> &stops,
                               std::optional<Algorithm> algorithm,
                               std::mt19937 &rng, const GAParams &params = GAParams());
