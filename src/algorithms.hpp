#pragma once
#include "graph.hpp"
#include <vector>
#include <string>
#include <unordered_map>
#include <utility>

// possible == false means no path: empty path, infinite cost.
struct SPResult {
    bool possible;
    double cost;
    std::vector<std::string> path;
};

using CoordTable = std::unordered_map<std::string, std::pair<double, double>>;

SPResult dijkstra(const WeightedGraph &g, const std::string &source, const std::string &target);

// Heuristic is coordinate distance * 111 km/degree. It is a lower bound on
// untrafficked distance only; with multipliers < 1.0 the result may be
// suboptimal.
SPResult astar(const WeightedGraph &g, const CoordTable &coords,
               const std::string &source, const std::string &target);

double route_cost(const WeightedGraph &g, const std::vector<std::string> &route);
