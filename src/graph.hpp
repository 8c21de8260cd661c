#pragma once
#include <vector>
#include <string>
#include <optional>
#include <set>
#include <map>
#include <unordered_map>
#include <utility>
#include "nlohmann/json.hpp"

struct Location {
    std::string name;
    double lat, lon;
    std::string type;      // category tag (warehouse, residential, ...)
    std::string area_type; // area classification
};

// name -> (name -> weight). Static graphs hold km, dynamic graphs hold
// traffic-adjusted km.
struct WeightedGraph {
    std::unordered_map<std::string, std::unordered_map<std::string, double>> adj;

    bool contains(const std::string &name) const { return adj.count(name) > 0; }
    // +inf when there is no such edge
    double weight(const std::string &u, const std::string &v) const;
};

struct TimePattern {
    std::string name;
    std::optional<std::set<int>> hours;
    std::optional<std::set<int>> days;
    std::optional<std::set<std::string>> areas;
    double multiplier = 1.0;

    bool appliesTo(const std::string &location, int hour, int day) const;
};

struct TrafficProfile {
    std::unordered_map<std::string, double> area_base;
    std::vector<TimePattern> patterns;
    std::unordered_map<std::string, double> weather;

    void loadFromJson(const nlohmann::json &j);
};

double haversine_km(double lat1, double lon1, double lat2, double lon2);

std::vector<Location> load_locations(const nlohmann::json &j);

WeightedGraph build_static_graph(const std::vector<Location> &locations);

double traffic_multiplier(const TrafficProfile &profile, const std::string &location,
                          int hour, int day, const std::string &weather);

WeightedGraph dynamic_graph(const WeightedGraph &static_graph, const TrafficProfile &profile,
                            int hour, int day, const std::string &weather);

class GraphBuilder {
public:
    void loadFromJson(const nlohmann::json &locations, const nlohmann::json &traffic);

    const WeightedGraph &staticGraph() const { return static_graph; }
    const TrafficProfile &profile() const { return traffic; }
    const std::vector<Location> &locations() const { return locs; }

    WeightedGraph dynamicGraph(int hour, int day, const std::string &weather) const;
    double trafficMultiplier(const std::string &location, int hour, int day,
                             const std::string &weather) const;

    bool hasLocation(const std::string &name) const { return index.count(name) > 0; }
    const Location &location(const std::string &name) const;
    std::pair<double, double> coords(const std::string &name) const;
    std::unordered_map<std::string, std::pair<double, double>> coordinateTable() const;
    std::vector<std::string> locationNames() const;

private:
    std::vector<Location> locs;
    std::unordered_map<std::string, size_t> index;
    TrafficProfile traffic;
    WeightedGraph static_graph;
};
