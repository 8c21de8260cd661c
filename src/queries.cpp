#include "queries.hpp"
#include "algorithms.hpp"
#include "estimator.hpp"
#include "tour.hpp"
#include <cmath>
#include <ctime>
#include <stdexcept>
using json = nlohmann::json;

static json rounded(double x, double scale) {
    if (!std::isfinite(x)) return nullptr;
    return std::round(x * scale) / scale;
}

static std::tm local_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

// hour 0-23, day 0-6 with 0 = Monday; missing values default to local time
static void read_time_context(const json &q, int &hour, int &day) {
    std::tm now = local_now();
    hour = q.value("hour", now.tm_hour);
    day = q.value("day", (now.tm_wday + 6) % 7);
    if (hour < 0 || hour > 23) throw std::invalid_argument("hour must be in 0-23");
    if (day < 0 || day > 6) throw std::invalid_argument("day must be in 0-6");
}

QueryProcessor::QueryProcessor(const GraphBuilder &b, const Config &cfg)
    : builder(b), config(cfg), rng(cfg.seed ? *cfg.seed : std::random_device{}()) {}

json QueryProcessor::process(const json &query) {
    json result;
    result["id"] = query.contains("id") ? query["id"] : json();

    try {
        std::string type = query.at("type");
        if (type == "locations") {
            result.update(listLocations());
        } else if (type == "optimize_route") {
            result.update(optimizeRoute(query));
        } else if (type == "predict_traffic") {
            result.update(predictTraffic(query));
        } else if (type == "estimate_delivery") {
            result.update(estimateDelivery(query));
        } else {
            result["error"] = "unknown query type: " + type;
        }
    } catch (const std::exception &e) {
        result["error"] = e.what();
    }

    return result;
}

json QueryProcessor::listLocations() const {
    json out;
    out["locations"] = json::array();
    for (const auto &l : builder.locations()) {
        out["locations"].push_back({
            {"name", l.name},
            {"lat", l.lat},
            {"lng", l.lon},
            {"type", l.type},
            {"area_type", l.area_type}
        });
    }
    return out;
}

json QueryProcessor::optimizeRoute(const json &q) {
    std::string start = q.value("start", config.default_start);
    std::string algo_name = q.value("algorithm", std::string("genetic"));
    std::string weather = q.value("weather", config.default_weather);
    std::vector<std::string> stops;
    if (q.contains("stops"))
        for (const auto &s : q["stops"]) stops.push_back(s.get<std::string>());
    int hour, day;
    read_time_context(q, hour, day);

    WeightedGraph g = builder.dynamicGraph(hour, day, weather);
    std::optional<Algorithm> algorithm = parse_algorithm(algo_name);

    std::vector<std::string> route;
    double distance;
    double minutes;
    bool complete = true;
    std::string used;

    if (!stops.empty()) {
        TourResult r = optimize_multi_stop(g, start, stops, algorithm, rng, config.ga);
        route = r.route;
        distance = r.cost;
        complete = r.complete;
        used = algorithm_name(r.algorithm);
        minutes = estimate_delivery_minutes(distance, (int)stops.size());
    } else {
        // null or empty end counts as missing
        if (!q.contains("end") || q["end"].is_null() ||
            (q["end"].is_string() && q["end"].get<std::string>().empty()))
            throw std::invalid_argument("Either end or stops must be provided");
        std::string end = q["end"];

        SPResult r;
        if (algorithm == Algorithm::AStar) {
            r = astar(g, builder.coordinateTable(), start, end);
            used = "a_star";
        } else {
            r = dijkstra(g, start, end);
            used = "dijkstra";
        }
        route = r.path;
        distance = r.cost;
        minutes = estimate_delivery_minutes(distance, 1);
    }

    json out;
    out["success"] = true;
    out["possible"] = std::isfinite(distance);
    out["route"] = route;
    json coords = json::array();
    for (const auto &name : route) {
        auto [lat, lon] = builder.coords(name);
        coords.push_back({lat, lon});
    }
    out["route_coords"] = coords;
    out["distance"] = rounded(distance, 100.0);
    out["estimated_time_minutes"] = rounded(minutes, 10.0);
    out["algorithm"] = algo_name;
    out["algorithm_used"] = used;
    out["complete"] = complete;
    if (!complete) out["note"] = "route does not include all requested stops";
    out["traffic_conditions"] = {{"hour", hour}, {"day", day}, {"weather", weather}};
    return out;
}

json QueryProcessor::predictTraffic(const json &q) const {
    if (!q.contains("location"))
        throw std::invalid_argument("Location is required");
    std::string location = q["location"];
    std::string weather = q.value("weather", config.default_weather);
    int hour, day;
    read_time_context(q, hour, day);

    double m = builder.trafficMultiplier(location, hour, day, weather);

    json out;
    out["success"] = true;
    out["location"] = location;
    out["traffic_multiplier"] = rounded(m, 100.0);
    out["traffic_level"] = traffic_level(m);
    out["conditions"] = {{"hour", hour}, {"day", day}, {"weather", weather}};
    return out;
}

json QueryProcessor::estimateDelivery(const json &q) const {
    if (!q.contains("distance_km"))
        throw std::invalid_argument("distance_km is required");
    double distance = q["distance_km"];
    int num_stops = q.value("num_stops", 1);

    double minutes = estimate_delivery_minutes(distance, num_stops);

    json out;
    out["success"] = true;
    out["estimated_time_minutes"] = rounded(minutes, 10.0);
    out["estimated_time_hours"] = rounded(minutes / 60.0, 100.0);
    out["parameters"] = {
        {"distance_km", distance},
        {"num_stops", num_stops},
        {"package_size", q.value("package_size", std::string("medium"))},
        {"weather", q.value("weather", config.default_weather)}
    };
    return out;
}
