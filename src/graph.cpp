#include "graph.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <algorithm>
using json = nlohmann::json;

static const double EARTH_RADIUS_KM = 6371.0;

// Fixed evaluation order; patterns not listed here follow in name order.
static const char *PATTERN_ORDER[] = {
    "weekday_morning_rush", "weekday_evening_rush", "night_minimal", "weekend_light"};

double WeightedGraph::weight(const std::string &u, const std::string &v) const {
    auto it = adj.find(u);
    if (it == adj.end()) return std::numeric_limits<double>::infinity();
    auto jt = it->second.find(v);
    if (jt == it->second.end()) return std::numeric_limits<double>::infinity();
    return jt->second;
}

bool TimePattern::appliesTo(const std::string &location, int hour, int day) const {
    if (hours && !hours->count(hour)) return false;
    if (days && !days->count(day)) return false;
    if (areas && !areas->count(location)) return false;
    return true;
}

static double read_multiplier(const json &v, const std::string &what) {
    if (!v.is_number())
        throw std::invalid_argument("multiplier for " + what + " is not a number");
    double m = v.get<double>();
    if (!std::isfinite(m) || m < 0)
        throw std::invalid_argument("multiplier for " + what + " must be finite and >= 0");
    return m;
}

static TimePattern read_pattern(const std::string &name, const json &jp) {
    TimePattern p;
    p.name = name;
    p.multiplier = read_multiplier(jp.at("multiplier"), "pattern " + name);
    if (jp.contains("hours")) {
        std::set<int> hs;
        for (const auto &h : jp["hours"]) hs.insert(h.get<int>());
        p.hours = hs;
    }
    if (jp.contains("days")) {
        std::set<int> ds;
        for (const auto &d : jp["days"]) ds.insert(d.get<int>());
        p.days = ds;
    }
    if (jp.contains("affected_areas")) {
        std::set<std::string> as;
        for (const auto &a : jp["affected_areas"]) as.insert(a.get<std::string>());
        p.areas = as;
    }
    return p;
}

void TrafficProfile::loadFromJson(const json &j) {
    area_base.clear();
    patterns.clear();
    weather.clear();

    if (j.contains("area_base_traffic"))
        for (auto &[name, m] : j["area_base_traffic"].items())
            area_base[name] = read_multiplier(m, "area " + name);

    if (j.contains("traffic_patterns")) {
        const auto &jpats = j["traffic_patterns"];
        std::set<std::string> seen;
        for (const char *name : PATTERN_ORDER) {
            if (!jpats.contains(name)) continue;
            patterns.push_back(read_pattern(name, jpats[name]));
            seen.insert(name);
        }
        // json objects iterate in key order
        for (auto &[name, jp] : jpats.items()) {
            if (seen.count(name)) continue;
            patterns.push_back(read_pattern(name, jp));
        }
    }

    if (j.contains("weather_impact"))
        for (auto &[name, m] : j["weather_impact"].items())
            weather[name] = read_multiplier(m, "weather " + name);
}

double haversine_km(double lat1, double lon1, double lat2, double lon2) {
    const double rad = std::acos(-1.0) / 180.0;
    double dlat = (lat2 - lat1) * rad;
    double dlon = (lon2 - lon1) * rad;
    double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(lat1 * rad) * std::cos(lat2 * rad) *
               std::sin(dlon / 2) * std::sin(dlon / 2);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return EARTH_RADIUS_KM * c;
}

static Location read_location(const std::string &name, const json &jl) {
    Location loc;
    loc.name = name;
    if (loc.name.empty())
        throw std::invalid_argument("location with empty name");
    const json &jlon = jl.contains("lng") ? jl.at("lng") : jl.at("lon");
    loc.lat = jl.at("lat").get<double>();
    loc.lon = jlon.get<double>();
    loc.type = jl.value("type", "");
    loc.area_type = jl.value("area_type", "");

    if (!std::isfinite(loc.lat) || loc.lat < -90.0 || loc.lat > 90.0)
        throw std::invalid_argument("location " + name + ": latitude out of range");
    if (!std::isfinite(loc.lon) || loc.lon < -180.0 || loc.lon > 180.0)
        throw std::invalid_argument("location " + name + ": longitude out of range");
    return loc;
}

// Accepts either {"Name": {lat, lng, ...}, ...} or [{"name": ..., lat, lng, ...}, ...]
std::vector<Location> load_locations(const json &j) {
    std::vector<Location> out;
    std::set<std::string> names;

    auto add = [&](Location loc) {
        if (!names.insert(loc.name).second)
            throw std::invalid_argument("duplicate location " + loc.name);
        out.push_back(std::move(loc));
    };

    if (j.is_array()) {
        for (const auto &jl : j) add(read_location(jl.at("name").get<std::string>(), jl));
    } else if (j.is_object()) {
        for (auto &[name, jl] : j.items()) add(read_location(name, jl));
    } else {
        throw std::invalid_argument("locations must be a JSON object or array");
    }
    return out;
}

WeightedGraph build_static_graph(const std::vector<Location> &locations) {
    WeightedGraph g;
    g.adj.reserve(locations.size());
    for (const auto &a : locations) {
        auto &row = g.adj[a.name];
        row.reserve(locations.size());
        for (const auto &b : locations) {
            if (a.name == b.name) continue;
            row[b.name] = haversine_km(a.lat, a.lon, b.lat, b.lon);
        }
    }
    return g;
}

double traffic_multiplier(const TrafficProfile &profile, const std::string &location,
                          int hour, int day, const std::string &weather) {
    double base = 1.0;
    auto bit = profile.area_base.find(location);
    if (bit != profile.area_base.end()) base = bit->second;

    double multiplier = 1.0;
    for (const auto &p : profile.patterns)
        if (p.appliesTo(location, hour, day)) multiplier *= p.multiplier;

    double weather_mult = 1.0;
    auto wit = profile.weather.find(weather);
    if (wit != profile.weather.end()) weather_mult = wit->second;

    return base * multiplier * weather_mult;
}

WeightedGraph dynamic_graph(const WeightedGraph &static_graph, const TrafficProfile &profile,
                            int hour, int day, const std::string &weather) {
    WeightedGraph g;
    g.adj.reserve(static_graph.adj.size());
    for (const auto &[u, row] : static_graph.adj) {
        double m = traffic_multiplier(profile, u, hour, day, weather);
        auto &out = g.adj[u];
        out.reserve(row.size());
        for (const auto &[v, d] : row) out[v] = d * m;
    }
    return g;
}

void GraphBuilder::loadFromJson(const json &locations, const json &traffic_json) {
    // build into temporaries so a failed load leaves the builder untouched
    auto new_locs = load_locations(locations);
    TrafficProfile new_profile;
    new_profile.loadFromJson(traffic_json);

    locs = std::move(new_locs);
    traffic = std::move(new_profile);
    index.clear();
    for (size_t i = 0; i < locs.size(); i++) index[locs[i].name] = i;
    static_graph = build_static_graph(locs);
}

WeightedGraph GraphBuilder::dynamicGraph(int hour, int day, const std::string &weather) const {
    return dynamic_graph(static_graph, traffic, hour, day, weather);
}

double GraphBuilder::trafficMultiplier(const std::string &location, int hour, int day,
                                       const std::string &weather) const {
    if (!hasLocation(location))
        throw std::invalid_argument("unknown location: " + location);
    return traffic_multiplier(traffic, location, hour, day, weather);
}

const Location &GraphBuilder::location(const std::string &name) const {
    auto it = index.find(name);
    if (it == index.end())
        throw std::invalid_argument("unknown location: " + name);
    return locs[it->second];
}

std::pair<double, double> GraphBuilder::coords(const std::string &name) const {
    const Location &l = location(name);
    return {l.lat, l.lon};
}

std::unordered_map<std::string, std::pair<double, double>> GraphBuilder::coordinateTable() const {
    std::unordered_map<std::string, std::pair<double, double>> out;
    out.reserve(locs.size());
    for (const auto &l : locs) out[l.name] = {l.lat, l.lon};
    return out;
}

std::vector<std::string> GraphBuilder::locationNames() const {
    std::vector<std::string> out;
    out.reserve(locs.size());
    for (const auto &l : locs) out.push_back(l.name);
    return out;
}
