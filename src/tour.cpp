#include "tour.hpp"
#include "algorithms.hpp"
#include "ga_ops.hpp"
#include <cmath>
#include <limits>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
using namespace std;

static const double INF = numeric_limits<double>::infinity();

optional<Algorithm> parse_algorithm(const string &name) {
    if (name == "dijkstra") return Algorithm::Dijkstra;
    if (name == "a_star") return Algorithm::AStar;
    if (name == "genetic") return Algorithm::Genetic;
    if (name == "nearest_neighbor") return Algorithm::NearestNeighbor;
    return nullopt;
}

string algorithm_name(Algorithm a) {
    switch (a) {
    case Algorithm::Dijkstra: return "dijkstra";
    case Algorithm::AStar: return "a_star";
    case Algorithm::Genetic: return "genetic";
    case Algorithm::NearestNeighbor: return "nearest_neighbor";
    }
    return "";
}

static void require_stops(const WeightedGraph &g, const string &start, const vector<string> &stops) {
    if (!g.contains(start)) throw invalid_argument("unknown location: " + start);
    for (const auto &s : stops)
        if (!g.contains(s)) throw invalid_argument("unknown location: " + s);
}

// first occurrence of each stop, request order kept
static vector<string> unique_stops(const vector<string> &stops) {
    vector<string> out;
    unordered_set<string> seen;
    for (const auto &s : stops)
        if (seen.insert(s).second) out.push_back(s);
    return out;
}

static TourResult trivial_tour(const string &start, Algorithm a) {
    TourResult r;
    r.route = {start};
    r.cost = 0.0;
    r.algorithm = a;
    return r;
}

TourResult nearest_neighbor_tour(const WeightedGraph &g, const string &start,
                                 const vector<string> &stops) {
    require_stops(g, start, stops);
    if (stops.empty()) return trivial_tour(start, Algorithm::NearestNeighbor);

    // ties go to the earliest requested
    vector<string> remaining = unique_stops(stops);

    TourResult res;
    res.algorithm = Algorithm::NearestNeighbor;
    res.num_stops = (int)stops.size();
    res.route = {start};
    res.cost = 0.0;
    string current = start;

    while (!remaining.empty()) {
        double best = INF;
        int best_idx = -1;
        for (int i = 0; i < (int)remaining.size(); i++) {
            double d = g.weight(current, remaining[i]);
            if (d < best) {
                best = d;
                best_idx = i;
            }
        }

        // nothing reachable from here: return what we have
        if (best_idx == -1) {
            res.complete = false;
            break;
        }

        current = remaining[best_idx];
        res.route.push_back(current);
        res.cost += best;
        remaining.erase(remaining.begin() + best_idx);
    }

    double back = g.weight(current, start);
    if (back != INF) {
        res.route.push_back(start);
        res.cost += back;
    }
    return res;
}

static double fitness(const WeightedGraph &g, const Tour &t) {
    double d = route_cost(g, t);
    return d == INF ? 0.0 : 1.0 / (d + 1.0);
}

static Tour random_individual(const string &start, const vector<string> &stops, mt19937 &rng) {
    Tour t;
    t.reserve(stops.size() + 2);
    t.push_back(start);
    t.insert(t.end(), stops.begin(), stops.end());
    t.push_back(start);
    shuffle(t.begin() + 1, t.end() - 1, rng);
    return t;
}

TourResult genetic_tour(const WeightedGraph &g, const string &start, const vector<string> &stops,
                        mt19937 &rng, const GAParams &params) {
    if (params.generations < 0)
        throw invalid_argument("generations must be >= 0");
    if (params.population_size < 1)
        throw invalid_argument("population_size must be >= 1");
    require_stops(g, start, stops);
    if (stops.empty()) return trivial_tour(start, Algorithm::Genetic);

    vector<string> genes = unique_stops(stops);
    int n = params.population_size;
    vector<Tour> population;
    population.reserve(n);
    for (int i = 0; i < n; i++) population.push_back(random_individual(start, genes, rng));

    vector<double> fit(n);
    auto evaluate = [&]() {
        for (int i = 0; i < n; i++) fit[i] = fitness(g, population[i]);
    };

    for (int gen = 0; gen < params.generations; gen++) {
        evaluate();

        population = next_generation(population, fit, params, rng);
    }

    evaluate();
    int best = (int)(max_element(fit.begin(), fit.end()) - fit.begin());

    TourResult res;
    res.algorithm = Algorithm::Genetic;
    res.num_stops = (int)stops.size();
    res.route = population[best];
    res.cost = route_cost(g, res.route);
    return res;
}

TourResult optimize_multi_stop(const WeightedGraph &g, const string &start,
                               const vector<string> &stops, optional<Algorithm> algorithm,
                               mt19937 &rng, const GAParams &params) {
    TourResult res;
    bool fallback = false;

    if (!algorithm) {
        fallback = true;
        res = nearest_neighbor_tour(g, start, stops);
    } else {
        switch (*algorithm) {
        case Algorithm::Genetic:
            res = genetic_tour(g, start, stops, rng, params);
            break;
        case Algorithm::NearestNeighbor:
            res = nearest_neighbor_tour(g, start, stops);
            break;
        case Algorithm::Dijkstra:
        case Algorithm::AStar:
            fallback = true;
            res = nearest_neighbor_tour(g, start, stops);
            break;
        }
    }

    res.fallback = fallback;
    res.num_stops = (int)stops.size();
    return res;
}
