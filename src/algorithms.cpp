#include "algorithms.hpp"
#include <queue>
#include <cmath>
#include <limits>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
using namespace std;

static const double INF = numeric_limits<double>::infinity();
static const double KM_PER_DEGREE = 111.0;

static void require_nodes(const WeightedGraph &g, const string &source, const string &target) {
    if (!g.contains(source)) throw invalid_argument("unknown location: " + source);
    if (!g.contains(target)) throw invalid_argument("unknown location: " + target);
}

static SPResult no_path() {
    return SPResult{false, INF, {}};
}

static vector<string> reconstruct(const unordered_map<string, string> &parent,
                                  const string &source, const string &target) {
    vector<string> path;
    for (string cur = target;;) {
        path.push_back(cur);
        if (cur == source) break;
        cur = parent.at(cur);
    }
    reverse(path.begin(), path.end());
    return path;
}

SPResult dijkstra(const WeightedGraph &g, const string &source, const string &target) {
    require_nodes(g, source, target);
    if (source == target) return SPResult{true, 0.0, {source}};

    unordered_map<string, double> dist;
    unordered_map<string, string> parent;
    unordered_set<string> visited;
    for (auto &[id, _] : g.adj) dist[id] = INF;
    dist[source] = 0.0;

    using P = pair<double, string>;
    priority_queue<P, vector<P>, greater<P>> pq;
    pq.push({0.0, source});

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();
        if (visited.count(u)) continue;
        visited.insert(u);
        if (u == target) break;
        if (!g.contains(u)) continue;

        for (const auto &[v, w] : g.adj.at(u)) {
            // edges may point at names with no row of their own
            auto it = dist.find(v);
            double cur = it == dist.end() ? INF : it->second;
            if (d + w < cur) {
                dist[v] = d + w;
                parent[v] = u;
                pq.push({d + w, v});
            }
        }
    }

    if (dist[target] == INF) return no_path();

    return SPResult{true, dist[target], reconstruct(parent, source, target)};
}

static double heuristic(const CoordTable &coords, const string &current, const string &target) {
    auto a = coords.find(current);
    auto b = coords.find(target);
    if (a == coords.end() || b == coords.end()) return 0.0;

    double dlat = a->second.first - b->second.first;
    double dlon = a->second.second - b->second.second;
    return sqrt(dlat * dlat + dlon * dlon) * KM_PER_DEGREE;
}

SPResult astar(const WeightedGraph &g, const CoordTable &coords,
               const string &source, const string &target) {
    require_nodes(g, source, target);
    if (source == target) return SPResult{true, 0.0, {source}};

    unordered_map<string, double> g_score;  // cost from source
    unordered_map<string, double> f_score;  // g + h
    unordered_map<string, string> parent;
    for (auto &[id, _] : g.adj) {
        g_score[id] = INF;
        f_score[id] = INF;
    }
    g_score[source] = 0.0;
    f_score[source] = heuristic(coords, source, target);

    using State = pair<double, string>;  // (f_score, node)
    priority_queue<State, vector<State>, greater<State>> pq;
    pq.push({f_score[source], source});

    while (!pq.empty()) {
        auto [f, u] = pq.top(); pq.pop();

        if (u == target)
            return SPResult{true, g_score[u], reconstruct(parent, source, target)};

        // outdated entry
        if (f > f_score[u]) continue;
        if (!g.contains(u)) continue;

        for (const auto &[v, w] : g.adj.at(u)) {
            double tentative_g = g_score[u] + w;
            auto it = g_score.find(v);
            if (it == g_score.end() || tentative_g < it->second) {
                g_score[v] = tentative_g;
                parent[v] = u;
                f_score[v] = tentative_g + heuristic(coords, v, target);
                pq.push({f_score[v], v});
            }
        }
    }

    return no_path();
}

double route_cost(const WeightedGraph &g, const vector<string> &route) {
    if (route.size() <= 1) return 0.0;

    double cost = 0.0;
    for (size_t i = 0; i + 1 < route.size(); i++) {
        double w = g.weight(route[i], route[i + 1]);
        if (w == INF) return INF;
        cost += w;
    }
    return cost;
}
