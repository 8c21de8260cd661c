#include "ga_ops.hpp"
#include <numeric>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
using namespace std;

static int randint(mt19937 &rng, int a, int b) {
    return uniform_int_distribution<int>(a, b)(rng);
}

vector<int> sample_indices(int n, int k, mt19937 &rng) {
    k = min(k, n);
    vector<int> idx(n);
    iota(idx.begin(), idx.end(), 0);
    // partial Fisher-Yates
    for (int i = 0; i < k; i++) swap(idx[i], idx[randint(rng, i, n - 1)]);
    idx.resize(max(k, 0));
    return idx;
}

int tournament_select(const vector<double> &fit, int k, mt19937 &rng) {
    if (fit.empty()) throw invalid_argument("tournament over an empty population");
    vector<int> candidates = sample_indices((int)fit.size(), max(k, 1), rng);

    int winner = candidates[0];
    for (int c : candidates)
        if (fit[c] > fit[winner]) winner = c;
    return winner;
}

Tour order_crossover(const Tour &p1, const Tour &p2, int c1, int c2) {
    int size = (int)p1.size() - 2;
    if (p2.size() != p1.size())
        throw invalid_argument("crossover parents differ in length");
    if (c1 < 0 || c1 >= c2 || c2 > size)
        throw invalid_argument("crossover cut points out of range");

    unordered_set<string> taken(p1.begin() + 1 + c1, p1.begin() + 1 + c2);

    Tour child = p1;
    int j = 1;
    for (int i = 0; i < size; i++) {
        if (i >= c1 && i < c2) continue;
        while (j <= size && taken.count(p2[j])) j++;
        if (j > size) throw invalid_argument("crossover parents hold different stops");
        child[i + 1] = p2[j++];
    }
    return child;
}

Tour crossover(const Tour &p1, const Tour &p2, mt19937 &rng) {
    int size = (int)p1.size() - 2;
    if (size < 2) return p1;

    int c1 = randint(rng, 0, size - 1);
    int c2 = randint(rng, c1 + 1, size);
    return order_crossover(p1, p2, c1, c2);
}

void swap_mutation(Tour &t, double rate, mt19937 &rng) {
    if (uniform_real_distribution<double>(0.0, 1.0)(rng) >= rate) return;
    if (t.size() <= 3) return;

    int last = (int)t.size() - 2;
    int i = randint(rng, 1, last);
    int j = randint(rng, 1, last - 1);
    if (j >= i) j++;
    swap(t[i], t[j]);
}

vector<int> elite_indices(const vector<double> &fit, int count) {
    vector<int> order(fit.size());
    iota(order.begin(), order.end(), 0);
    stable_sort(order.begin(), order.end(),
                [&](int a, int b) { return fit[a] > fit[b]; });
    order.resize(min((size_t)max(count, 0), order.size()));
    return order;
}

vector<Tour> next_generation(const vector<Tour> &population, const vector<double> &fit,
                             const GAParams &params, mt19937 &rng) {
    int n = (int)population.size();
    vector<Tour> next;
    next.reserve(n);
    for (int i : elite_indices(fit, params.elite_count)) next.push_back(population[i]);

    while ((int)next.size() < n) {
        const Tour &p1 = population[tournament_select(fit, params.tournament_size, rng)];
        const Tour &p2 = population[tournament_select(fit, params.tournament_size, rng)];
        Tour child = crossover(p1, p2, rng);
        swap_mutation(child, params.mutation_rate, rng);
        next.push_back(std::move(child));
    }
    return next;
}
