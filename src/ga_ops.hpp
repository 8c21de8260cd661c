#pragma once
#include "tour.hpp"
#include <vector>
#include <string>
#include <random>

// Genetic tour operators. A tour is [start] + interior + [start]; operators
// never move the endpoints.
using Tour = std::vector<std::string>;

// k distinct indices from [0, n), uniformly, without replacement
std::vector<int> sample_indices(int n, int k, std::mt19937 &rng);

// Index of the fittest of min(k, n) sampled individuals; ties keep the
// first sampled.
int tournament_select(const std::vector<double> &fit, int k, std::mt19937 &rng);

// Order crossover on the interior with cut points 0 <= c1 < c2 <= size:
// p1's slice [c1, c2) is copied, the rest is filled left to right with p2's
// remaining stops in p2's order.
Tour order_crossover(const Tour &p1, const Tour &p2, int c1, int c2);

// order_crossover with random cut points; interiors shorter than 2 return p1
Tour crossover(const Tour &p1, const Tour &p2, std::mt19937 &rng);

// with probability rate, swap two distinct interior positions
void swap_mutation(Tour &t, double rate, std::mt19937 &rng);

// Indices of the count fittest, best first, stable on ties.
std::vector<int> elite_indices(const std::vector<double> &fit, int count);

// Elites first, then crossover children until population.size() individuals.
std::vector<Tour> next_generation(const std::vector<Tour> &population, const std::vector<double> &fit,
                                  const GAParams &params, std::mt19937 &rng);
