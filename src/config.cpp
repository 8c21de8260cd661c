#include "config.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>
using json = nlohmann::json;

// Integer in [lo, hi]; floats and out-of-range values are rejected before
// any conversion.
static long long read_integer(const json &j, const char *key, long long fallback,
                              long long lo, long long hi) {
    if (!j.contains(key)) return fallback;
    const json &v = j[key];
    std::string what = std::string("config: ") + key;
    if (!v.is_number_integer())
        throw std::invalid_argument(what + " must be an integer");

    if (v.is_number_unsigned()) {
        std::uint64_t u = v.get<std::uint64_t>();
        if (u > (std::uint64_t)hi)
            throw std::invalid_argument(what + " out of range");
        return (long long)u;
    }
    std::int64_t s = v.get<std::int64_t>();
    if (s < lo || s > hi)
        throw std::invalid_argument(what + " out of range");
    return s;
}

static std::string read_string(const json &j, const char *key, const std::string &fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_string())
        throw std::invalid_argument(std::string("config: ") + key + " must be a string");
    return j[key].get<std::string>();
}

Config load_config(const json &j) {
    Config cfg;
    if (j.is_null()) return cfg;
    if (!j.is_object()) throw std::invalid_argument("config must be a JSON object");

    const long long int_max = std::numeric_limits<int>::max();
    cfg.ga.generations = (int)read_integer(j, "generations", cfg.ga.generations, 0, int_max);
    cfg.ga.population_size = (int)read_integer(j, "population_size", cfg.ga.population_size, 1, int_max);

    if (j.contains("mutation_rate")) {
        const json &m = j["mutation_rate"];
        if (!m.is_number())
            throw std::invalid_argument("config: mutation_rate must be a number");
        cfg.ga.mutation_rate = m.get<double>();
        if (!(cfg.ga.mutation_rate >= 0 && cfg.ga.mutation_rate <= 1))
            throw std::invalid_argument("config: mutation_rate must be in [0, 1]");
    }

    cfg.default_start = read_string(j, "default_start", cfg.default_start);
    cfg.default_weather = read_string(j, "default_weather", cfg.default_weather);

    if (j.contains("seed"))
        cfg.seed = (unsigned)read_integer(j, "seed", 0, 0, std::numeric_limits<unsigned>::max());
    return cfg;
}
