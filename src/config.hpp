#pragma once
#include "tour.hpp"
#include <string>
#include <optional>
#include "nlohmann/json.hpp"

struct Config {
    GAParams ga;                       // generations 100, population 50
    std::string default_start = "Warehouse";
    std::string default_weather = "clear";
    std::optional<unsigned> seed;      // random_device when unset
};

// Missing keys keep their defaults.
Config load_config(const nlohmann::json &j);
