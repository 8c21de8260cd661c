#include "estimator.hpp"
#include <stdexcept>

static const double AVERAGE_SPEED_KMH = 30.0;
static const double MINUTES_PER_STOP = 5.0;

double estimate_delivery_minutes(double distance_km, int num_stops) {
    if (distance_km < 0) throw std::invalid_argument("distance_km must be >= 0");
    if (num_stops < 0) throw std::invalid_argument("num_stops must be >= 0");

    double drive = distance_km / AVERAGE_SPEED_KMH * 60.0;
    return drive + num_stops * MINUTES_PER_STOP;
}

std::string traffic_level(double multiplier) {
    if (multiplier < 0.8) return "light";
    if (multiplier < 1.2) return "moderate";
    if (multiplier < 1.6) return "heavy";
    return "very_heavy";
}
