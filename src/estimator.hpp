#pragma once
#include <string>

// Rule-based stand-ins used when no trained model is available.

// 30 km/h average plus 5 minutes per stop
double estimate_delivery_minutes(double distance_km, int num_stops);

// light / moderate / heavy / very_heavy
std::string traffic_level(double multiplier);
