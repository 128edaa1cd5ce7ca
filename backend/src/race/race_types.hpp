#pragma once
#include <string>
#include <utility>
#include <vector>

// A single arrival of a watched transaction at one endpoint.
struct Observation {
    std::string signature;
    double timestamp{0};  // wall-clock seconds when the runner recognized the match
    double start_time{0}; // run epoch, seconds
};

// Per-signature race state: first arrival per endpoint, in arrival order.
struct RaceRecord {
    std::string signature;
    double start_time{0};
    std::vector<std::pair<std::string, double>> arrivals; // (endpoint, timestamp)

    bool has_endpoint(const std::string& endpoint) const {
        for (const auto& a : arrivals) {
            if (a.first == endpoint) return true;
        }
        return false;
    }
};
