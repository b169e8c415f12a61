#pragma once

#include "common.hpp"

// Share of the remaining game time to spend on each turn.
static constexpr std::array<double, 70> TIME_ALLOCATIONS = {
    0.015, 0.015, 0.015, 0.015, 0.025, 0.025, 0.025, 0.025, 0.025, 0.025,
    0.048, 0.048, 0.048, 0.048, 0.048, 0.048, 0.050, 0.051, 0.052, 0.053,
    0.044, 0.045, 0.049, 0.049, 0.049, 0.051, 0.053, 0.055, 0.057, 0.059,
    0.060, 0.060, 0.061, 0.062, 0.063, 0.064, 0.065, 0.065, 0.065, 0.065,
    0.167, 0.168, 0.169, 0.169, 0.171, 0.172, 0.173, 0.175, 0.180, 0.180,
    0.181, 0.187, 0.196, 0.199, 0.060, 0.060, 0.060, 0.060, 0.060, 0.060,
    0.060, 0.060, 0.060, 0.060, 0.060, 0.060, 0.060, 0.060, 0.060, 0.060};

class TimeBudget
{
public:
    explicit TimeBudget(double total_seconds);

    // Seconds to spend on this turn; deducted from the remaining time.
    // Turns past the end of the table reuse its last entry.
    double time_for_turn(int turn_number);

    static double fraction_for_turn(int turn_number);

    double get_time_remaining() const { return time_remaining; }
    void reset(double total_seconds);

private:
    double time_remaining;
};
