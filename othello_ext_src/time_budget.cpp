#include "time_budget.hpp"

TimeBudget::TimeBudget(double total_seconds)
{
    reset(total_seconds);
}

void TimeBudget::reset(double total_seconds)
{
    if (!(total_seconds >= 0.0))
        throw std::invalid_argument("TimeBudget: total time must be non-negative");
    time_remaining = total_seconds;
}

double TimeBudget::fraction_for_turn(int turn_number)
{
    if (turn_number < 0)
        throw std::out_of_range("TimeBudget: negative turn number");
    std::size_t idx = std::min<std::size_t>((std::size_t)turn_number, TIME_ALLOCATIONS.size() - 1);
    return TIME_ALLOCATIONS[idx];
}

double TimeBudget::time_for_turn(int turn_number)
{
    double t = time_remaining * fraction_for_turn(turn_number);
    time_remaining -= t;
    return t;
}
