#pragma once

#include "common.hpp"

static constexpr double DEFAULT_MAX_TIME = 120.0;
static constexpr double DEFAULT_EXPLORATION_FACTOR = 1.41421356237309504880;

// Engine settings. The JSON form is
//   {"max_time": 100.0, "log": true, "mcts_config": {"exploration_factor": 1.418}}
// and every field is optional.
struct EngineConfig
{
    double max_time = DEFAULT_MAX_TIME;
    bool log = true;
    double exploration_factor = DEFAULT_EXPLORATION_FACTOR;

    std::string to_string() const;
};

// Missing, unreadable or malformed documents fall back to the defaults; the
// failure is reported on the comment channel, never thrown.
EngineConfig load_config(const std::string &path);
EngineConfig parse_config(const std::string &text);
