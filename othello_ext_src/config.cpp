#include "config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    template <typename T>
    T field_or(const json &j, const char *key, T fallback)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const json::exception &e)
        {
            log_comment(std::string("Config: bad value for '") + key + "': " + e.what() + "; using default.");
            return fallback;
        }
    }
} // namespace

std::string EngineConfig::to_string() const
{
    std::ostringstream os;
    os << "EngineConfig { max_time: " << max_time
       << ", log: " << (log ? "true" : "false")
       << ", exploration_factor: " << exploration_factor << " }";
    return os.str();
}

EngineConfig parse_config(const std::string &text)
{
    EngineConfig cfg;

    json in = json::parse(text, nullptr, false);
    if (in.is_discarded() || !in.is_object())
    {
        log_comment("Failed to parse the configuration file; using defaults.");
        return cfg;
    }

    cfg.max_time = field_or<double>(in, "max_time", cfg.max_time);
    cfg.log = field_or<bool>(in, "log", cfg.log);

    auto it = in.find("mcts_config");
    if (it != in.end() && it->is_object())
        cfg.exploration_factor = field_or<double>(*it, "exploration_factor", cfg.exploration_factor);

    if (!(cfg.max_time >= 0.0))
    {
        log_comment("Config: max_time must be non-negative; using default.");
        cfg.max_time = DEFAULT_MAX_TIME;
    }
    return cfg;
}

EngineConfig load_config(const std::string &path)
{
    std::ifstream f(path);
    if (!f)
    {
        log_comment("Failed to open the configuration file '" + path + "'; using defaults.");
        return EngineConfig{};
    }

    std::ostringstream buf;
    buf << f.rdbuf();
    if (f.bad())
    {
        log_comment("Failed to read the configuration file; using defaults.");
        return EngineConfig{};
    }
    return parse_config(buf.str());
}
