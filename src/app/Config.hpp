#pragma once

#include "engine/Core.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ts::app
{

// Returns the value of an environment variable, nullopt when unset.
using EnvReader = std::function<std::optional<std::string>(char const *)>;

struct DaemonConfig
{
    engine::CoreSettings core;
    std::string http_bind{"http://0.0.0.0:58827"};
    std::filesystem::path log_file;
};

EnvReader process_environment();

// Every variable is optional; unparsable numbers keep their defaults.
DaemonConfig load_config(EnvReader const &read_env);

std::optional<long long> parse_int_value(std::optional<std::string> const &value);
bool parse_bool_value(std::optional<std::string> const &value);

} // namespace ts::app
