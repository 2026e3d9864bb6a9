#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

struct stress_config_t {
    uint32_t    m_threads    = 8;
    uint32_t    m_operations = 10000;
    uint32_t    m_capacity   = 64;
    uint32_t    m_key_space  = 256;
    std::string m_log_level  = "info";

    nlohmann::json to_json() const;

    spdlog::level::level_enum log_level() const;
};

// missing fields keep their defaults, unknown fields are ignored
stress_config_t stress_config_from_json(const nlohmann::json &p_json);

stress_config_t stress_config_from_file(const std::string &p_path);

std::string file_to_string(const std::string &p_path);

// throws std::runtime_error unless 0 < p_value <= UINT32_MAX
uint32_t positive_count(const std::string &p_name, const int64_t p_value);

boost::program_options::options_description stress_options_description();

// --threads, --operations, --capacity and --verbose on top of p_config
void stress_config_apply_options(
    stress_config_t                             &p_config,
    const boost::program_options::variables_map &p_map
);
