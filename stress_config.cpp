#include <fstream>
#include <stdexcept>
#include <string>

#include "stress_config.hpp"

static uint32_t
positive_field(
    const nlohmann::json &p_json,
    const std::string    &p_field,
    const uint32_t        p_default
) {
    if (p_json.contains(p_field) == false) {
        return p_default;
    }

    const nlohmann::json &l_value = p_json[p_field];

    if (l_value.is_number_integer() == false) {
        throw std::runtime_error("config field " + p_field + " not an integer");
    }

    if (l_value.is_number_unsigned() && l_value.get<uint64_t>() > UINT32_MAX) {
        throw std::runtime_error("config field " + p_field + " out of range");
    }

    return positive_count("config field " + p_field, l_value.get<int64_t>());
}

static void
override_count(
    const boost::program_options::variables_map &p_map,
    const char *const                            p_name,
    uint32_t                                    &p_field
) {
    if (p_map.count(p_name) == 0) {
        return;
    }

    p_field = positive_count(
        std::string("--") + p_name,
        p_map[p_name].as<int64_t>()
    );
}

uint32_t
positive_count(const std::string &p_name, const int64_t p_value)
{
    if (p_value <= 0 || p_value > UINT32_MAX) {
        throw std::runtime_error(
            p_name + " out of range: " + std::to_string(p_value)
        );
    }

    return static_cast<uint32_t>(p_value);
}

boost::program_options::options_description
stress_options_description()
{
    boost::program_options::options_description
        l_description("collections_stress allowed options");

    // counts are read signed so that negative input reaches positive_count
    l_description.add_options()
        ( "help,h",    "produce help message"           )
        ( "version,v", "print version"                  )
        ( "verbose",   "log every eviction"             )
        (
            "config",
            boost::program_options::value<std::string>(),
            "json file with the stress configuration"
        )
        (
            "threads",
            boost::program_options::value<int64_t>(),
            "number of worker threads"
        )
        (
            "operations",
            boost::program_options::value<int64_t>(),
            "operations per worker"
        )
        (
            "capacity",
            boost::program_options::value<int64_t>(),
            "capacity of the shared dictionary"
        );

    return l_description;
}

void
stress_config_apply_options(
    stress_config_t                             &p_config,
    const boost::program_options::variables_map &p_map
) {
    override_count(p_map, "threads",    p_config.m_threads);
    override_count(p_map, "operations", p_config.m_operations);
    override_count(p_map, "capacity",   p_config.m_capacity);

    if (p_map.count("verbose")) {
        p_config.m_log_level = "trace";
    }
}

nlohmann::json
stress_config_t::to_json() const
{
    return {
        { "threads",    m_threads    },
        { "operations", m_operations },
        { "capacity",   m_capacity   },
        { "keySpace",   m_key_space  },
        { "logLevel",   m_log_level  }
    };
}

spdlog::level::level_enum
stress_config_t::log_level() const
{
    const spdlog::level::level_enum l_level =
        spdlog::level::from_str(m_log_level);

    // from_str maps anything it does not know to off
    if (l_level == spdlog::level::off && m_log_level != "off") {
        throw std::runtime_error("unknown log level " + m_log_level);
    }

    return l_level;
}

stress_config_t
stress_config_from_json(const nlohmann::json &p_json)
{
    if (p_json.is_object() == false) {
        throw std::runtime_error("config root is not an object");
    }

    stress_config_t l_config;

    l_config.m_threads =
        positive_field(p_json, "threads", l_config.m_threads);
    l_config.m_operations =
        positive_field(p_json, "operations", l_config.m_operations);
    l_config.m_capacity =
        positive_field(p_json, "capacity", l_config.m_capacity);
    l_config.m_key_space =
        positive_field(p_json, "keySpace", l_config.m_key_space);

    if (p_json.contains("logLevel")) {
        if (p_json["logLevel"].is_string() == false) {
            throw std::runtime_error("config field logLevel not a string");
        }

        l_config.m_log_level = p_json["logLevel"].get<std::string>();
    }

    l_config.log_level();

    return l_config;
}

stress_config_t
stress_config_from_file(const std::string &p_path)
{
    const std::string l_text = file_to_string(p_path);

    try {
        return stress_config_from_json(nlohmann::json::parse(l_text));
    } catch (const nlohmann::json::parse_error &p_error) {
        throw std::runtime_error(
            "failed to parse " + p_path + ": " + p_error.what()
        );
    }
}

std::string
file_to_string(const std::string &p_path) {
    std::ifstream l_stream(p_path);

    if (l_stream.is_open() == false) {
        throw std::runtime_error("std::ifstream() failed for " + p_path);
    }

    return std::string(
        (std::istreambuf_iterator<char>(l_stream)),
        std::istreambuf_iterator<char>()
    );
}
