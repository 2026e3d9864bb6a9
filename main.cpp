#include <exception>
#include <iostream>
#include <stdexcept>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "stress_config.hpp"
#include "stress_runner.hpp"

std::shared_ptr<spdlog::logger> g_log;

int
main(const int p_argc, const char** p_argv)
{
    g_log = spdlog::stdout_color_mt("console");
    g_log->set_level(spdlog::level::info);

    spdlog::set_default_logger(g_log);

    try {
        const boost::program_options::options_description l_description =
            stress_options_description();

        boost::program_options::variables_map l_map;

        boost::program_options::store(
            boost::program_options::parse_command_line(
                p_argc,
                p_argv,
                l_description
            ),
            l_map
        );

        boost::program_options::notify(l_map);

        if (l_map.count("help")) {
            std::cout << l_description;

            return 0;
        }

        if (l_map.count("version")) {
            std::cout << "0.1.0" << std::endl;

            return 0;
        }

        stress_config_t l_config = [&](){
            if (l_map.count("config")) {
                return stress_config_from_file(
                    l_map["config"].as<std::string>()
                );
            } else {
                return stress_config_t();
            }
        }();

        stress_config_apply_options(l_config, l_map);

        g_log->set_level(l_config.log_level());

        g_log->info("config {}", l_config.to_json().dump());

        stress_runner l_runner(g_log, l_config);

        const stress_report_t l_report = l_runner.run();

        g_log->info("report {}", l_report.to_json().dump());

        if (l_report.m_violation.has_value()) {
            return 2;
        }
    } catch (const std::exception &p_error) {
        g_log->error("main() exception: {}", p_error.what());

        return 1;
    }

    return 0;
}
