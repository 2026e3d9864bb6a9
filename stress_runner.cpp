#include <exception>
#include <random>
#include <thread>
#include <vector>

#include "stress_runner.hpp"

nlohmann::json
stress_report_t::to_json() const
{
    nlohmann::json l_result = {
        { "puts",      m_puts            },
        { "maps",      m_maps            },
        { "removes",   m_removes         },
        { "reads",     m_reads           },
        { "finalSize", m_final_size      },
        { "elapsedMs", m_elapsed.count() }
    };

    if (m_violation.has_value()) {
        l_result["violation"] = m_violation.value();
    }

    return l_result;
}

void
join_thread_group(
    const uint32_t                              p_count,
    const std::function<std::thread(uint32_t)> &p_spawn
) {
    std::vector<std::thread> l_thread_group;

    l_thread_group.reserve(p_count);

    try {
        for (uint32_t l_index = 0; l_index < p_count; l_index++) {
            l_thread_group.push_back(p_spawn(l_index));
        }
    } catch (const std::exception &) {
        // a joinable std::thread must not be destroyed
        for (auto &l_thread : l_thread_group) {
            l_thread.join();
        }

        throw;
    }

    for (auto &l_thread : l_thread_group) {
        l_thread.join();
    }
}

stress_runner::stress_runner(
    std::shared_ptr<spdlog::logger> p_log,
    const stress_config_t          &p_config
):
    m_log(p_log),
    m_config(p_config),
    m_dictionary(p_config.m_capacity),
    m_puts(0),
    m_maps(0),
    m_removes(0),
    m_reads(0)
{
    m_dictionary.set_logger(p_log);
}

stress_runner::~stress_runner() {};

void
stress_runner::worker(const uint32_t p_worker_id)
{
    std::mt19937 l_random(p_worker_id);

    std::uniform_int_distribution<uint32_t> l_keys(0, m_config.m_key_space - 1);

    for (uint32_t l_step = 0; l_step < m_config.m_operations; l_step++) {
        const std::string l_key = std::to_string(l_keys(l_random));

        switch ((p_worker_id + l_step) % 6) {
            case 0: {
                m_dictionary.put(l_key, l_step);
                m_puts++;

                break;
            }
            case 1: {
                m_dictionary.put_if_absent(l_key, l_step);
                m_puts++;

                break;
            }
            case 2: {
                m_dictionary.put_all({
                    { l_key,                                l_step },
                    { std::to_string(l_keys(l_random)), l_step + 1 }
                });
                m_puts++;

                break;
            }
            case 3: {
                m_dictionary.map([](const std::string &, const uint64_t &p_value) {
                    return p_value + 1;
                });
                m_maps++;

                break;
            }
            case 4: {
                m_dictionary.remove(l_key);
                m_removes++;

                break;
            }
            case 5: {
                m_dictionary.get(l_key);
                m_dictionary.max([](const std::string &, const uint64_t &p_value) {
                    return static_cast<int>(p_value % 1000);
                });
                m_reads++;

                break;
            }
        }
    }

    m_log->debug("stress worker {} done", p_worker_id);
}

stress_report_t
stress_runner::run()
{
    m_log->info(
        "starting stress run with {} threads, capacity {}",
        m_config.m_threads,
        m_config.m_capacity
    );

    const auto l_start = std::chrono::steady_clock::now();

    join_thread_group(m_config.m_threads, [this](const uint32_t p_worker_id) {
        return std::thread(&stress_runner::worker, this, p_worker_id);
    });

    const auto l_elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - l_start
        );

    stress_report_t l_report;

    l_report.m_puts       = m_puts;
    l_report.m_maps       = m_maps;
    l_report.m_removes    = m_removes;
    l_report.m_reads      = m_reads;
    l_report.m_final_size = m_dictionary.size();
    l_report.m_elapsed    = l_elapsed;
    l_report.m_violation  = find_violation(m_dictionary);

    if (l_report.m_violation.has_value()) {
        m_log->error(
            "stress run left an inconsistent dictionary: {}",
            l_report.m_violation.value()
        );
    } else {
        m_log->info("stress run finished in {} ms", l_elapsed.count());
    }

    return l_report;
}
