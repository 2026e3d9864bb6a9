#pragma once

#include <atomic>
#include <cstdint>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <boost/core/noncopyable.hpp>

#include "dictionary_limited.hpp"
#include "stress_config.hpp"

struct stress_report_t {
    uint64_t                   m_puts;
    uint64_t                   m_maps;
    uint64_t                   m_removes;
    uint64_t                   m_reads;
    std::size_t                m_final_size;
    std::chrono::milliseconds  m_elapsed;
    std::optional<std::string> m_violation;

    nlohmann::json to_json() const;
};

// Returns a description of the first broken invariant, nullopt when the map
// and its timeline agree. Only meaningful while no writer is running.
template<typename key_t, typename value_t, typename hash_t>
std::optional<std::string>
find_violation(const dictionary_limited_t<key_t, value_t, hash_t> &p_dictionary)
{
    const std::vector<key_t> l_timeline = p_dictionary.timeline();
    const std::vector<key_t> l_keys     = p_dictionary.keys();

    if (l_keys.size() > p_dictionary.capacity()) {
        return std::optional<std::string>("size exceeds capacity");
    }

    if (l_keys.size() != l_timeline.size()) {
        return std::optional<std::string>("timeline and map sizes differ");
    }

    std::unordered_set<key_t, hash_t> l_seen;

    for (const auto &l_key : l_timeline) {
        if (l_seen.insert(l_key).second == false) {
            return std::optional<std::string>("duplicate key in timeline");
        }

        if (p_dictionary.exists(l_key) == false) {
            return std::optional<std::string>("timeline key missing from map");
        }
    }

    return std::nullopt;
}

// Starts p_count threads through p_spawn and joins all of them. If p_spawn
// throws, the threads already running are joined before the exception
// propagates.
void join_thread_group(
    const uint32_t                              p_count,
    const std::function<std::thread(uint32_t)> &p_spawn
);

// Drives one shared dictionary_limited_t from m_threads workers, each doing
// m_operations mixed writes and reads, then checks the invariants.
class stress_runner : private boost::noncopyable {
public:
    stress_runner(
        std::shared_ptr<spdlog::logger> p_log,
        const stress_config_t          &p_config
    );

    ~stress_runner();

    stress_report_t run();

private:
    const std::shared_ptr<spdlog::logger> m_log;
    const stress_config_t                 m_config;

    dictionary_limited_t<std::string, uint64_t> m_dictionary;

    std::atomic<uint64_t> m_puts;
    std::atomic<uint64_t> m_maps;
    std::atomic<uint64_t> m_removes;
    std::atomic<uint64_t> m_reads;

    void worker(const uint32_t p_worker_id);
};
