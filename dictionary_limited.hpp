#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <spdlog/spdlog.h>

#include "dictionary_sync.hpp"
#include "vector.hpp"

// Bounded dictionary_sync_t. Keeps at most p_max_size entries and on overflow
// evicts the least recently written key. Writes (put, put_all) refresh the
// recency of an existing key, reads and put_if_absent never do.
//
// m_timeline holds every key of m_items exactly once, oldest write first.
// Both are only touched under the inherited m_lock, which is held for the
// whole write + timeline update + eviction sequence.
//
// p_max_size must be positive.
template<
    typename key_t,
    typename value_t,
    typename hash_t = std::hash<key_t>
>
class dictionary_limited_t : public dictionary_sync_t<key_t, value_t, hash_t> {
public:
    typedef dictionary_sync_t<key_t, value_t, hash_t> sync_t;
    typedef i_dictionary<key_t, value_t, hash_t>      interface_t;
    typedef typename sync_t::map_t                    map_t;
    typedef typename sync_t::predicate_t              predicate_t;
    typedef typename sync_t::key_fn_t                 key_fn_t;

    explicit dictionary_limited_t(const std::size_t p_max_size):
        m_max_size(p_max_size),
        m_log(spdlog::default_logger())
    {};

    // Seeding stops at p_max_size keys, the rest of p_items is dropped
    // without evicting anything.
    dictionary_limited_t(const std::size_t p_max_size, const map_t &p_items):
        dictionary_limited_t(p_max_size)
    {
        for (const auto &l_iter : p_items) {
            if (m_timeline.size() == m_max_size) {
                if (m_log) {
                    m_log->debug(
                        "dictionary_limited seed truncated at {} of {} entries",
                        m_max_size,
                        p_items.size()
                    );
                }

                break;
            }

            this->m_items.emplace(l_iter.first, l_iter.second);
            m_timeline.append(l_iter.first);
        }
    }

    dictionary_limited_t(
        const std::size_t           p_max_size,
        const std::vector<value_t> &p_items,
        const key_fn_t             &p_key_fn
    ):
        dictionary_limited_t(p_max_size)
    {
        for (const auto &l_item : p_items) {
            const key_t l_key = p_key_fn(l_item);

            const auto l_iter = this->m_items.find(l_key);

            if (l_iter != this->m_items.end()) {
                l_iter->second = l_item;

                touch(l_key, true);

                continue;
            }

            if (m_timeline.size() == m_max_size) {
                if (m_log) {
                    m_log->debug(
                        "dictionary_limited seed truncated at {} entries",
                        m_max_size
                    );
                }

                break;
            }

            this->m_items.emplace(l_key, l_item);
            m_timeline.append(l_key);
        }
    }

    dictionary_limited_t(
        const std::size_t        p_max_size,
        const vector_t<value_t> &p_items,
        const key_fn_t          &p_key_fn
    ):
        dictionary_limited_t(p_max_size, p_items.collect(), p_key_fn)
    {};

    std::optional<value_t>
    put(const key_t &p_key, const value_t &p_value) override
    {
        std::unique_lock l_guard(this->m_lock);

        std::optional<value_t> l_old = this->store(p_key, p_value);

        touch(p_key, l_old.has_value());
        evict_overflow();

        return l_old;
    }

    std::optional<value_t>
    put_if_absent(const key_t &p_key, const value_t &p_value) override
    {
        std::unique_lock l_guard(this->m_lock);

        const auto l_result = this->m_items.emplace(p_key, p_value);

        if (!l_result.second) {
            return std::optional<value_t>(l_result.first->second);
        }

        m_timeline.append(p_key);
        evict_overflow();

        return std::nullopt;
    }

    // Accepts at most m_max_size entries of p_items per call regardless of
    // how many slots are already in use, then trims the oldest keys until
    // the bound holds again.
    dictionary_limited_t &
    put_all(const map_t &p_items) override
    {
        std::unique_lock l_guard(this->m_lock);

        std::size_t l_accepted = 0;

        for (const auto &l_iter : p_items) {
            if (l_accepted == m_max_size) {
                if (m_log) {
                    m_log->debug(
                        "dictionary_limited put_all dropped {} entries",
                        p_items.size() - l_accepted
                    );
                }

                break;
            }

            const bool l_existed =
                this->store(l_iter.first, l_iter.second).has_value();

            touch(l_iter.first, l_existed);

            l_accepted++;
        }

        evict_overflow();

        return *this;
    }

    std::optional<value_t>
    remove(const key_t &p_key) override
    {
        std::unique_lock l_guard(this->m_lock);

        std::optional<value_t> l_old = this->erase(p_key);

        if (l_old.has_value()) {
            forget(p_key);
        }

        return l_old;
    }

    dictionary_limited_t &
    filter_self(const predicate_t &p_predicate) override
    {
        std::unique_lock l_guard(this->m_lock);

        std::erase_if(this->m_items, [&](const auto &l_iter) {
            return !p_predicate(l_iter.first, l_iter.second);
        });

        m_timeline.filter_self([&](const key_t &l_key) {
            return this->m_items.find(l_key) != this->m_items.end();
        });

        return *this;
    }

    dictionary_limited_t &
    clean() override
    {
        std::unique_lock l_guard(this->m_lock);

        this->m_items.clear();
        m_timeline.clean();

        return *this;
    }

    // same capacity, matching entries keep their relative recency
    std::unique_ptr<interface_t>
    filter(const predicate_t &p_predicate) const override
    {
        std::shared_lock l_guard(this->m_lock);

        return copy(p_predicate);
    }

    std::unique_ptr<interface_t>
    clone() const override
    {
        std::shared_lock l_guard(this->m_lock);

        return copy([](const key_t &, const value_t &) { return true; });
    }

    std::size_t
    capacity() const
    {
        return m_max_size;
    }

    // keys from the next eviction candidate to the most recently written
    std::vector<key_t>
    timeline() const
    {
        std::shared_lock l_guard(this->m_lock);

        return m_timeline.collect();
    }

    // nullptr silences the dictionary
    void
    set_logger(std::shared_ptr<spdlog::logger> p_log)
    {
        std::unique_lock l_guard(this->m_lock);

        m_log = p_log;
    }

private:
    const std::size_t m_max_size;

    vector_t<key_t> m_timeline;

    std::shared_ptr<spdlog::logger> m_log;

    // moves p_key to the back of the timeline
    void
    touch(const key_t &p_key, const bool p_existed)
    {
        if (p_existed) {
            forget(p_key);
        }

        m_timeline.append(p_key);
    }

    void
    forget(const key_t &p_key)
    {
        const auto l_index = m_timeline.index_of([&](const key_t &l_key) {
            return l_key == p_key;
        });

        if (l_index.has_value()) {
            m_timeline.remove(l_index.value());
        }
    }

    void
    evict_overflow()
    {
        while (m_timeline.size() > m_max_size) {
            const std::optional<key_t> l_oldest = m_timeline.shift();

            this->m_items.erase(*l_oldest);

            if (m_log) {
                m_log->trace(
                    "dictionary_limited evicted oldest entry, {} of {} in use",
                    this->m_items.size(),
                    m_max_size
                );
            }
        }
    }

    std::unique_ptr<interface_t>
    copy(const predicate_t &p_predicate) const
    {
        auto l_result = std::make_unique<dictionary_limited_t>(m_max_size);

        l_result->m_log = m_log;

        for (const auto &l_key : m_timeline) {
            const auto l_iter = this->m_items.find(l_key);

            if (p_predicate(l_iter->first, l_iter->second)) {
                l_result->m_items.emplace(l_iter->first, l_iter->second);
                l_result->m_timeline.append(l_key);
            }
        }

        return l_result;
    }
};
