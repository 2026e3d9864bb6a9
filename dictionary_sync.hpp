#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/core/noncopyable.hpp>

#include "i_dictionary.hpp"

// Key value store guarded by a reader / writer lock. Every call holds the
// lock for its whole body: mutations exclusively, reads shared. Callbacks run
// under the lock and must not call back into the same instance.
template<
    typename key_t,
    typename value_t,
    typename hash_t = std::hash<key_t>
>
class dictionary_sync_t :
    public  i_dictionary<key_t, value_t, hash_t>,
    private boost::noncopyable
{
public:
    typedef i_dictionary<key_t, value_t, hash_t> base_t;
    typedef typename base_t::map_t               map_t;
    typedef typename base_t::entry_t             entry_t;
    typedef typename base_t::predicate_t         predicate_t;
    typedef typename base_t::visitor_t           visitor_t;
    typedef typename base_t::mapper_t            mapper_t;
    typedef typename base_t::scorer_t            scorer_t;
    typedef typename base_t::key_fn_t            key_fn_t;

    dictionary_sync_t() {};

    explicit dictionary_sync_t(map_t p_items): m_items(std::move(p_items)) {};

    dictionary_sync_t(
        const std::vector<value_t> &p_items,
        const key_fn_t             &p_key_fn
    ) {
        for (const auto &l_item : p_items) {
            m_items[p_key_fn(l_item)] = l_item;
        }
    }

    dictionary_sync_t(
        const vector_t<value_t> &p_items,
        const key_fn_t          &p_key_fn
    ):
        dictionary_sync_t(p_items.collect(), p_key_fn)
    {};

    std::size_t
    size() const override
    {
        std::shared_lock l_guard(m_lock);

        return m_items.size();
    }

    bool
    exists(const key_t &p_key) const override
    {
        std::shared_lock l_guard(m_lock);

        return m_items.find(p_key) != m_items.end();
    }

    std::vector<value_t>
    find(const predicate_t &p_predicate) const override
    {
        std::vector<value_t> l_result;

        std::shared_lock l_guard(m_lock);

        for (const auto &l_iter : m_items) {
            if (p_predicate(l_iter.first, l_iter.second)) {
                l_result.push_back(l_iter.second);
            }
        }

        return l_result;
    }

    std::optional<value_t>
    find_one(const predicate_t &p_predicate) const override
    {
        std::shared_lock l_guard(m_lock);

        for (const auto &l_iter : m_items) {
            if (p_predicate(l_iter.first, l_iter.second)) {
                return std::optional<value_t>(l_iter.second);
            }
        }

        return std::nullopt;
    }

    std::optional<value_t>
    get(const key_t &p_key) const override
    {
        std::shared_lock l_guard(m_lock);

        const auto l_iter = m_items.find(p_key);

        if (l_iter != m_items.end()) {
            return std::optional<value_t>(l_iter->second);
        } else {
            return std::nullopt;
        }
    }

    std::optional<value_t>
    put(const key_t &p_key, const value_t &p_value) override
    {
        std::unique_lock l_guard(m_lock);

        return store(p_key, p_value);
    }

    std::optional<value_t>
    put_if_absent(const key_t &p_key, const value_t &p_value) override
    {
        std::unique_lock l_guard(m_lock);

        const auto l_result = m_items.emplace(p_key, p_value);

        if (l_result.second) {
            return std::nullopt;
        }

        return std::optional<value_t>(l_result.first->second);
    }

    dictionary_sync_t &
    put_all(const map_t &p_items) override
    {
        std::unique_lock l_guard(m_lock);

        for (const auto &l_iter : p_items) {
            m_items[l_iter.first] = l_iter.second;
        }

        return *this;
    }

    std::unique_ptr<base_t>
    filter(const predicate_t &p_predicate) const override
    {
        map_t l_filtered;

        {
            std::shared_lock l_guard(m_lock);

            for (const auto &l_iter : m_items) {
                if (p_predicate(l_iter.first, l_iter.second)) {
                    l_filtered.insert(l_iter);
                }
            }
        }

        return std::make_unique<dictionary_sync_t>(std::move(l_filtered));
    }

    dictionary_sync_t &
    filter_self(const predicate_t &p_predicate) override
    {
        std::unique_lock l_guard(m_lock);

        std::erase_if(m_items, [&](const auto &l_iter) {
            return !p_predicate(l_iter.first, l_iter.second);
        });

        return *this;
    }

    std::optional<value_t>
    remove(const key_t &p_key) override
    {
        std::unique_lock l_guard(m_lock);

        return erase(p_key);
    }

    dictionary_sync_t &
    for_each(const visitor_t &p_visitor) override
    {
        std::shared_lock l_guard(m_lock);

        for (const auto &l_iter : m_items) {
            p_visitor(l_iter.first, l_iter.second);
        }

        return *this;
    }

    dictionary_sync_t &
    map(const mapper_t &p_mapper) override
    {
        std::unique_lock l_guard(m_lock);

        for (auto &l_iter : m_items) {
            l_iter.second = p_mapper(l_iter.first, l_iter.second);
        }

        return *this;
    }

    dictionary_sync_t &
    clean() override
    {
        std::unique_lock l_guard(m_lock);

        m_items.clear();

        return *this;
    }

    std::unique_ptr<base_t>
    clone() const override
    {
        std::shared_lock l_guard(m_lock);

        return std::make_unique<dictionary_sync_t>(m_items);
    }

    std::optional<scored_t<entry_t>>
    max(const scorer_t &p_scorer) const override
    {
        std::shared_lock l_guard(m_lock);

        return base_t::scan_extremum(m_items, p_scorer, true);
    }

    std::optional<scored_t<entry_t>>
    min(const scorer_t &p_scorer) const override
    {
        std::shared_lock l_guard(m_lock);

        return base_t::scan_extremum(m_items, p_scorer, false);
    }

    std::vector<key_t>
    keys() const override
    {
        std::shared_lock l_guard(m_lock);

        std::vector<key_t> l_keys;

        l_keys.reserve(m_items.size());

        for (const auto &l_iter : m_items) {
            l_keys.push_back(l_iter.first);
        }

        return l_keys;
    }

    std::vector<value_t>
    values() const override
    {
        std::shared_lock l_guard(m_lock);

        std::vector<value_t> l_values;

        l_values.reserve(m_items.size());

        for (const auto &l_iter : m_items) {
            l_values.push_back(l_iter.second);
        }

        return l_values;
    }

    std::vector<entry_t>
    pairs() const override
    {
        std::shared_lock l_guard(m_lock);

        std::vector<entry_t> l_pairs;

        l_pairs.reserve(m_items.size());

        for (const auto &l_iter : m_items) {
            l_pairs.push_back(entry_t(l_iter.first, l_iter.second));
        }

        return l_pairs;
    }

    map_t
    collect() const override
    {
        std::shared_lock l_guard(m_lock);

        return m_items;
    }

protected:
    // Subclasses touch the storage only while holding m_lock themselves.
    mutable std::shared_mutex m_lock;
    map_t                     m_items;

    std::optional<value_t>
    store(const key_t &p_key, const value_t &p_value)
    {
        const auto l_iter = m_items.find(p_key);

        if (l_iter != m_items.end()) {
            std::optional<value_t> l_old(std::move(l_iter->second));

            l_iter->second = p_value;

            return l_old;
        }

        m_items.emplace(p_key, p_value);

        return std::nullopt;
    }

    std::optional<value_t>
    erase(const key_t &p_key)
    {
        const auto l_iter = m_items.find(p_key);

        if (l_iter == m_items.end()) {
            return std::nullopt;
        }

        std::optional<value_t> l_old(std::move(l_iter->second));

        m_items.erase(l_iter);

        return l_old;
    }
};

template<typename key_t, typename value_t, typename hash_t, typename function_t>
auto
dictionary_sync_map(
    const i_dictionary<key_t, value_t, hash_t> &p_dictionary,
    function_t                                  p_fn
) {
    typedef std::invoke_result_t<function_t, const key_t &, const value_t &>
        result_t;

    return map_to_dictionary<dictionary_sync_t<key_t, result_t, hash_t>>(
        p_dictionary.collect(),
        p_fn
    );
}
