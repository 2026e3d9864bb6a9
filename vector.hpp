#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>

#include "pair.hpp"

// Ordered, indexable sequence. Not synchronized, callers that share an
// instance between threads supply their own locking.
template<typename item_t>
class vector_t {
public:
    typedef std::function<bool (const item_t &)>                 predicate_t;
    typedef std::function<bool (const item_t &, const item_t &)> equals_t;
    typedef std::function<int (const item_t &)>                  scorer_t;

    vector_t() {};

    explicit vector_t(std::vector<item_t> p_items):
        m_items(std::move(p_items))
    {};

    vector_t(std::initializer_list<item_t> p_items):
        m_items(p_items)
    {};

    std::size_t
    size() const
    {
        return m_items.size();
    }

    bool
    contains(const predicate_t &p_predicate) const
    {
        return index_of(p_predicate).has_value();
    }

    std::optional<std::size_t>
    index_of(const predicate_t &p_predicate) const
    {
        for (std::size_t l_index = 0; l_index < m_items.size(); l_index++) {
            if (p_predicate(m_items[l_index])) {
                return std::optional<std::size_t>(l_index);
            }
        }

        return std::nullopt;
    }

    std::vector<item_t>
    find(const predicate_t &p_predicate) const
    {
        std::vector<item_t> l_result;

        for (const auto &l_item : m_items) {
            if (p_predicate(l_item)) {
                l_result.push_back(l_item);
            }
        }

        return l_result;
    }

    std::optional<item_t>
    find_one(const predicate_t &p_predicate) const
    {
        const auto l_index = index_of(p_predicate);

        if (l_index.has_value()) {
            return std::optional<item_t>(m_items[l_index.value()]);
        } else {
            return std::nullopt;
        }
    }

    std::optional<item_t>
    get(const std::size_t p_index) const
    {
        if (p_index < m_items.size()) {
            return std::optional<item_t>(m_items[p_index]);
        } else {
            return std::nullopt;
        }
    }

    std::optional<item_t>
    first() const
    {
        return get(0);
    }

    std::optional<item_t>
    last() const
    {
        if (m_items.empty()) {
            return std::nullopt;
        }

        return get(m_items.size() - 1);
    }

    vector_t &
    append(const item_t &p_item)
    {
        m_items.push_back(p_item);

        return *this;
    }

    vector_t &
    append(std::initializer_list<item_t> p_items)
    {
        m_items.insert(m_items.end(), p_items.begin(), p_items.end());

        return *this;
    }

    std::optional<item_t>
    set(const std::size_t p_index, const item_t &p_item)
    {
        if (p_index >= m_items.size()) {
            return std::nullopt;
        }

        std::optional<item_t> l_old(std::move(m_items[p_index]));

        m_items[p_index] = p_item;

        return l_old;
    }

    // appends every item that p_equals does not match against an existing one
    vector_t &
    append_if_absent(
        const equals_t                &p_equals,
        std::initializer_list<item_t>  p_items
    ) {
        for (const auto &l_candidate : p_items) {
            const bool l_present = contains([&](const item_t &l_existing) {
                return p_equals(l_existing, l_candidate);
            });

            if (!l_present) {
                m_items.push_back(l_candidate);
            }
        }

        return *this;
    }

    vector_t &
    merge(const vector_t &p_other)
    {
        m_items.insert(
            m_items.end(),
            p_other.m_items.begin(),
            p_other.m_items.end()
        );

        return *this;
    }

    vector_t
    filter(const predicate_t &p_predicate) const
    {
        return vector_t(find(p_predicate));
    }

    vector_t &
    filter_self(const predicate_t &p_predicate)
    {
        std::erase_if(m_items, [&](const item_t &l_item) {
            return !p_predicate(l_item);
        });

        return *this;
    }

    std::optional<item_t>
    remove(const std::size_t p_index)
    {
        if (p_index >= m_items.size()) {
            return std::nullopt;
        }

        std::optional<item_t> l_old(std::move(m_items[p_index]));

        m_items.erase(m_items.begin() + p_index);

        return l_old;
    }

    vector_t
    slice(const std::size_t p_start, const std::size_t p_end) const
    {
        const auto l_bounds = clamp(p_start, p_end);

        return vector_t(std::vector<item_t>(
            m_items.begin() + l_bounds.first,
            m_items.begin() + l_bounds.second
        ));
    }

    vector_t &
    slice_self(const std::size_t p_start, const std::size_t p_end)
    {
        const auto l_bounds = clamp(p_start, p_end);

        m_items.erase(m_items.begin() + l_bounds.second, m_items.end());
        m_items.erase(m_items.begin(), m_items.begin() + l_bounds.first);

        return *this;
    }

    vector_t &
    unshift(std::initializer_list<item_t> p_items)
    {
        m_items.insert(m_items.begin(), p_items.begin(), p_items.end());

        return *this;
    }

    std::optional<item_t>
    shift()
    {
        return remove(0);
    }

    // Folds items sharing the same p_indexer string with p_merger. Groups
    // keep the position of their first member.
    vector_t &
    join_by(
        const std::function<std::string (const item_t &)>             &p_indexer,
        const std::function<item_t (const item_t &, const item_t &)>  &p_merger
    ) {
        std::unordered_map<std::string, std::size_t> l_groups;
        std::vector<item_t>                          l_joined;

        for (const auto &l_item : m_items) {
            const std::string l_key = p_indexer(l_item);

            const auto l_iter = l_groups.find(l_key);

            if (l_iter != l_groups.end()) {
                l_joined[l_iter->second] =
                    p_merger(l_joined[l_iter->second], l_item);
            } else {
                l_groups[l_key] = l_joined.size();
                l_joined.push_back(l_item);
            }
        }

        m_items = std::move(l_joined);

        return *this;
    }

    vector_t &
    for_each(const std::function<void (std::size_t, const item_t &)> &p_fn)
    {
        for (std::size_t l_index = 0; l_index < m_items.size(); l_index++) {
            p_fn(l_index, m_items[l_index]);
        }

        return *this;
    }

    vector_t &
    map(const std::function<item_t (std::size_t, const item_t &)> &p_fn)
    {
        for (std::size_t l_index = 0; l_index < m_items.size(); l_index++) {
            m_items[l_index] = p_fn(l_index, m_items[l_index]);
        }

        return *this;
    }

    vector_t &
    clean()
    {
        m_items.clear();

        return *this;
    }

    vector_t
    clone() const
    {
        return vector_t(m_items);
    }

    vector_t &
    sort(const std::function<bool (const item_t &, const item_t &)> &p_less)
    {
        std::sort(m_items.begin(), m_items.end(), p_less);

        return *this;
    }

    std::optional<scored_t<item_t>>
    max(const scorer_t &p_scorer) const
    {
        return extremum(p_scorer, [](const int p_score, const int p_best) {
            return p_score >= p_best;
        });
    }

    std::optional<scored_t<item_t>>
    min(const scorer_t &p_scorer) const
    {
        return extremum(p_scorer, [](const int p_score, const int p_best) {
            return p_score <= p_best;
        });
    }

    const std::vector<item_t> &
    collect() const
    {
        return m_items;
    }

    std::string
    join(const std::string &p_separator) const
    {
        if constexpr (std::is_convertible_v<item_t, std::string>) {
            std::vector<std::string> l_strings(m_items.begin(), m_items.end());

            return boost::algorithm::join(l_strings, p_separator);
        } else {
            std::vector<std::string> l_strings;

            l_strings.reserve(m_items.size());

            for (const auto &l_item : m_items) {
                l_strings.push_back(boost::lexical_cast<std::string>(l_item));
            }

            return boost::algorithm::join(l_strings, p_separator);
        }
    }

    std::size_t
    pages(const std::size_t p_size) const
    {
        if (p_size == 0) {
            return 0;
        }

        return (m_items.size() + p_size - 1) / p_size;
    }

    // 1-based, page 0 is read as page 1
    vector_t
    page(std::size_t p_page, const std::size_t p_size) const
    {
        if (p_page == 0) {
            p_page = 1;
        }

        if (p_size == 0 || p_page - 1 > m_items.size() / p_size) {
            return vector_t();
        }

        const std::size_t l_start = (p_page - 1) * p_size;

        return slice(l_start, l_start + std::min(p_size, m_items.size() - l_start));
    }

    typename std::vector<item_t>::const_iterator
    begin() const
    {
        return m_items.begin();
    }

    typename std::vector<item_t>::const_iterator
    end() const
    {
        return m_items.end();
    }

private:
    std::vector<item_t> m_items;

    std::pair<std::size_t, std::size_t>
    clamp(const std::size_t p_start, const std::size_t p_end) const
    {
        const std::size_t l_start = std::min(p_start, m_items.size());
        const std::size_t l_end   =
            std::max(l_start, std::min(p_end, m_items.size()));

        return std::make_pair(l_start, l_end);
    }

    std::optional<scored_t<item_t>>
    extremum(
        const scorer_t                          &p_scorer,
        const std::function<bool (int, int)>    &p_replaces
    ) const {
        if (m_items.empty()) {
            return std::nullopt;
        }

        scored_t<item_t> l_best{ m_items.front(), p_scorer(m_items.front()) };

        for (std::size_t l_index = 1; l_index < m_items.size(); l_index++) {
            const int l_score = p_scorer(m_items[l_index]);

            if (p_replaces(l_score, l_best.m_score)) {
                l_best.m_item  = m_items[l_index];
                l_best.m_score = l_score;
            }
        }

        return std::optional<scored_t<item_t>>(l_best);
    }
};

template<typename item_t, typename function_t>
auto
vector_map(const std::vector<item_t> &p_items, function_t p_fn)
{
    typedef std::invoke_result_t<function_t, const item_t &> result_t;

    std::vector<result_t> l_mapped;

    l_mapped.reserve(p_items.size());

    for (const auto &l_item : p_items) {
        l_mapped.push_back(p_fn(l_item));
    }

    return vector_t<result_t>(std::move(l_mapped));
}

template<typename item_t, typename function_t>
auto
vector_map(const vector_t<item_t> &p_vector, function_t p_fn)
{
    return vector_map(p_vector.collect(), p_fn);
}
