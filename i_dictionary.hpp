#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pair.hpp"
#include "vector.hpp"

// Common surface of dictionary_t, dictionary_sync_t and dictionary_limited_t.
// Absence is always reported through an empty optional, put style calls
// return the previous value when there was one.
template<
    typename key_t,
    typename value_t,
    typename hash_t = std::hash<key_t>
>
class i_dictionary {
public:
    typedef std::unordered_map<key_t, value_t, hash_t> map_t;
    typedef pair_t<key_t, value_t>                     entry_t;

    typedef std::function<bool (const key_t &, const value_t &)>    predicate_t;
    typedef std::function<void (const key_t &, const value_t &)>    visitor_t;
    typedef std::function<value_t (const key_t &, const value_t &)> mapper_t;
    typedef std::function<int (const key_t &, const value_t &)>     scorer_t;
    typedef std::function<key_t (const value_t &)>                  key_fn_t;

    virtual ~i_dictionary() {};

    virtual std::size_t size() const = 0;

    virtual bool exists(const key_t &p_key) const = 0;

    virtual std::vector<value_t> find(const predicate_t &p_predicate) const = 0;

    virtual std::optional<value_t>
    find_one(const predicate_t &p_predicate) const = 0;

    virtual std::optional<value_t> get(const key_t &p_key) const = 0;

    virtual std::optional<value_t>
    put(const key_t &p_key, const value_t &p_value) = 0;

    virtual std::optional<value_t>
    put_if_absent(const key_t &p_key, const value_t &p_value) = 0;

    virtual i_dictionary &put_all(const map_t &p_items) = 0;

    i_dictionary &
    merge(const i_dictionary &p_other)
    {
        return put_all(p_other.collect());
    }

    virtual std::unique_ptr<i_dictionary>
    filter(const predicate_t &p_predicate) const = 0;

    virtual i_dictionary &filter_self(const predicate_t &p_predicate) = 0;

    virtual std::optional<value_t> remove(const key_t &p_key) = 0;

    virtual i_dictionary &for_each(const visitor_t &p_visitor) = 0;

    virtual i_dictionary &map(const mapper_t &p_mapper) = 0;

    virtual i_dictionary &clean() = 0;

    virtual std::unique_ptr<i_dictionary> clone() const = 0;

    virtual std::optional<scored_t<entry_t>>
    max(const scorer_t &p_scorer) const = 0;

    virtual std::optional<scored_t<entry_t>>
    min(const scorer_t &p_scorer) const = 0;

    virtual std::vector<key_t> keys() const = 0;

    vector_t<key_t>
    keys_vector() const
    {
        return vector_t<key_t>(keys());
    }

    virtual std::vector<value_t> values() const = 0;

    vector_t<value_t>
    values_vector() const
    {
        return vector_t<value_t>(values());
    }

    virtual std::vector<entry_t> pairs() const = 0;

    virtual map_t collect() const = 0;

protected:
    // Shared scan behind every max / min. Ties replace the running best, so
    // with an unordered backing map the tie winner is unspecified.
    static std::optional<scored_t<entry_t>>
    scan_extremum(
        const map_t                            &p_items,
        const scorer_t                         &p_scorer,
        const bool                              p_maximum
    ) {
        std::optional<scored_t<entry_t>> l_best;

        for (const auto &l_iter : p_items) {
            const int l_score = p_scorer(l_iter.first, l_iter.second);

            const bool l_replace = !l_best.has_value() || (p_maximum ?
                l_score >= l_best->m_score : l_score <= l_best->m_score);

            if (l_replace) {
                l_best.emplace(scored_t<entry_t>{
                    entry_t(l_iter.first, l_iter.second),
                    l_score
                });
            }
        }

        return l_best;
    }
};

// Builds a dictionary_out_t from p_items with every value replaced by
// p_fn(key, value). The value type may change.
template<
    typename dictionary_out_t,
    typename key_t,
    typename value_t,
    typename hash_t,
    typename function_t
>
dictionary_out_t
map_to_dictionary(
    const std::unordered_map<key_t, value_t, hash_t> &p_items,
    function_t                                        p_fn
) {
    typename dictionary_out_t::map_t l_mapped;

    for (const auto &l_iter : p_items) {
        l_mapped.emplace(l_iter.first, p_fn(l_iter.first, l_iter.second));
    }

    return dictionary_out_t(std::move(l_mapped));
}

// Builds a dictionary_out_t from a sequence, p_fn yields a std::pair of key
// and value for every item. Later items win on duplicate keys.
template<typename dictionary_out_t, typename item_t, typename function_t>
dictionary_out_t
list_map_to_dictionary(const std::vector<item_t> &p_items, function_t p_fn)
{
    typename dictionary_out_t::map_t l_mapped;

    for (const auto &l_item : p_items) {
        auto l_entry = p_fn(l_item);

        l_mapped[l_entry.first] = l_entry.second;
    }

    return dictionary_out_t(std::move(l_mapped));
}

template<typename dictionary_out_t, typename item_t, typename function_t>
dictionary_out_t
vector_map_to_dictionary(const vector_t<item_t> &p_items, function_t p_fn)
{
    return list_map_to_dictionary<dictionary_out_t>(p_items.collect(), p_fn);
}
