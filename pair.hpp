#pragma once

#include <cstddef>
#include <functional>

#include <boost/functional/hash.hpp>

template<typename key_t, typename value_t>
class pair_t {
public:
    pair_t(const key_t &p_key, const value_t &p_value):
        m_key(p_key),
        m_value(p_value)
    {};

    const key_t &
    key() const
    {
        return m_key;
    }

    const value_t &
    value() const
    {
        return m_value;
    }

    bool
    operator == (const pair_t &p_other) const {
        return ( m_key   == p_other.m_key   )
            && ( m_value == p_other.m_value );
    };

    struct hasher {
        std::size_t
        operator() (const pair_t &p_pair) const
        {
            std::size_t l_seed = 0;

            boost::hash_combine(l_seed, std::hash<key_t>()(p_pair.m_key));
            boost::hash_combine(l_seed, std::hash<value_t>()(p_pair.m_value));

            return l_seed;
        }
    };

private:
    key_t   m_key;
    value_t m_value;
};

// result of a max / min scan, the winning item and the score it got
template<typename item_t>
struct scored_t {
    item_t m_item;
    int    m_score;
};
