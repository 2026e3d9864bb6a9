#include <cassert>
#include <string>
#include <unordered_set>

#include "dictionary.hpp"

struct lang_t {
    std::string m_name;
    int         m_score;
};

static dictionary_t<std::string, int>
numbered(const int p_count)
{
    dictionary_t<std::string, int> l_dictionary;

    for (int l_index = 1; l_index <= p_count; l_index++) {
        l_dictionary.put(std::to_string(l_index), l_index);
    }

    return l_dictionary;
}

static void
test_put_reports_previous_value()
{
    dictionary_t<std::string, int> l_dictionary;

    assert(l_dictionary.put("a", 0).has_value() == false);
    assert(l_dictionary.put("a", 5) == std::optional<int>(0));
    assert(l_dictionary.get("a") == std::optional<int>(5));
    assert(l_dictionary.get("b").has_value() == false);
}

static void
test_put_if_absent()
{
    dictionary_t<std::string, int> l_dictionary;

    assert(l_dictionary.put_if_absent("a", 1).has_value() == false);
    assert(l_dictionary.put_if_absent("a", 2) == std::optional<int>(1));
    assert(l_dictionary.get("a") == std::optional<int>(1));
}

static void
test_remove()
{
    dictionary_t<std::string, int> l_dictionary = numbered(3);

    assert(l_dictionary.remove("2") == std::optional<int>(2));
    assert(l_dictionary.remove("2").has_value() == false);
    assert(l_dictionary.size() == 2);
    assert(l_dictionary.exists("2") == false);
}

static void
test_find()
{
    const dictionary_t<std::string, int> l_dictionary = numbered(6);

    const auto l_even = l_dictionary.find([](const std::string &, const int &p_value) {
        return p_value % 2 == 0;
    });

    assert(l_even.size() == 3);

    const auto l_one = l_dictionary.find_one([](const std::string &p_key, const int &) {
        return p_key == "4";
    });

    assert(l_one == std::optional<int>(4));

    assert(!l_dictionary.find_one([](const std::string &, const int &p_value) {
        return p_value > 100;
    }).has_value());
}

static void
test_filter_leaves_original()
{
    dictionary_t<std::string, int> l_dictionary = numbered(4);

    const auto l_filtered = l_dictionary.filter([](const std::string &, const int &p_value) {
        return p_value > 2;
    });

    assert(l_filtered->size() == 2);
    assert(l_dictionary.size() == 4);

    l_dictionary.filter_self([](const std::string &, const int &p_value) {
        return p_value <= 1;
    });

    assert(l_dictionary.size() == 1);
    assert(l_dictionary.exists("1"));
}

static void
test_map_in_place()
{
    dictionary_t<std::string, int> l_dictionary = numbered(3);

    l_dictionary.map([](const std::string &, const int &p_value) {
        return p_value * 10;
    });

    assert(l_dictionary.get("3") == std::optional<int>(30));
}

static void
test_dictionary_map()
{
    const dictionary_t<std::string, int> l_dictionary = numbered(11);

    const auto l_mapped = dictionary_map(
        l_dictionary,
        [](const std::string &, const int &p_value) {
            return "value-" + std::to_string(p_value);
        }
    );

    assert(l_mapped.get("1") == std::optional<std::string>("value-1"));
    assert(l_mapped.size() == 11);
}

static void
test_list_map_to_dictionary()
{
    const std::vector<std::string> l_items{ "go", "rust", "zig" };

    const auto l_dictionary =
        list_map_to_dictionary<dictionary_t<std::string, std::size_t>>(
            l_items,
            [](const std::string &p_item) {
                return std::make_pair(p_item, p_item.size());
            }
        );

    assert(l_dictionary.get("rust") == std::optional<std::size_t>(4));

    const auto l_from_vector =
        vector_map_to_dictionary<dictionary_t<std::size_t, std::string>>(
            vector_t<std::string>(l_items),
            [](const std::string &p_item) {
                return std::make_pair(p_item.size(), p_item);
            }
        );

    assert(l_from_vector.size() == 3);
    assert(l_from_vector.get(4) == std::optional<std::string>("rust"));
}

static void
test_from_list()
{
    const std::vector<lang_t> l_items{
        { "Golang", 30 },
        { "Rust",   25 },
        { "Golang", 35 }
    };

    const dictionary_t<std::string, lang_t> l_dictionary(
        l_items,
        [](const lang_t &p_item) { return p_item.m_name; }
    );

    assert(l_dictionary.size() == 2);
    assert(l_dictionary.get("Golang")->m_score == 35);
}

static void
test_max()
{
    const dictionary_t<std::string, int> l_dictionary(
        dictionary_t<std::string, int>::map_t{ { "a", 1 }, { "b", 3 }, { "c", 2 } }
    );

    const auto l_max = l_dictionary.max([](const std::string &, const int &p_value) {
        return p_value;
    });

    assert(l_max.has_value());
    assert(l_max->m_item.key() == "b");
    assert(l_max->m_item.value() == 3);
    assert(l_max->m_score == 3);
}

static void
test_min()
{
    const dictionary_t<std::string, int> l_dictionary(
        dictionary_t<std::string, int>::map_t{ { "a", 1 }, { "b", 3 }, { "c", 2 } }
    );

    const auto l_min = l_dictionary.min([](const std::string &, const int &p_value) {
        return p_value;
    });

    assert(l_min.has_value());
    assert(l_min->m_item.key() == "a");
    assert(l_min->m_score == 1);
}

static void
test_max_min_empty()
{
    const dictionary_t<std::string, int> l_dictionary;

    const auto l_scorer = [](const std::string &, const int &p_value) {
        return p_value;
    };

    assert(l_dictionary.max(l_scorer).has_value() == false);
    assert(l_dictionary.min(l_scorer).has_value() == false);
}

static void
test_max_min_with_scorer()
{
    const dictionary_t<std::string, lang_t> l_dictionary(
        dictionary_t<std::string, lang_t>::map_t{
            { "go",   { "Golang", 30 } },
            { "rust", { "Rust",   25 } },
            { "zig",  { "Zig",    40 } }
        }
    );

    const auto l_scorer = [](const std::string &, const lang_t &p_value) {
        return p_value.m_score;
    };

    const auto l_max = l_dictionary.max(l_scorer);
    const auto l_min = l_dictionary.min(l_scorer);

    assert(l_max->m_item.key() == "zig" && l_max->m_score == 40);
    assert(l_max->m_item.value().m_name == "Zig");
    assert(l_min->m_item.key() == "rust" && l_min->m_score == 25);
}

static void
test_max_with_ties_returns_true_maximum()
{
    const dictionary_t<std::string, int> l_dictionary(
        dictionary_t<std::string, int>::map_t{ { "a", 7 }, { "b", 7 }, { "c", 1 } }
    );

    const auto l_max = l_dictionary.max([](const std::string &, const int &p_value) {
        return p_value;
    });

    assert(l_max->m_score == 7);
    assert(l_max->m_item.key() == "a" || l_max->m_item.key() == "b");
}

static void
test_merge_and_collect()
{
    dictionary_t<std::string, int> l_left  = numbered(2);
    dictionary_t<std::string, int> l_right(
        dictionary_t<std::string, int>::map_t{ { "2", 20 }, { "3", 30 } }
    );

    l_left.merge(l_right);

    const auto l_items = l_left.collect();

    assert(l_items.size() == 3);
    assert(l_items.at("2") == 20);
    assert(l_left.keys_vector().size() == 3);
    assert(l_left.values_vector().size() == 3);
    assert(l_left.pairs().size() == 3);
}

static void
test_clone_is_independent()
{
    dictionary_t<std::string, int> l_dictionary = numbered(2);

    const auto l_clone = l_dictionary.clone();

    l_dictionary.clean();

    assert(l_dictionary.size() == 0);
    assert(l_clone->size() == 2);
}

static void
test_pair_hasher()
{
    typedef pair_t<std::string, int> entry_t;

    std::unordered_set<entry_t, entry_t::hasher> l_set;

    l_set.insert(entry_t("a", 1));
    l_set.insert(entry_t("a", 1));
    l_set.insert(entry_t("a", 2));

    assert(l_set.size() == 2);
}

int
main()
{
    test_put_reports_previous_value();
    test_put_if_absent();
    test_remove();
    test_find();
    test_filter_leaves_original();
    test_map_in_place();
    test_dictionary_map();
    test_list_map_to_dictionary();
    test_from_list();
    test_max();
    test_min();
    test_max_min_empty();
    test_max_min_with_scorer();
    test_max_with_ties_returns_true_maximum();
    test_merge_and_collect();
    test_clone_is_independent();
    test_pair_hasher();

    return 0;
}
