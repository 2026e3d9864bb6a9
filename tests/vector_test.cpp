#include <cassert>
#include <limits>
#include <string>

#include "vector.hpp"

static void
test_size()
{
    vector_t<int> l_vector;

    l_vector.append(0);

    assert(l_vector.size() == 1);
}

static void
test_contains()
{
    vector_t<int> l_vector;

    l_vector.append(0);

    assert(l_vector.contains([](const int p_item) { return p_item == 0; }));
    assert(!l_vector.contains([](const int p_item) { return p_item == 9; }));
}

static void
test_get_out_of_range()
{
    const vector_t<int> l_vector{ 1, 2, 3 };

    assert(l_vector.get(1) == std::optional<int>(2));
    assert(l_vector.get(3).has_value() == false);
    assert(l_vector.first() == std::optional<int>(1));
    assert(l_vector.last() == std::optional<int>(3));
    assert(vector_t<int>().last().has_value() == false);
}

static void
test_remove_and_shift()
{
    vector_t<std::string> l_vector{ "a", "b", "c" };

    assert(l_vector.remove(1) == std::optional<std::string>("b"));
    assert(l_vector.size() == 2);
    assert(l_vector.get(1) == std::optional<std::string>("c"));
    assert(l_vector.remove(5).has_value() == false);

    assert(l_vector.shift() == std::optional<std::string>("a"));
    assert(l_vector.shift() == std::optional<std::string>("c"));
    assert(l_vector.shift().has_value() == false);
}

static void
test_index_of()
{
    const vector_t<int> l_vector{ 4, 5, 6 };

    assert(l_vector.index_of([](const int p_item) { return p_item == 6; })
        == std::optional<std::size_t>(2));
    assert(!l_vector.index_of([](const int p_item) { return p_item == 7; })
        .has_value());
}

static void
test_set()
{
    vector_t<int> l_vector{ 1, 2 };

    assert(l_vector.set(0, 10) == std::optional<int>(1));
    assert(l_vector.get(0) == std::optional<int>(10));
    assert(l_vector.set(2, 3).has_value() == false);
    assert(l_vector.size() == 2);
}

static void
test_unshift_and_append_if_absent()
{
    vector_t<int> l_vector{ 3 };

    l_vector.unshift({ 1, 2 });

    assert(l_vector.collect() == std::vector<int>({ 1, 2, 3 }));

    l_vector.append_if_absent(
        [](const int p_left, const int p_right) { return p_left == p_right; },
        { 2, 4 }
    );

    assert(l_vector.collect() == std::vector<int>({ 1, 2, 3, 4 }));
}

static void
test_slice_clamps()
{
    const vector_t<int> l_vector{ 1, 2, 3, 4, 5 };

    assert(l_vector.slice(1, 3).collect() == std::vector<int>({ 2, 3 }));
    assert(l_vector.slice(3, 100).collect() == std::vector<int>({ 4, 5 }));
    assert(l_vector.slice(10, 20).size() == 0);
    assert(l_vector.slice(4, 2).size() == 0);

    vector_t<int> l_copy = l_vector.clone();

    l_copy.slice_self(1, 4);

    assert(l_copy.collect() == std::vector<int>({ 2, 3, 4 }));
    assert(l_vector.size() == 5);
}

static void
test_pagination()
{
    const vector_t<int> l_vector{ 1, 2, 3, 4, 5, 6, 7 };

    assert(l_vector.pages(3) == 3);
    assert(l_vector.pages(7) == 1);
    assert(l_vector.pages(0) == 0);
    assert(l_vector.page(1, 3).collect() == std::vector<int>({ 1, 2, 3 }));
    assert(l_vector.page(0, 3).collect() == std::vector<int>({ 1, 2, 3 }));
    assert(l_vector.page(3, 3).collect() == std::vector<int>({ 7 }));
    assert(l_vector.page(4, 3).size() == 0);
    assert(l_vector.page(3, 0).size() == 0);
}

static void
test_page_far_past_the_end()
{
    const vector_t<int> l_vector{ 1, 2, 3, 4, 5, 6, 7 };

    const std::size_t l_huge = std::numeric_limits<std::size_t>::max();

    assert(l_vector.page(l_huge, 3).size() == 0);
    assert(l_vector.page(l_huge / 2 + 1, 2).size() == 0);
    assert(l_vector.page(1, l_huge).collect() == l_vector.collect());
}

static void
test_filter()
{
    vector_t<int> l_vector{ 1, 2, 3, 4 };

    const auto l_even = l_vector.filter([](const int p_item) {
        return p_item % 2 == 0;
    });

    assert(l_even.collect() == std::vector<int>({ 2, 4 }));
    assert(l_vector.size() == 4);

    l_vector.filter_self([](const int p_item) { return p_item > 2; });

    assert(l_vector.collect() == std::vector<int>({ 3, 4 }));
}

static void
test_map_and_sort()
{
    vector_t<int> l_vector{ 3, 1, 2 };

    l_vector
        .map([](const std::size_t p_index, const int p_item) {
            return p_item * 10 + static_cast<int>(p_index);
        })
        .sort([](const int p_left, const int p_right) {
            return p_left < p_right;
        });

    assert(l_vector.collect() == std::vector<int>({ 11, 22, 30 }));
}

static void
test_join()
{
    const vector_t<std::string> l_strings{ "a", "b", "c" };
    const vector_t<int>         l_numbers{ 1, 2, 3 };

    assert(l_strings.join(", ") == "a, b, c");
    assert(l_numbers.join("-") == "1-2-3");
    assert(vector_t<int>().join(",") == "");
}

static void
test_join_by()
{
    vector_t<std::pair<std::string, int>> l_vector{
        { "a", 1 },
        { "b", 2 },
        { "a", 3 }
    };

    l_vector.join_by(
        [](const std::pair<std::string, int> &p_item) { return p_item.first; },
        [](
            const std::pair<std::string, int> &p_left,
            const std::pair<std::string, int> &p_right
        ) {
            return std::make_pair(p_left.first, p_left.second + p_right.second);
        }
    );

    assert(l_vector.size() == 2);
    assert(l_vector.get(0) == std::make_optional(std::make_pair(std::string("a"), 4)));
    assert(l_vector.get(1) == std::make_optional(std::make_pair(std::string("b"), 2)));
}

static void
test_max_min()
{
    const vector_t<int> l_vector{ 4, 9, 1, 9 };

    const auto l_max = l_vector.max([](const int p_item) { return p_item; });
    const auto l_min = l_vector.min([](const int p_item) { return p_item; });

    assert(l_max.has_value() && l_max->m_score == 9);
    assert(l_min.has_value() && l_min->m_item == 1 && l_min->m_score == 1);

    assert(!vector_t<int>().max([](const int p_item) { return p_item; })
        .has_value());
}

static void
test_vector_map()
{
    const vector_t<int> l_vector{ 1, 2 };

    const vector_t<std::string> l_mapped = vector_map(l_vector, [](const int p_item) {
        return std::to_string(p_item * 2);
    });

    assert(l_mapped.collect() == std::vector<std::string>({ "2", "4" }));

    const std::vector<std::string> l_words{ "go", "rust" };

    const vector_t<std::size_t> l_lengths = vector_map(
        l_words,
        [](const std::string &p_word) { return p_word.size(); }
    );

    assert(l_lengths.collect() == std::vector<std::size_t>({ 2, 4 }));
}

int
main()
{
    test_size();
    test_contains();
    test_get_out_of_range();
    test_remove_and_shift();
    test_index_of();
    test_set();
    test_unshift_and_append_if_absent();
    test_slice_clamps();
    test_pagination();
    test_page_far_past_the_end();
    test_filter();
    test_map_and_sort();
    test_join();
    test_join_by();
    test_max_min();
    test_vector_map();

    return 0;
}
