/*
================================================================================
 
                             PUBLIC DOMAIN NOTICE
 
  This software is dedicated to the public domain. It is freely available to
  the public for use, and no restriction has been placed on its use or
  reproduction.
 
  Although all reasonable efforts have been taken to ensure the accuracy and
  reliability of this software, the authors do not and cannot warrant the
  performance or results that may be obtained by using this software. The
  authors disclaim all warranties, expressed or implied, including warranties
  of performance, merchantability or fitness for any particular purpose.
 
================================================================================
*/
#ifndef LAZYCOLL_INDEXED_HPP_
#define LAZYCOLL_INDEXED_HPP_

#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <vector>

#include "lazy.hpp"


/////////////////////////////////////////////////////////////////////////////

namespace lazycoll
{

namespace indexed
{

/// \brief A key is already present in its named index.
struct duplicate_index : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// \brief An index value or lookup value is the null key.
struct invalid_index_value : std::invalid_argument
{
    using std::invalid_argument::invalid_argument;
};

/// index name -> key of the item in that index
using index_values = std::map<std::string, lazy::key>;

namespace impl
{
    using types::impl::pr_high;
    using types::impl::pr_low;
    using types::impl::resolve_overload;

    // cb(item, position) if that compiles, else cb(item).
    template<typename F, typename T>
    auto invoke_at(F& fn, const T& item, size_t pos, pr_high) -> decltype(fn(item, pos))
    {
        return fn(item, pos);
    }

    template<typename F, typename T>
    auto invoke_at(F& fn, const T& item, size_t, pr_low) -> decltype(fn(item))
    {
        return fn(item);
    }

    template<typename F, typename T>
    auto proceed(F& fn, const T& item, size_t pos)
        -> typename std::enable_if<std::is_void<decltype(impl::invoke_at(fn, item, pos, resolve_overload{}))>::value, bool>::type
    {
        impl::invoke_at(fn, item, pos, resolve_overload{});
        return true;
    }

    template<typename F, typename T>
    auto proceed(F& fn, const T& item, size_t pos)
        -> typename std::enable_if<!std::is_void<decltype(impl::invoke_at(fn, item, pos, resolve_overload{}))>::value, bool>::type
    {
        return !lazy::impl::is_false(impl::invoke_at(fn, item, pos, resolve_overload{}));
    }
}

/////////////////////////////////////////////////////////////////////////////
/// \brief Ordered item container with unique secondary indexes.
///
/// Each item may be registered under any number of named indexes
/// (e.g. "id" -> 42, "sku" -> "A-100"); within an index a key identifies
/// at most one item. Optionally typed: with a validator, add() rejects
/// items that fail it.
///
/// Items live in stable slots; the order of slots is the iteration order.
/*!
@code
    indexed::collection<user> users{ "Users", types::implementing<user>() };

    users.add(alice, { { "id", 1 }, { "email", "alice@example.com" } });
    users.add(bob,   { { "id", 2 } });

    auto u = users.get_by("email", "alice@example.com");
    auto found = users.get_by("id", std::vector<lazy::key>{ 2, 3, 2 }); // {bob}
@endcode
*/
template<typename T>
class collection
{
public:
    using value_type = T;

    /// Forward iterator over the items, in order.
    class const_iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using   difference_type = std::ptrdiff_t;
        using        value_type = T;
        using           pointer = const T*;
        using         reference = const T&;

        const_iterator(const collection* coll, std::vector<size_t>::const_iterator it)
            : m_coll{ coll }
            , m_it{ it }
        {}

        reference operator*() const
        {
            return m_coll->m_items.at(*m_it);
        }

        pointer operator->() const
        {
            return &**this;
        }

        const_iterator& operator++()
        {
            ++m_it;
            return *this;
        }

        const_iterator operator++(int)
        {
            auto ret = *this;
            ++m_it;
            return ret;
        }

        bool operator==(const const_iterator& other) const
        {
            return m_it == other.m_it;
        }

        bool operator!=(const const_iterator& other) const
        {
            return !(*this == other);
        }

    private:
        const collection* m_coll;
        std::vector<size_t>::const_iterator m_it;
    };

    /// Untyped: any item is accepted.
    collection() = default;

    /// Typed: add() throws lazy::type_mismatch for items rejected by item_type.
    collection(std::string name, types::validator<T> item_type)
        : m_name{ std::move(name) }
        , m_item_type{ std::move(item_type) }
        , m_typed{ true }
    {}

    /////////////////////////////////////////////////////////////////////////
    /// \brief Append an item, registering it under the given indexes.
    ///
    /// Throws lazy::type_mismatch, invalid_index_value (null key), or
    /// duplicate_index. Everything is checked before anything is inserted,
    /// so a failed add leaves the collection unchanged.
    void add(T item, const index_values& indexes = {})
    {
        if(m_typed && !m_item_type(item)) {
            throw lazy::type_mismatch{ m_name, m_item_type.name(), types::describe(item), lazy::key{ m_order.size() } };
        }

        for(const auto& kv : indexes) {
            assert_valid(kv.second);

            const auto idx = m_indexes.find(kv.first);
            if(idx != m_indexes.end() && idx->second.count(kv.second) != 0) {
                LAZYCOLL_THROW(duplicate_index, "Index \"" + kv.first + ":" + kv.second.to_string() + "\" already exists.");
            }
        }

        const size_t slot = m_next_slot++;
        m_items.emplace(slot, std::move(item));
        m_order.push_back(slot);

        for(const auto& kv : indexes) {
            m_indexes[kv.first].emplace(kv.second, slot);
        }
    }

    /// Adds each value of seq, without indexes.
    void add_all(const lazy::collection<T>& seq)
    {
        seq.each([this](const T& item)
        {
            add(item);
        });
    }

    /// Item registered under key in the named index, or default_value.
    /// An unknown index name yields default_value; a null key throws invalid_index_value.
    T get_by(const std::string& index_name, const lazy::key& k, T default_value = T()) const
    {
        assert_valid(k);

        const auto idx = m_indexes.find(index_name);
        if(idx == m_indexes.end()) {
            return default_value;
        }

        const auto it = idx->second.find(k);
        if(it == idx->second.end()) {
            return default_value;
        }
        return m_items.at(it->second);
    }

    /// Items registered under any of the keys, in the order of their first request.
    /// Repeated keys are looked up once; keys with no item are skipped.
    std::vector<T> get_by(const std::string& index_name, const std::vector<lazy::key>& keys) const
    {
        std::vector<lazy::key> unique_keys{};
        for(const auto& k : keys) {
            if(std::find(unique_keys.begin(), unique_keys.end(), k) == unique_keys.end()) {
                unique_keys.push_back(k);
            }
        }

        std::vector<T> ret{};
        const auto idx = m_indexes.find(index_name);

        for(const auto& k : unique_keys) {
            assert_valid(k);

            if(idx == m_indexes.end()) {
                continue;
            }

            const auto it = idx->second.find(k);
            if(it != idx->second.end()) {
                ret.push_back(m_items.at(it->second));
            }
        }
        return ret;
    }

    /// Removes the first item equal to item, and its index entries.
    bool remove(const T& item)
    {
        const auto it = find(item);
        if(it == m_order.end()) {
            return false;
        }

        const size_t slot = *it;
        m_order.erase(it);
        erase_slot(slot);
        return true;
    }

    bool has(const T& item) const
    {
        return find(item) != m_order.end();
    }

    void reverse()
    {
        std::reverse(m_order.begin(), m_order.end());
    }

    /// fn(item, position) or fn(item) for each item; stops when fn returns bool false.
    template<typename F>
    void each(F fn) const
    {
        for(size_t pos = 0; pos < m_order.size(); pos++) {
            if(!impl::proceed(fn, m_items.at(m_order[pos]), pos)) {
                break;
            }
        }
    }

    lazy::maybe<T> first() const
    {
        if(m_order.empty()) {
            return { };
        }
        return { m_items.at(m_order.front()) };
    }

    lazy::maybe<T> last() const
    {
        if(m_order.empty()) {
            return { };
        }
        return { m_items.at(m_order.back()) };
    }

    /// Removes and returns the last item, with its index entries.
    lazy::maybe<T> pop()
    {
        if(m_order.empty()) {
            return { };
        }

        const size_t slot = m_order.back();
        m_order.pop_back();
        return take(slot);
    }

    /// Removes and returns the first item, with its index entries.
    lazy::maybe<T> shift()
    {
        if(m_order.empty()) {
            return { };
        }

        const size_t slot = m_order.front();
        m_order.erase(m_order.begin());
        return take(slot);
    }

    void clear()
    {
        m_items.clear();
        m_order.clear();
        m_indexes.clear();
        m_next_slot = 0;
    }

    size_t count() const
    {
        return m_order.size();
    }

    bool empty() const
    {
        return m_order.empty();
    }

    std::vector<T> to_array() const
    {
        std::vector<T> ret{};
        ret.reserve(m_order.size());
        for(const auto slot : m_order) {
            ret.push_back(m_items.at(slot));
        }
        return ret;
    }

    /// Snapshot of the items as a lazy collection keyed 0..n-1.
    lazy::collection<T> to_lazy(bool use_cache = false) const
    {
        return lazy::collection<T>::create(to_array(), use_cache);
    }

    const_iterator begin() const
    {
        return { this, m_order.begin() };
    }

    const_iterator end() const
    {
        return { this, m_order.end() };
    }

private:
    static void assert_valid(const lazy::key& k)
    {
        if(k.is_null()) {
            LAZYCOLL_THROW(invalid_index_value, "Index value must be string or integer.");
        }
    }

    std::vector<size_t>::const_iterator find(const T& item) const
    {
        return std::find_if(m_order.begin(), m_order.end(), [&](size_t slot)
        {
            return m_items.at(slot) == item;
        });
    }

    lazy::maybe<T> take(size_t slot)
    {
        lazy::maybe<T> ret{ std::move(m_items.at(slot)) };
        erase_slot(slot);
        return ret;
    }

    // Drop the item and every index entry pointing at its slot.
    void erase_slot(size_t slot)
    {
        m_items.erase(slot);

        for(auto idx = m_indexes.begin(); idx != m_indexes.end(); ) {
            auto& keys = idx->second;
            for(auto it = keys.begin(); it != keys.end(); ) {
                it = it->second == slot ? keys.erase(it) : std::next(it);
            }
            idx = keys.empty() ? m_indexes.erase(idx) : std::next(idx);
        }
    }

    using index_t = std::map<lazy::key, size_t>; // key -> slot

             std::string m_name      = "collection";
     types::validator<T> m_item_type = {};
                    bool m_typed     = false;

    std::map<size_t, T> m_items     = {};   // slot -> item
     std::vector<size_t> m_order     = {};
    std::map<std::string, index_t> m_indexes = {};
                  size_t m_next_slot = 0;
};

} // namespace indexed
} // namespace lazycoll

/////////////////////////////////////////////////////////////////////////////
#if LAZYCOLL_INDEXED_ENABLE_RUN_TESTS
#include <iostream>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) LAZYCOLL_THROW(std::logic_error, "Assertion failed: ( "#expr" ).");
#endif

namespace lazycoll
{
namespace indexed
{
namespace impl
{

struct user
{
    std::string name;
    int age;

    bool operator==(const user& other) const
    {
        return name == other.name && age == other.age;
    }
};

// Throws if expr does not throw exception_t.
#define VERIFY_THROWS(exception_t, expr)              \
    {{                                                \
        bool thrown = false;                          \
        try {                                         \
            expr;                                     \
        } catch(const exception_t&) {                 \
            thrown = true;                            \
        }                                             \
        VERIFY(thrown);                               \
    }}

static void run_tests()
{
    std::cerr << "Testing indexed...\n";

    const user alice{ "alice", 30 };
    const user bob{ "bob", 25 };
    const user carol{ "carol", 41 };

    // add, get_by
    {{
        collection<user> users{};
        users.add(alice, { { "id", 1 }, { "email", "alice@example.com" } });
        users.add(bob,   { { "id", 2 } });
        users.add(carol);

        VERIFY(users.count() == 3);
        VERIFY(users.get_by("id", 2) == bob);
        VERIFY(users.get_by("email", "alice@example.com") == alice);
        VERIFY(users.get_by("id", 9, carol) == carol);
        VERIFY(users.get_by("no-such-index", 1, carol) == carol);
        VERIFY(users.get_by("id", "1").name.empty()); // keys are compared strictly

        VERIFY_THROWS(invalid_index_value, users.get_by("id", lazy::key{}));
    }}

    // duplicate index keys
    {{
        collection<user> users{};
        users.add(alice, { { "id", 1 } });
        users.add(bob,   { { "sku", 1 } }); // same key in a different index

        VERIFY_THROWS(duplicate_index, users.add(carol, { { "email", "carol@example.com" }, { "id", 1 } }));

        // failed add leaves the collection unchanged
        VERIFY(users.count() == 2);
        VERIFY(users.get_by("email", "carol@example.com", bob) == bob);

        VERIFY_THROWS(invalid_index_value, users.add(carol, { { "id", lazy::key{} } }));
        VERIFY(users.count() == 2);
    }}

    // lookups by a list of keys
    {{
        collection<user> users{};
        users.add(alice, { { "id", 1 } });
        users.add(bob,   { { "id", 2 } });
        users.add(carol, { { "id", "c" } });

        const auto res = users.get_by("id", std::vector<lazy::key>{ "c", 7, 1, "c", 1 });
        VERIFY((res == std::vector<user>{ carol, alice }));

        VERIFY(users.get_by("no-such-index", std::vector<lazy::key>{ 1, 2 }).empty());
        VERIFY_THROWS(invalid_index_value, users.get_by("id", std::vector<lazy::key>{ 1, lazy::key{} }));
    }}

    // typed
    {{
        collection<int> ints{ "Numbers", types::named<int>("int") };
        ints.add(1);

        bool thrown = false;
        try {
            collection<std::string> words{ "Words", types::of<std::string>(types::char_class::alpha) };
            words.add("abc");
            words.add("a1");
        } catch(const lazy::type_mismatch& e) {
            thrown = true;
            VERIFY(e.declaring() == "Words");
            VERIFY(e.expected() == "alpha");
            VERIFY(e.at() == 1);
        }
        VERIFY(thrown);
    }}

    // remove, has
    {{
        collection<user> users{};
        users.add(alice, { { "id", 1 } });
        users.add(bob,   { { "id", 2 }, { "nick", "b" } });

        VERIFY( users.has(bob));
        VERIFY( users.remove(bob));
        VERIFY(!users.has(bob));
        VERIFY(!users.remove(bob));
        VERIFY(users.count() == 1);

        // index entries are gone too, so the keys can be reused
        VERIFY(users.get_by("id", 2, carol) == carol);
        users.add(carol, { { "id", 2 }, { "nick", "b" } });
        VERIFY(users.get_by("nick", "b") == carol);
    }}

    // ordering: reverse, each, first, last, pop, shift
    {{
        collection<user> users{};
        users.add(alice, { { "id", 1 } });
        users.add(bob,   { { "id", 2 } });
        users.add(carol, { { "id", 3 } });

        users.reverse();
        VERIFY((users.to_array() == std::vector<user>{ carol, bob, alice }));
        VERIFY(*users.first() == carol);
        VERIFY(*users.last() == alice);

        std::vector<std::string> seen{};
        users.each([&](const user& u, size_t pos)
        {
            seen.push_back(std::to_string(pos) + u.name);
            return u.name != "bob";
        });
        VERIFY((seen == std::vector<std::string>{ "0carol", "1bob" }));

        size_t n = 0;
        users.each([&](const user&) { ++n; return 0; });
        VERIFY(n == 3);

        auto popped = users.pop();
        VERIFY(popped && *popped == alice);
        VERIFY(users.get_by("id", 1, bob) == bob);

        auto shifted = users.shift();
        VERIFY(shifted && *shifted == carol);
        VERIFY(users.get_by("id", 3, alice) == alice);

        VERIFY((users.to_array() == std::vector<user>{ bob }));
    }}

    // empty collection
    {{
        collection<user> users{};
        VERIFY(users.empty());
        VERIFY(!users.first());
        VERIFY(!users.last());
        VERIFY(!users.pop());
        VERIFY(!users.shift());
        VERIFY(users.begin() == users.end());

        users.add(alice, { { "id", 1 } });
        users.clear();
        VERIFY(users.count() == 0);
        users.add(alice, { { "id", 1 } });
        VERIFY(users.get_by("id", 1) == alice);
    }}

    // iteration, lazy interop
    {{
        collection<int> ints{};
        ints.add_all(lazy::collection<int>::create({ 3, 1, 2 }).filter([](int x) { return x != 1; }));
        ints.add(4);

        int sum = 0;
        for(const int x : ints) {
            sum = sum * 10 + x;
        }
        VERIFY(sum == 324);

        const auto seq = ints.to_lazy(true).map([](int x) { return x * 2; });
        VERIFY(seq.use_cache());
        VERIFY((seq.to_array() == lazy::ordered_map<int>{ { 0, 6 }, { 1, 4 }, { 2, 8 } }));

        // to_lazy is a snapshot
        ints.clear();
        VERIFY(seq.count() == 3);
    }}

    std::cerr << "indexed: OK\n";

} // run_tests()

} // namespace impl
} // namespace indexed
} // namespace lazycoll

#endif // LAZYCOLL_INDEXED_ENABLE_RUN_TESTS

#endif // LAZYCOLL_INDEXED_HPP_
