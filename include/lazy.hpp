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
#ifndef LAZYCOLL_LAZY_HPP_
#define LAZYCOLL_LAZY_HPP_

#include <stdexcept>
#include <algorithm>
#include <functional>
#include <memory>
#include <vector>
#include <map>
#include <string>
#include <sstream>
#include <iterator>
#include <initializer_list>
#include <type_traits>
#include <utility>
#include <new>
#include <cstdint>
#include <cstdlib>
#include <cstddef>
#include <cassert>

#include "types.hpp"

namespace lazycoll
{

/// @brief Lazy, chainable collections over ordered key->value streams.
namespace lazy
{

namespace impl
{
    using types::impl::pr_lowest;
    using types::impl::pr_low;
    using types::impl::pr_high;
    using types::impl::pr_highest;
    using types::impl::resolve_overload;

    using types::impl::cat;
    using types::impl::cat_tag;
    using types::impl::category_tag;
}

    /////////////////////////////////////////////////////////////////////////
    /// Very bare-bones version of std::optional-like with rebinding assignment semantics.
    ///
    /// Used as the end-of-stream signal of producers (empty == no more entries),
    /// and wherever a "found nothing" must be told apart from a found value.
    template<class T>
    class maybe
    {
       struct sentinel{};
       union
       {
           sentinel m_sentinel;
                  T m_value;
       };

       bool m_empty = true;

    public:
        using value_type = T;

        static_assert(!std::is_same<value_type, void>::value, "Can't have void as value_type - did you perhaps forget a return-statement in your transform-function?");

        maybe() : m_sentinel{}
        {}

        // to avoid double-destruction
        maybe(const maybe&) = delete;
        maybe& operator=(const maybe&) = delete;

        maybe(T val)
        {
            reset(std::move(val));
        }

        maybe(maybe&& other) noexcept
        {
            if(!other.m_empty) {
                reset(std::move(*other));
                other.reset();
            }
        }

        // NB: the assignment semantics differ from that of std::optional!
        // See discussion in reset() below
        maybe& operator=(maybe&& other) noexcept
        {
            if(this == &other) {
                ;
            } else if(!other.m_empty) {
                reset(std::move(*other));
                other.reset();
            } else {
                reset();
            }
            return *this;
        }

        void reset(T val)
        {
            // NB: even if we are holding a value, we don't move-assign to it
            // and instead reset and place-new, because the type may be
            // move-constructible but not move-assigneable, e.g. containing a closure.
            //
            // For our purposes maybe<T> should behave similarly
            // to a unique_ptr, except with stack-storage, where
            // reassignment simply transfers ownership.

            reset();

            new (&m_value) T(std::move(val));

            m_empty = false;
        }

        void reset()
        {
            if(!m_empty) {
                this->operator*().~T();
                m_empty = true;
            }
        }

        explicit operator bool() const noexcept
        {
            return !m_empty;
        }

        T& operator*() noexcept
        {
            assert(!m_empty);
            return m_value;
        }

        const T& operator*() const noexcept
        {
            assert(!m_empty);
            return m_value;
        }

        ~maybe()
        {
            reset();
        }
    };

    /////////////////////////////////////////////////////////////////////////
    /// @brief Key of an entry: null, integer, or string.
    ///
    /// Null is the "no position" sentinel; only integer and string keys are stored.
    class key
    {
    public:
        enum class kind_t { null, integer, string };

        key() = default;

        template<typename I,
                 typename = typename std::enable_if<   std::is_integral<I>::value
                                                   && !std::is_same<I, bool>::value>::type>
        key(I i)
            : m_kind{ kind_t::integer }
            , m_int{ static_cast<int64_t>(i) }
        {}

        key(std::string s)
            : m_kind{ kind_t::string }
            , m_str( std::move(s) )
        {}

        key(const char* s)
            : m_kind{ s ? kind_t::string : kind_t::null }
            , m_str( s ? s : "" )
        {}

        kind_t kind() const
        {
            return m_kind;
        }

        bool is_null()    const { return m_kind == kind_t::null;    }
        bool is_integer() const { return m_kind == kind_t::integer; }
        bool is_string()  const { return m_kind == kind_t::string;  }

        int64_t as_integer() const
        {
            assert(is_integer());
            return m_int;
        }

        const std::string& as_string() const
        {
            assert(is_string());
            return m_str;
        }

        /// Decimal form of an integer key, the string itself, or "" for null.
        std::string to_string() const
        {
            return is_integer() ? std::to_string(m_int) : m_str;
        }

        friend bool operator==(const key& a, const key& b)
        {
            return a.m_kind == b.m_kind
                && a.m_int  == b.m_int
                && a.m_str  == b.m_str;
        }

        friend bool operator!=(const key& a, const key& b)
        {
            return !(a == b);
        }

        friend bool operator<(const key& a, const key& b)
        {
            return a.m_kind != b.m_kind ? a.m_kind < b.m_kind
                 : a.is_integer()       ? a.m_int  < b.m_int
                 :                        a.m_str  < b.m_str;
        }

        friend std::ostream& operator<<(std::ostream& ostr, const key& k)
        {
            return ostr << k.to_string();
        }

    private:
         kind_t m_kind = kind_t::null;
        int64_t m_int  = 0;
    std::string m_str  = {};
    };

    /// @brief Weak key equality: integer and numeric-string keys compare by numeric value,
    /// an integer and a non-numeric string compare as text. Null only equals null.
    inline bool loosely_equals(const key& a, const key& b)
    {
        if(a.is_null() || b.is_null()) {
            return a.is_null() && b.is_null();
        }

        if(a.is_integer() && b.is_integer()) {
            return a.as_integer() == b.as_integer();
        }

        const auto numeric = [](const key& k)
        {
            return k.is_integer() ? static_cast<double>(k.as_integer())
                                  : std::strtod(k.as_string().c_str(), nullptr);
        };

        const bool a_num = a.is_integer() || types::impl::is_numeric_text(a.as_string());
        const bool b_num = b.is_integer() || types::impl::is_numeric_text(b.as_string());

        if(a_num && b_num) {
            return numeric(a) == numeric(b);
        }

        return a.to_string() == b.to_string();
    }

    template<typename V>
    using entry = std::pair<key, V>;

    /// @brief One-shot producer of entries; yields empty maybe at end-of-stream.
    template<typename V>
    using producer = std::function<maybe<entry<V>>()>;

    /////////////////////////////////////////////////////////////////////////
    /// @brief Insertion-ordered key->value mapping.
    ///
    /// Has map semantics: setting an existing key overwrites the value in place,
    /// keeping the position where the key was first inserted.
    template<typename V>
    class ordered_map
    {
    public:
        using value_type     = entry<V>;
        using container_type = std::vector<value_type>;
        using const_iterator = typename container_type::const_iterator;
        using iterator       = const_iterator; // keys are immutable

        ordered_map() = default;

        ordered_map(std::initializer_list<value_type> entries)
        {
            for(const auto& e : entries) {
                set(e.first, e.second);
            }
        }

        /// Returns true if inserted, false if overwritten. A null key is stored as "".
        bool set(key k, V value)
        {
            if(k.is_null()) {
                k = key{ "" };
            }

            const auto it = m_index.find(k);
            if(it != m_index.end()) {
                m_entries[it->second].second = std::move(value);
                return false;
            }

            if(k.is_integer() && k.as_integer() >= m_next_int) {
                m_next_int = k.as_integer() + 1;
            }

            m_index.emplace(k, m_entries.size());
            m_entries.emplace_back(std::move(k), std::move(value));
            return true;
        }

        /// Append under the next free integer key (one past the largest integer key seen).
        void push_back(V value)
        {
            set(key{ m_next_int }, std::move(value));
        }

        V* find(const key& k)
        {
            const auto it = m_index.find(k);
            return it == m_index.end() ? nullptr : &m_entries[it->second].second;
        }

        const V* find(const key& k) const
        {
            const auto it = m_index.find(k);
            return it == m_index.end() ? nullptr : &m_entries[it->second].second;
        }

        bool contains(const key& k) const
        {
            return m_index.count(k) != 0;
        }

        const V& at(const key& k) const
        {
            const auto* v = find(k);
            if(!v) {
                throw std::out_of_range("ordered_map::at: no entry for key '" + k.to_string() + "'");
            }
            return *v;
        }

        const value_type& entry_at(size_t pos) const
        {
            return m_entries.at(pos);
        }

        size_t size() const
        {
            return m_entries.size();
        }

        bool empty() const
        {
            return m_entries.empty();
        }

        const_iterator begin() const
        {
            return m_entries.begin();
        }

        const_iterator end() const
        {
            return m_entries.end();
        }

        /// Reverse the order; each key stays with its value.
        void reverse()
        {
            std::reverse(m_entries.begin(), m_entries.end());

            m_index.clear();
            for(size_t i = 0; i < m_entries.size(); i++) {
                m_index.emplace(m_entries[i].first, i);
            }
        }

        std::vector<key> keys() const
        {
            std::vector<key> ret;
            ret.reserve(m_entries.size());
            for(const auto& e : m_entries) {
                ret.push_back(e.first);
            }
            return ret;
        }

        std::vector<V> values() const
        {
            std::vector<V> ret;
            ret.reserve(m_entries.size());
            for(const auto& e : m_entries) {
                ret.push_back(e.second);
            }
            return ret;
        }

        bool operator==(const ordered_map& other) const
        {
            return m_entries == other.m_entries;
        }

        bool operator!=(const ordered_map& other) const
        {
            return !(*this == other);
        }

    private:
        container_type m_entries = {};
        std::map<key, size_t> m_index = {};
        int64_t m_next_int = 0;
    };

    /////////////////////////////////////////////////////////////////////////
    /// @brief A collection's source is none of the supported shapes (raised on first iteration).
    struct invalid_source : std::invalid_argument
    {
        using std::invalid_argument::invalid_argument;
    };

    /// @brief A producer-returning callable returned no producer.
    struct invalid_producer_result : std::invalid_argument
    {
        using std::invalid_argument::invalid_argument;
    };

    /// @brief An item failed its type check.
    class type_mismatch : public std::invalid_argument
    {
    public:
        type_mismatch(std::string declaring, std::string expected, std::string actual, lazy::key at)
            : std::invalid_argument{ "Each element of " + declaring + " must be " + expected
                                   + ", " + actual + " given at \"" + at.to_string() + "\" index" }
            , m_declaring( std::move(declaring) )
            , m_expected( std::move(expected) )
            , m_actual( std::move(actual) )
            , m_at( std::move(at) )
        {}

        /// Name of the collection that declared the item type.
        const std::string& declaring() const { return m_declaring; }
        const std::string& expected()  const { return m_expected;  }
        const std::string& actual()    const { return m_actual;    }
        const lazy::key&   at()        const { return m_at;        }

    private:
        std::string m_declaring;
        std::string m_expected;
        std::string m_actual;
        lazy::key   m_at;
    };

    /////////////////////////////////////////////////////////////////////////
    /// @brief Return lazy::end_seq() from a generator function to signal end-of-inputs.
    ///
    /// This throws end_seq::exception on construction, and is interpreted
    /// by lazy::generate as end-of-inputs; it does not propagate further.
    struct end_seq
    {
        struct exception
        {};

        end_seq()
        {
            throw exception{};
        }

        template<typename T>
        operator T() const
        {
            throw exception{};
            return std::move(*maybe<T>{});
        }
    };

namespace impl
{
    // Adapts gen-function from exception-based end-of-seq to empty-maybe representation.
    template<typename Gen>
    struct catch_end
    {
        Gen gen;
        bool ended; // after first end_seq::exception
                    // will return empty-maybe without invoking gen, to avoid
                    // repeating the exception-handling overhead.

        using value_type = decltype(gen());

        auto operator()() -> maybe<value_type>
        {
            if(ended) {
                return { };
            }

            try {
                return { gen() };
            } catch( const end_seq::exception& ) {
                ended = true;
                return { };
            }
        }
    };

    // Gen yields values: key them 0, 1, 2, ...
    template<typename Gen, typename T = typename catch_end<Gen>::value_type>
    struct keyed_gen
    {
        catch_end<Gen> gen;
        int64_t next_key;

        using value_type = T;

        auto operator()() -> maybe<entry<T>>
        {
            auto x = gen();
            if(!x) {
                return { };
            }
            return { entry<T>{ key{ next_key++ }, std::move(*x) } };
        }
    };

    // Gen yields entries: pass-through.
    template<typename Gen, typename V>
    struct keyed_gen<Gen, entry<V>>
    {
        catch_end<Gen> gen;
        int64_t next_key;

        using value_type = V;

        auto operator()() -> maybe<entry<V>>
        {
            return gen();
        }
    };
}

    /////////////////////////////////////////////////////////////////////////
    /// @brief Adapt a nullary generator function as a one-shot producer.
    ///
    /// If gen_fn returns `entry<V>`, the entries are yielded as-is;
    /// otherwise the values are keyed 0, 1, 2, ...
    /*!
    @code
        auto squares = lazy::generate([i = 0]() mutable
        {
            return i < 3 ? i++ : lazy::end_seq();
        }); // {0:0, 1:1, 2:2}
    @endcode
    */
    template<typename NullaryInvokable>
    auto generate(NullaryInvokable gen_fn) -> producer<typename impl::keyed_gen<NullaryInvokable>::value_type>
    {
        static_assert(!std::is_reference<decltype(gen_fn())>::value, "The type returned by gen_fn must be a value-type.");
        static_assert(!std::is_same<decltype(gen_fn()), void>::value, "You forgot a return-statement in your gen-function.");
        return impl::keyed_gen<NullaryInvokable>{ { std::move(gen_fn), false }, 0 };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Cursor protocol shared by the one-shot and the memoizing iterators.
    template<typename V>
    class entry_iterator
    {
    public:
        using value_type = V;

        virtual ~entry_iterator() = default;

        virtual bool valid() = 0;

        /// Throws std::logic_error if !valid().
        virtual const entry<V>& current_entry() = 0;

        virtual void next() = 0;

        virtual void rewind() = 0;

        /// Key at the cursor, or the null key when past the end.
        lazy::key key()
        {
            return valid() ? current_entry().first : lazy::key{};
        }

        const V& current()
        {
            return current_entry().second;
        }
    };

    /////////////////////////////////////////////////////////////////////////
    /// @brief Single-pass iterator straight over a producer.
    ///
    /// The first entry is pulled on first access. rewind() is a no-op
    /// until the iterator has advanced, and a std::logic_error after that.
    template<typename V>
    class generator_iterator : public entry_iterator<V>
    {
    public:
        explicit generator_iterator(producer<V> gen)
            : m_gen{ std::move(gen) }
        {}

        bool valid() override
        {
            start();
            return static_cast<bool>(m_current);
        }

        const entry<V>& current_entry() override
        {
            start();
            if(!m_current) {
                LAZYCOLL_THROW(std::logic_error, "generator_iterator: current() past the end.");
            }
            return *m_current;
        }

        void next() override
        {
            start();
            if(m_current) {
                m_advanced = true;
                m_current = m_gen();
            }
        }

        void rewind() override
        {
            if(m_advanced) {
                LAZYCOLL_THROW(std::logic_error, "generator_iterator: a one-shot producer can't be rewound after it has advanced.");
            }
        }

    private:
        void start()
        {
            if(!m_started) {
                m_started = true;
                m_current = m_gen();
            }
        }

             producer<V> m_gen;
        maybe<entry<V>> m_current  = {};
                    bool m_started  = false;
                    bool m_advanced = false;
    };

    /////////////////////////////////////////////////////////////////////////
    /// @brief Memoizing iterator: makes a one-shot producer multi-pass.
    ///
    /// Every entry pulled from the source is stored in the cache at the position
    /// of its first discovery before it is handed out. A duplicate source key
    /// overwrites the cached value in place, and still moves the cursor.
    template<typename V>
    class caching_iterator : public entry_iterator<V>
    {
    public:
        /// Pre-fetches the first entry; an empty source is exhausted right away.
        explicit caching_iterator(producer<V> src)
            : m_src{ std::move(src) }
        {
            pull();
        }

        bool valid() override
        {
            return m_pos < m_cache.size();
        }

        const entry<V>& current_entry() override
        {
            if(!valid()) {
                LAZYCOLL_THROW(std::logic_error, "caching_iterator: current() past the end.");
            }
            return m_cache.entry_at(m_pos);
        }

        void next() override
        {
            if(!m_exhausted) {
                m_advanced = true;
                pull();
            }

            if(m_pos < m_cache.size()) {
                ++m_pos;
            }
        }

        void rewind() override
        {
            if(m_advanced) {
                exhaust();
            }
            m_pos = 0;
        }

        /// Drain the source and return the complete cache. The cursor is not moved.
        const ordered_map<V>& to_array()
        {
            exhaust();
            return m_cache;
        }

        bool exhausted() const
        {
            return m_exhausted;
        }

    private:
        void pull()
        {
            auto x = m_src();
            if(x) {
                m_cache.set(std::move((*x).first), std::move((*x).second));
            } else {
                m_exhausted = true;
            }
        }

        void exhaust()
        {
            while(!m_exhausted) {
                pull();
            }
        }

           producer<V> m_src;
        ordered_map<V> m_cache     = {};
                size_t m_pos       = 0;
                  bool m_advanced  = false;
                  bool m_exhausted = false;
    };

    template<typename V>
    class collection;

    /// Tag for map(f, lazy::recursive).
    struct recursive_t
    {};

    static constexpr recursive_t recursive{};

namespace impl
{
    /////////////////////////////////////////////////////////////////////////
    // Callbacks are invoked as fn(value, key) if that compiles, else as fn(value).

    template<typename F, typename T>
    auto invoke_kv(F& fn, const T& value, const key& k, pr_high) -> decltype(fn(value, k))
    {
        return fn(value, k);
    }

    template<typename F, typename T>
    auto invoke_kv(F& fn, const T& value, const key&, pr_low) -> decltype(fn(value))
    {
        return fn(value);
    }

    template<typename F, typename T>
    auto call(F& fn, const T& value, const key& k) -> decltype(impl::invoke_kv(fn, value, k, resolve_overload{}))
    {
        return impl::invoke_kv(fn, value, k, resolve_overload{});
    }

    template<typename F, typename V>
    using call_result_t = typename std::decay<decltype(impl::call(std::declval<F&>(),
                                                                  std::declval<const V&>(),
                                                                  std::declval<const key&>()))>::type;

    /////////////////////////////////////////////////////////////////////////
    // Truthiness of values and predicate results.

    template<typename T> bool truthy(const T& x, cat_tag<cat::boolean>)  { return x; }
    template<typename T> bool truthy(const T& x, cat_tag<cat::integer>)  { return x != 0; }
    template<typename T> bool truthy(const T& x, cat_tag<cat::floating>) { return x != 0; }
    template<typename T> bool truthy(const T& p, cat_tag<cat::pointer>)  { return static_cast<bool>(p); }
    template<typename T> bool truthy(const T& x, cat_tag<cat::array>)    { return x.begin() != x.end(); }
    template<typename T> bool truthy(const T& x, cat_tag<cat::dynamic>)  { return x.kind() != types::kind::null; }
    template<typename T> bool truthy(const T&,   cat_tag<cat::null>)     { return false; }
    template<typename T> bool truthy(const T&,   cat_tag<cat::object>)   { return true; }

    template<typename T>
    bool truthy(const T& x, cat_tag<cat::text>)
    {
        std::string s;
        return types::impl::assign_text(x, s) && !s.empty() && s != "0";
    }

    inline bool truthy(const key& k, cat_tag<cat::object>)
    {
        return k.is_integer() ? k.as_integer() != 0
             : k.is_string() && !k.as_string().empty() && k.as_string() != "0";
    }

    template<typename T>
    bool truthy(const maybe<T>& x, cat_tag<cat::object>)
    {
        return static_cast<bool>(x);
    }

    template<typename T>
    bool truthy(const T& x)
    {
        return impl::truthy(x, category_tag<T>{});
    }

    /////////////////////////////////////////////////////////////////////////
    // each(): only a bool false stops the iteration.

    inline bool is_false(bool b)
    {
        return !b;
    }

    template<typename T>
    bool is_false(const T&)
    {
        return false;
    }

    template<typename F, typename T>
    auto proceed(F& fn, const T& value, const key& k)
        -> typename std::enable_if<std::is_void<decltype(impl::call(fn, value, k))>::value, bool>::type
    {
        impl::call(fn, value, k);
        return true;
    }

    template<typename F, typename T>
    auto proceed(F& fn, const T& value, const key& k)
        -> typename std::enable_if<!std::is_void<decltype(impl::call(fn, value, k))>::value, bool>::type
    {
        return !impl::is_false(impl::call(fn, value, k));
    }

    /////////////////////////////////////////////////////////////////////////
    // key_by(): computed value -> key.

    template<typename T>
    auto to_key(const T& x, pr_highest) -> decltype(key{ x })
    {
        return key{ x };
    }

    template<typename T>
    auto to_key(const T& x, pr_high) -> typename std::enable_if<std::is_arithmetic<T>::value, key>::type
    {
        return key{ static_cast<int64_t>(x) };
    }

    template<typename T>
    auto to_key(const T& x, pr_low) -> decltype(void(std::declval<std::ostream&>() << x), key{})
    {
        std::ostringstream ostr;
        ostr << x;
        return key{ ostr.str() };
    }

    template<typename T>
    key to_key(const T& x)
    {
        return impl::to_key(x, resolve_overload{});
    }

    /////////////////////////////////////////////////////////////////////////
    // group_by(): only integral (not bool) and textual results form groups.

    template<typename T>
    struct is_group_key
        : std::integral_constant<bool, (   std::is_integral<T>::value
                                       && !std::is_same<T, bool>::value)
                                       || types::impl::is_text<T>::value>
    {};

    inline maybe<key> to_group_key(const key& k)
    {
        if(k.is_null()) {
            return { };
        }
        return { k };
    }

    template<typename T>
    auto to_group_key(const T& x) -> typename std::enable_if<is_group_key<T>::value, maybe<key>>::type
    {
        return impl::to_group_key(key{ x });
    }

    template<typename T>
    auto to_group_key(const T&) -> typename std::enable_if<!is_group_key<T>::value, maybe<key>>::type
    {
        return { };
    }

    template<typename T>
    maybe<key> to_group_key(const maybe<T>& x)
    {
        if(!x) {
            return { };
        }
        return impl::to_group_key(*x);
    }

    /////////////////////////////////////////////////////////////////////////
    // Generators of derived collections. Each is copied unstarted
    // into every producer its factory hands out.

    // Pulls the entries of a collection: positions on the first call, advances on the next.
    template<typename V>
    struct pull_gen
    {
        collection<V> src;
        std::shared_ptr<entry_iterator<V>> it;

        auto operator()() -> maybe<entry<V>>
        {
            if(!it) {
                it = src.get_iterator();
                it->rewind();
            } else if(it->valid()) {
                it->next();
            }

            if(!it->valid()) {
                return { };
            }
            return { it->current_entry() };
        }
    };

    template<typename V>
    struct array_gen
    {
        std::shared_ptr<const ordered_map<V>> src;
        size_t pos;

        auto operator()() -> maybe<entry<V>>
        {
            if(pos >= src->size()) {
                return { };
            }
            return { src->entry_at(pos++) };
        }
    };

    template<typename V, typename Pred>
    struct where_gen
    {
        pull_gen<V> src;
        Pred pred;

        auto operator()() -> maybe<entry<V>>
        {
            for(auto x = src(); x; x = src()) {
                if(impl::truthy(impl::call(pred, (*x).second, (*x).first))) {
                    return std::move(x);
                }
            }
            return { };
        }
    };

    template<typename V, typename F, typename R>
    struct transform_gen
    {
        pull_gen<V> src;
        F fn;

        auto operator()() -> maybe<entry<R>>
        {
            auto x = src();
            if(!x) {
                return { };
            }
            R value = impl::call(fn, (*x).second, (*x).first);
            return { entry<R>{ std::move((*x).first), std::move(value) } };
        }
    };

    template<typename V, typename F>
    struct key_by_gen
    {
        pull_gen<V> src;
        F fn;

        auto operator()() -> maybe<entry<V>>
        {
            auto x = src();
            if(!x) {
                return { };
            }
            auto k = impl::to_key(impl::call(fn, (*x).second, (*x).first));
            return { entry<V>{ std::move(k), std::move((*x).second) } };
        }
    };

    template<typename V>
    struct keys_gen
    {
        pull_gen<V> src;
        int64_t next_key;

        auto operator()() -> maybe<entry<key>>
        {
            auto x = src();
            if(!x) {
                return { };
            }
            return { entry<key>{ key{ next_key++ }, std::move((*x).first) } };
        }
    };

    template<typename V>
    struct skip_gen
    {
        pull_gen<V> src;
        size_t n;
        bool skipped;

        auto operator()() -> maybe<entry<V>>
        {
            if(!skipped) {
                skipped = true;
                for(size_t i = 0; i < n; i++) {
                    if(!src()) {
                        return { };
                    }
                }
            }
            return src();
        }
    };

    template<typename V>
    struct typed_gen
    {
        pull_gen<V> src;
        std::string declaring;
        types::validator<V> item_type;

        auto operator()() -> maybe<entry<V>>
        {
            if(item_type.name().empty()) {
                LAZYCOLL_THROW(std::logic_error, "Item type of " + declaring + " must not be empty.");
            }

            auto x = src();
            if(x && !item_type((*x).second)) {
                throw type_mismatch{ declaring, item_type.name(), types::describe((*x).second), (*x).first };
            }
            return std::move(x);
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // map(f, lazy::recursive): nested collections are mapped, leaves are transformed.

    template<typename V, typename F>
    struct deep_map
    {
        using type = call_result_t<F, V>;

        static type apply(F& fn, const V& value, const key& k)
        {
            return impl::call(fn, value, k);
        }
    };

    template<typename U, typename F>
    struct deep_map<collection<U>, F>
    {
        using type = collection<typename deep_map<U, F>::type>;

        static type apply(F& fn, const collection<U>& value, const key&)
        {
            return value.map(fn, recursive);
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // to_array(): nested collections become nested ordered_maps.

    template<typename V>
    struct materialized
    {
        using type = V;

        static const V& apply(const V& value)
        {
            return value;
        }
    };

    template<typename U>
    struct materialized<collection<U>>
    {
        using type = ordered_map<typename materialized<U>::type>;

        static type apply(const collection<U>& value)
        {
            return value.to_array();
        }
    };

    template<typename V, typename F>
    struct materialized_with
    {
        using type = call_result_t<F, V>;

        static type apply(F& fn, const V& value, const key& k)
        {
            return impl::call(fn, value, k);
        }
    };

    template<typename U, typename F>
    struct materialized_with<collection<U>, F>
    {
        using type = ordered_map<typename materialized_with<U, F>::type>;

        static type apply(F& fn, const collection<U>& value, const key&)
        {
            return value.materialize(fn);
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // defer(): what the deferred function returned -> collection.

    template<typename R>
    struct deferred
    {
        using value_type = R;

        static collection<R> to_collection(R value)
        {
            ordered_map<R> items{};
            items.set(key{ 0 }, std::move(value));
            return collection<R>::create(std::move(items));
        }
    };

    template<typename U>
    struct deferred<collection<U>>
    {
        using value_type = U;

        static collection<U> to_collection(collection<U> value)
        {
            return value;
        }
    };

    template<typename T>
    struct deferred<maybe<T>>
    {
        using value_type = typename deferred<T>::value_type;

        static collection<value_type> to_collection(maybe<T> value)
        {
            if(!value) {
                return collection<value_type>::empty();
            }
            return deferred<T>::to_collection(std::move(*value));
        }
    };

} // namespace impl

    /////////////////////////////////////////////////////////////////////////
    /// @brief Lazy, chainable sequence of key->value entries.
    ///
    /// A collection is a handle: copies refer to the same node and share its cache.
    /// Transformations (filter, map, key_by, keys, skip, defer) return new nodes and
    /// do not pull anything until the new node is iterated. Terminal operations
    /// (to_array, count, each, get, first, last, ...) drain an iterator obtained
    /// from get_iterator(), which re-resolves the source on every call unless the
    /// node is caching.
    ///
    /// With use_cache, the first iteration wraps the resolved producer into a
    /// caching_iterator that every later iteration of this node reuses, so a one-shot
    /// producer is consumed once and can be read any number of times.
    /// Without it, a factory source is re-run on each terminal call.
    /// use_cache is inherited by every node derived from this one.
    /*!
    @code
        auto totals = lazy::collection<order>::create(orders, true)
                    .filter([](const order& o) { return o.paid; })
                    .map([](const order& o) { return o.amount; });

        if(totals.count() > 0) {
            for(const auto& e : totals) {
                std::cout << e.first << ": " << e.second << "\n";
            }
        }
    @endcode
    */
    template<typename V>
    class collection
    {
    public:
        using value_type    = V;
        using entry_type    = entry<V>;
        using array_type    = ordered_map<V>;
        using producer_type = producer<V>;
        using factory_type  = std::function<producer<V>(const collection&)>;
        using iterator_ptr  = std::shared_ptr<entry_iterator<V>>;

        /// Input iterator over entries, for range-for.
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using   difference_type = std::ptrdiff_t;
            using        value_type = entry<V>;
            using           pointer = const value_type*;
            using         reference = const value_type&;

            iterator(iterator_ptr it = nullptr)
                : m_it{ std::move(it) }
            {}

            iterator& operator++()
            {
                m_it->next();
                if(!m_it->valid()) {
                    m_it = nullptr;
                }
                return *this;
            }

            reference operator*() const
            {
                return m_it->current_entry();
            }

            pointer operator->() const
            {
                return &m_it->current_entry();
            }

            bool operator==(const iterator& other) const
            {
                return m_it == other.m_it;
            }

            bool operator!=(const iterator& other) const
            {
                return !(*this == other);
            }

        private:
            iterator_ptr m_it;
        };

        /// Empty, uncached.
        collection()
            : collection{ make(source_kind::array, false) }
        {
            m_state->array = std::make_shared<const array_type>();
        }

        /////////////////////////////////////////////////////////////////////
        // Construction. The source is not inspected until the first iteration.

        static collection create(array_type src, bool use_cache = false)
        {
            auto ret = make(source_kind::array, use_cache);
            ret.m_state->array = std::make_shared<const array_type>(std::move(src));
            return ret;
        }

        /// Keyed 0..n-1.
        static collection create(std::vector<V> src, bool use_cache = false)
        {
            array_type items{};
            for(auto& x : src) {
                items.push_back(std::move(x));
            }
            return create(std::move(items), use_cache);
        }

        static collection create(std::initializer_list<V> src, bool use_cache = false)
        {
            return create(std::vector<V>(src), use_cache);
        }

        /// One-shot producer. An uncached node keeps one iterator over it: terminal
        /// calls that did not advance past the first entry can be repeated, but once
        /// the iterator has advanced, iterating the node again throws std::logic_error.
        static collection create(producer_type src, bool use_cache = false)
        {
            auto ret = make(source_kind::producer, use_cache);
            ret.m_state->gen = std::make_shared<producer_type>(std::move(src));
            return ret;
        }

        /// The factory is called with this node to obtain a fresh producer on each resolution.
        static collection create(factory_type src, bool use_cache = false)
        {
            auto ret = make(source_kind::factory, use_cache);
            ret.m_state->factory = std::move(src);
            return ret;
        }

        /// Nullary callable returning a producer.
        template<typename F,
                 typename = typename std::enable_if<
                     std::is_same<typename std::decay<decltype(std::declval<F&>()())>::type,
                                  producer_type>::value>::type>
        static collection create(F fn, bool use_cache = false)
        {
            return create(factory_type{ [fn](const collection&) mutable
            {
                return fn();
            }}, use_cache);
        }

        static collection empty()
        {
            return create(array_type{});
        }

        bool use_cache() const
        {
            return m_state->use_cache;
        }

        /////////////////////////////////////////////////////////////////////
        /// @brief The node's iterator.
        ///
        /// Returns the memoized iterator if this node has one; otherwise resolves
        /// the source into a producer and, if caching, memoizes it on this node.
        /// An uncached producer source keeps a single one-shot iterator, so an
        /// entry that was looked at but not advanced past is seen again.
        /// Throws invalid_source or invalid_producer_result.
        iterator_ptr get_iterator() const
        {
            auto& st = *m_state;
            if(st.cached) {
                return st.cached;
            }

            if(st.oneshot) {
                return st.oneshot;
            }

            auto gen = resolve();
            if(st.use_cache) {
                st.cached = std::make_shared<caching_iterator<V>>(std::move(gen));
                return st.cached;
            }
            if(st.kind == source_kind::producer) {
                st.oneshot = std::make_shared<generator_iterator<V>>(std::move(gen));
                return st.oneshot;
            }
            return std::make_shared<generator_iterator<V>>(std::move(gen));
        }

        /// The memoized iterator, if any iteration of a caching node happened.
        std::shared_ptr<caching_iterator<V>> cached_iterator() const
        {
            return m_state->cached;
        }

        iterator begin() const
        {
            auto it = get_iterator();
            it->rewind();
            return it->valid() ? iterator{ it } : iterator{};
        }

        iterator end() const
        {
            return { };
        }

        /////////////////////////////////////////////////////////////////////
        // Lazy transformations.

        /// Keep the entries whose value is truthy.
        collection filter() const
        {
            return filter([](const V& value)
            {
                return impl::truthy(value);
            });
        }

        /// Keep the entries for which pred(value, key) or pred(value) is truthy.
        template<typename Pred>
        collection filter(Pred pred) const
        {
            return derive<V>(impl::where_gen<V, Pred>{ puller(), std::move(pred) });
        }

        template<typename F>
        auto map(F fn) const -> collection<impl::call_result_t<F, V>>
        {
            using R = impl::call_result_t<F, V>;
            return derive<R>(impl::transform_gen<V, F, R>{ puller(), std::move(fn) });
        }

        /// Nested collections are mapped recursively instead of being passed to fn.
        template<typename F>
        auto map(F fn, recursive_t) const -> collection<typename impl::deep_map<V, F>::type>
        {
            return map([fn](const V& value, const lazy::key& k) mutable
            {
                return impl::deep_map<V, F>::apply(fn, value, k);
            });
        }

        /// Re-key each entry. See impl::to_key for how computed values become keys.
        template<typename F>
        collection key_by(F fn) const
        {
            return derive<V>(impl::key_by_gen<V, F>{ puller(), std::move(fn) });
        }

        /// The keys, as values keyed 0..n-1.
        collection<lazy::key> keys() const
        {
            return derive<lazy::key>(impl::keys_gen<V>{ puller(), 0 });
        }

        collection skip(size_t n) const
        {
            return derive<V>(impl::skip_gen<V>{ puller(), n, false });
        }

        /////////////////////////////////////////////////////////////////////
        /// @brief Decide the contents at the first iteration.
        ///
        /// fn(*this) is invoked when the returned collection is first iterated.
        /// A returned collection is flattened; an empty maybe yields the empty
        /// collection; any other value is a single entry keyed 0.
        template<typename F>
        auto defer(F fn) const
            -> collection<typename impl::deferred<typename std::decay<decltype(fn(std::declval<const collection&>()))>::type>::value_type>
        {
            using R = typename std::decay<decltype(fn(std::declval<const collection&>()))>::type;
            using U = typename impl::deferred<R>::value_type;

            const collection self = *this;

            return collection<U>::create(typename collection<U>::factory_type{
                [self, fn](const collection<U>&) mutable
                {
                    return producer<U>{ impl::pull_gen<U>{ impl::deferred<R>::to_collection(fn(self)), nullptr } };
                }}, use_cache());
        }

        /////////////////////////////////////////////////////////////////////
        // Eager operations.

        bool is_empty() const
        {
            auto it = get_iterator();
            it->rewind();
            return !it->valid();
        }

        /// Invoke fn(value, key) or fn(value) for each entry; stops when fn returns bool false.
        template<typename F>
        const collection& each(F fn) const
        {
            drain([&fn](const entry<V>& e)
            {
                return impl::proceed(fn, e.second, e.first);
            });
            return *this;
        }

        /// Eager: materializes, then reverses the order keeping keys with their values.
        collection reverse() const
        {
            auto items = collect();
            items.reverse();
            return create(std::move(items), use_cache());
        }

        /////////////////////////////////////////////////////////////////////
        /// @brief Group the entries by fn(value, key) or fn(value).
        ///
        /// Groups are ordered by first-seen group key; each group keeps its
        /// entries' original keys and relative order. Entries whose computed
        /// group key is not integral or textual (e.g. a float, an object,
        /// an empty maybe or a null key) are dropped.
        ///
        /// Group keys are not normalized: "5" and 5 form two distinct groups.
        template<typename F>
        collection<collection<V>> group_by(F fn) const
        {
            ordered_map<array_type> grouped{};

            drain([&](const entry<V>& e)
            {
                const auto group_key = impl::to_group_key(impl::call(fn, e.second, e.first));
                if(group_key) {
                    auto* group = grouped.find(*group_key);
                    if(!group) {
                        grouped.set(*group_key, array_type{});
                        group = grouped.find(*group_key);
                    }
                    group->set(e.first, e.second);
                }
                return true;
            });

            ordered_map<collection<V>> groups{};
            for(const auto& g : grouped) {
                groups.set(g.first, create(g.second, use_cache()));
            }
            return collection<collection<V>>::create(std::move(groups), use_cache());
        }

        /// Value of the first entry whose key loosely equals k; default_value if none or k is null.
        V get(const lazy::key& k, V default_value = V()) const
        {
            if(k.is_null()) {
                return default_value;
            }

            maybe<V> found{};
            drain([&](const entry<V>& e)
            {
                if(loosely_equals(e.first, k)) {
                    found.reset(e.second);
                    return false;
                }
                return true;
            });
            return found ? *found : default_value;
        }

        V first(std::nullptr_t = nullptr, V default_value = V()) const
        {
            auto it = get_iterator();
            it->rewind();
            if(!it->valid()) {
                return default_value;
            }
            return it->current();
        }

        /// First value for which pred is truthy, or default_value.
        template<typename Pred>
        V first(Pred pred, V default_value = V()) const
        {
            maybe<V> found{};
            drain([&](const entry<V>& e)
            {
                if(impl::truthy(impl::call(pred, e.second, e.first))) {
                    found.reset(e.second);
                    return false;
                }
                return true;
            });
            return found ? *found : default_value;
        }

        /// Scans everything; a found value is returned even if it compares equal to default_value.
        V last(std::nullptr_t = nullptr, V default_value = V()) const
        {
            maybe<V> found{};
            drain([&](const entry<V>& e)
            {
                found.reset(e.second);
                return true;
            });
            return found ? *found : default_value;
        }

        template<typename Pred>
        V last(Pred pred, V default_value = V()) const
        {
            maybe<V> found{};
            drain([&](const entry<V>& e)
            {
                if(impl::truthy(impl::call(pred, e.second, e.first))) {
                    found.reset(e.second);
                }
                return true;
            });
            return found ? *found : default_value;
        }

        /// Materialize into a new, uncoupled in-memory collection.
        collection load() const
        {
            return create(collect(), use_cache());
        }

        /// Drains the iterator. A memoized iterator is rewound afterwards.
        size_t count() const
        {
            auto it = get_iterator();
            it->rewind();
            if(!it->valid()) {
                return 0;
            }

            size_t n = 0;
            for(; it->valid(); it->next()) {
                ++n;
            }

            if(m_state->cached) {
                it->rewind();
            }
            return n;
        }

        /// Shallow materialization.
        array_type collect() const
        {
            array_type ret{};
            drain([&ret](const entry<V>& e)
            {
                ret.set(e.first, e.second);
                return true;
            });
            return ret;
        }

        /// Deep materialization: nested collections become nested ordered_maps.
        auto to_array() const -> ordered_map<typename impl::materialized<V>::type>
        {
            ordered_map<typename impl::materialized<V>::type> ret{};
            drain([&ret](const entry<V>& e)
            {
                ret.set(e.first, impl::materialized<V>::apply(e.second));
                return true;
            });
            return ret;
        }

        /// Deep materialization, with fn(value, key) or fn(value) applied to the leaves.
        template<typename F>
        auto to_array(F fn) const -> ordered_map<typename impl::materialized_with<V, F>::type>
        {
            return materialize(fn);
        }

    private:
        template<typename W, typename G>
        friend struct impl::materialized_with;

        enum class source_kind { array, producer, factory };

        struct state
        {
            source_kind kind;
            std::shared_ptr<const array_type> array;
            std::shared_ptr<producer_type> gen;
            factory_type factory;
            bool use_cache;
            std::shared_ptr<caching_iterator<V>> cached;
            std::shared_ptr<generator_iterator<V>> oneshot; // uncached producer source
        };

        explicit collection(std::shared_ptr<state> st)
            : m_state{ std::move(st) }
        {}

        static collection make(source_kind kind, bool use_cache)
        {
            auto st = std::make_shared<state>();
            st->kind = kind;
            st->use_cache = use_cache;
            return collection{ std::move(st) };
        }

        producer_type resolve() const
        {
            const auto& st = *m_state;

            switch(st.kind) {
                case source_kind::array:
                    return impl::array_gen<V>{ st.array, 0 };

                case source_kind::producer:
                {
                    if(!st.gen || !*st.gen) {
                        LAZYCOLL_THROW(invalid_source, "Collection source is not of the supported types.");
                    }
                    auto gen = st.gen;
                    return [gen]
                    {
                        return (*gen)();
                    };
                }

                case source_kind::factory:
                {
                    if(!st.factory) {
                        LAZYCOLL_THROW(invalid_source, "Collection source is not of the supported types.");
                    }
                    auto gen = st.factory(*this);
                    if(!gen) {
                        LAZYCOLL_THROW(invalid_producer_result, "Collection factory must return a producer.");
                    }
                    return gen;
                }
            }

            LAZYCOLL_THROW(invalid_source, "Collection source is not of the supported types.");
        }

        impl::pull_gen<V> puller() const
        {
            return { *this, nullptr };
        }

        // New node whose factory hands out copies of the unstarted gen.
        template<typename R, typename Gen>
        collection<R> derive(Gen gen) const
        {
            return collection<R>::create(typename collection<R>::factory_type{
                [gen](const collection<R>&)
                {
                    return producer<R>{ gen };
                }}, use_cache());
        }

        // fn(entry) returns false to stop.
        template<typename F>
        void drain(F&& fn) const
        {
            auto it = get_iterator();
            for(it->rewind(); it->valid(); it->next()) {
                if(!fn(it->current_entry())) {
                    break;
                }
            }
        }

        template<typename F>
        auto materialize(F& fn) const -> ordered_map<typename impl::materialized_with<V, F>::type>
        {
            ordered_map<typename impl::materialized_with<V, F>::type> ret{};
            drain([&](const entry<V>& e)
            {
                ret.set(e.first, impl::materialized_with<V, F>::apply(fn, e.second, e.first));
                return true;
            });
            return ret;
        }

        std::shared_ptr<state> m_state;
    };

    /////////////////////////////////////////////////////////////////////////
    /// @brief Validate each item of src as it is pulled.
    ///
    /// Throws type_mismatch naming declaring_name, the validator's name, the observed
    /// kind and the key of the first offending item. Items before it are delivered.
    template<typename V>
    collection<V> typed(std::string declaring_name, types::validator<V> item_type, const collection<V>& src)
    {
        using factory_type = typename collection<V>::factory_type;

        return collection<V>::create(factory_type{
            [declaring_name, item_type, src](const collection<V>&)
            {
                return producer<V>{ impl::typed_gen<V>{ { src, nullptr }, declaring_name, item_type } };
            }}, src.use_cache());
    }

    template<typename V>
    collection<V> from(std::vector<V> src, bool use_cache = false)
    {
        return collection<V>::create(std::move(src), use_cache);
    }

    template<typename V>
    collection<V> from(ordered_map<V> src, bool use_cache = false)
    {
        return collection<V>::create(std::move(src), use_cache);
    }

    template<typename K, typename V, typename Cmp, typename Alloc>
    collection<V> from(const std::map<K, V, Cmp, Alloc>& src, bool use_cache = false)
    {
        ordered_map<V> items{};
        for(const auto& kv : src) {
            items.set(key{ kv.first }, kv.second);
        }
        return collection<V>::create(std::move(items), use_cache);
    }

    template<typename V>
    collection<V> from(producer<V> src, bool use_cache = false)
    {
        return collection<V>::create(std::move(src), use_cache);
    }

} // namespace lazy
} // namespace lazycoll

/////////////////////////////////////////////////////////////////////////////
#if LAZYCOLL_LAZY_ENABLE_RUN_TESTS
#include <iostream>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) LAZYCOLL_THROW(std::logic_error, "Assertion failed: ( "#expr" ).");
#endif

namespace lazycoll
{
namespace lazy
{
namespace impl
{

using vec_t  = std::vector<int>;
using keys_t = std::vector<key>;

// One-shot producer over xs; num_pulled counts the entries handed out.
inline producer<int> counting_producer(vec_t xs, std::shared_ptr<size_t> num_pulled)
{
    return lazy::generate([xs, num_pulled, i = size_t(0)]() mutable -> int
    {
        if(i == xs.size()) {
            return lazy::end_seq();
        }
        ++*num_pulled;
        return xs[i++];
    });
}

struct item
{
    std::string k;
    int n;
};

struct point
{
    int x;
    int y;

    friend std::ostream& operator<<(std::ostream& ostr, const point& p)
    {
        return ostr << "(" << p.x << "," << p.y << ")";
    }
};

// Same battery over array-backed, factory-backed (uncached),
// and one-shot-producer-backed (cached) collections.
template<typename UnaryCallable>
auto make_tests(UnaryCallable make_inputs) -> std::map<std::string, std::function<void()>>
{
    std::map<std::string, std::function<void()>> tests{};

    tests["to_array"] = [=]
    {
        const auto res = make_inputs({ 1, 2, 3 }).to_array();
        VERIFY((res == ordered_map<int>{ { 0, 1 }, { 1, 2 }, { 2, 3 } }));
    };

    tests["to_array twice"] = [=]
    {
        const auto c = make_inputs({ 1, 2, 3 }).map([](int x) { return x * 10; });
        VERIFY(c.to_array() == c.to_array());
        VERIFY((c.to_array().values() == vec_t{ 10, 20, 30 }));
    };

    tests["is_empty"] = [=]
    {
        VERIFY( make_inputs({}).is_empty());
        VERIFY(!make_inputs({ 0 }).is_empty());
    };

    tests["filter"] = [=]
    {
        const auto res = make_inputs({ 1, 2, 3, 4, 5, 6 })
            .filter([](int x) { return x % 2 == 0; })
            .to_array();

        // original keys are kept
        VERIFY((res == ordered_map<int>{ { 1, 2 }, { 3, 4 }, { 5, 6 } }));
    };

    tests["filter by key"] = [=]
    {
        const auto res = make_inputs({ 7, 8, 9 })
            .filter([](int, const key& k) { return k.as_integer() != 1; })
            .to_array();

        VERIFY((res.values() == vec_t{ 7, 9 }));
    };

    tests["filter by truthiness"] = [=]
    {
        const auto res = make_inputs({ 0, 1, 0, 2 }).filter().to_array();
        VERIFY((res == ordered_map<int>{ { 1, 1 }, { 3, 2 } }));

        // an int result is truthy if non-zero
        const auto odd = make_inputs({ 1, 2, 3 }).filter([](int x) { return x % 2; });
        VERIFY((odd.to_array().values() == vec_t{ 1, 3 }));
    };

    tests["map"] = [=]
    {
        const auto f = [](int x) { return x + 1; };
        const auto g = [](int x) { return x * 2; };

        const auto c = make_inputs({ 1, 2, 3 });
        VERIFY(c.map(f).map(g).to_array() == c.map([&](int x) { return g(f(x)); }).to_array());

        const auto res = make_inputs({ 1, 2 })
            .map([](int x, const key& k) { return k.to_string() + ":" + std::to_string(x); })
            .to_array();

        VERIFY((res.values() == std::vector<std::string>{ "0:1", "1:2" }));
    };

    tests["each"] = [=]
    {
        const auto c = make_inputs({ 1, 2, 3, 4 });

        vec_t visited{};
        const auto& ret = c.each([&](int x)
        {
            visited.push_back(x);
            return x != 3;
        });

        VERIFY((visited == vec_t{ 1, 2, 3 }));
        VERIFY(&ret == &c);
    };

    tests["each: only bool false stops"] = [=]
    {
        const auto c = make_inputs({ 1, 2, 3, 4 });

        size_t n = 0;
        c.each([&](int) { ++n; return 0; });
        VERIFY(n == 4);

        n = 0;
        c.each([&](int) { ++n; return std::string{}; });
        VERIFY(n == 4);

        n = 0;
        c.each([&](int) { ++n; return nullptr; });
        VERIFY(n == 4);

        n = 0;
        c.each([&](int, const key&) { ++n; });
        VERIFY(n == 4);
    };

    tests["reverse"] = [=]
    {
        const auto res = make_inputs({ 1, 2, 3 }).reverse().to_array();
        VERIFY((res.values() == vec_t{ 3, 2, 1 }));
        VERIFY((res.keys() == keys_t{ 2, 1, 0 }));
    };

    tests["key_by"] = [=]
    {
        const auto c = make_inputs({ 1, 2, 3 });

        const auto by_name = c.key_by([](int x) { return "k" + std::to_string(x); }).to_array();
        VERIFY((by_name.keys() == keys_t{ "k1", "k2", "k3" }));
        VERIFY((by_name.values() == vec_t{ 1, 2, 3 }));

        const auto by_float = c.key_by([](int x) { return x * 1.5; }).to_array();
        VERIFY((by_float.keys() == keys_t{ 1, 3, 4 }));

        const auto by_key = c.key_by([](int, const key& k) { return k.as_integer() + 100; }).to_array();
        VERIFY((by_key.keys() == keys_t{ 100, 101, 102 }));

        const auto by_text = c.key_by([](int x) { return point{ x, -x }; }).to_array();
        VERIFY((by_text.keys() == keys_t{ "(1,-1)", "(2,-2)", "(3,-3)" }));
    };

    tests["group_by"] = [=]
    {
        const auto groups = make_inputs({ 1, 2, 3, 4, 5 }).group_by([](int x)
        {
            return x % 2 ? "odd" : "even";
        });

        VERIFY(groups.count() == 2);

        const auto res = groups.to_array();
        VERIFY((res.keys() == keys_t{ "odd", "even" }));
        VERIFY((res.at("odd")  == ordered_map<int>{ { 0, 1 }, { 2, 3 }, { 4, 5 } }));
        VERIFY((res.at("even") == ordered_map<int>{ { 1, 2 }, { 3, 4 } }));

        // non-integral keys drop the items
        VERIFY(make_inputs({ 1, 2, 3 }).group_by([](int x) { return x * 0.5; }).is_empty());
        VERIFY(make_inputs({ 1, 2, 3 }).group_by([](int x) { return x > 1; }).is_empty());
    };

    tests["keys"] = [=]
    {
        const auto res = make_inputs({ 5, 6, 7 })
            .key_by([](int x) { return "k" + std::to_string(x); })
            .keys()
            .to_array();

        VERIFY((res.values() == keys_t{ "k5", "k6", "k7" }));
        VERIFY((res.keys()   == keys_t{ 0, 1, 2 }));
    };

    tests["get"] = [=]
    {
        const auto c = make_inputs({ 10, 20, 30 });
        VERIFY(c.get(1) == 20);
        VERIFY(c.get("1") == 20);
        VERIFY(c.get("01") == 20);
        VERIFY(c.get(7, -1) == -1);
        VERIFY(c.get(key{}, -1) == -1);
        VERIFY(c.get("x") == 0);
    };

    tests["first, last"] = [=]
    {
        const auto c = make_inputs({ 1, 2, 3, 4 });
        VERIFY(c.first() == 1);
        VERIFY(c.last() == 4);
        VERIFY(c.first([](int x) { return x > 2; }) == 3);
        VERIFY(c.last([](int x) { return x < 3; }) == 2);
        VERIFY(c.first([](int x) { return x > 10; }, -1) == -1);
        VERIFY(c.last([](int, const key& k) { return k.as_integer() == 0; }, -1) == 1);

        const auto e = make_inputs({});
        VERIFY(e.first(nullptr, 42) == 42);
        VERIFY(e.last(nullptr, 42) == 42);
    };

    tests["skip"] = [=]
    {
        const auto res = make_inputs({ 10, 20, 30, 40 }).skip(2).to_array();
        VERIFY((res.values() == vec_t{ 30, 40 }));
        VERIFY((res.keys() == keys_t{ 2, 3 }));

        VERIFY(make_inputs({ 10, 20, 30, 40 }).skip(10).to_array().empty());
        VERIFY(make_inputs({ 10, 20 }).skip(0).count() == 2);
    };

    tests["count"] = [=]
    {
        const auto c = make_inputs({ 1, 2, 3, 4, 5 }).filter([](int x) { return x != 3; });
        const auto n = c.count();
        VERIFY(n == 4);
        VERIFY(c.to_array().size() == n);
        VERIFY(c.first() == 1);

        VERIFY(make_inputs({}).count() == 0);
    };

    tests["load"] = [=]
    {
        const auto c = make_inputs({ 1, 2, 3 }).map([](int x) { return x * x; });
        const auto loaded = c.load();

        VERIFY(loaded.to_array() == c.to_array());
        VERIFY(loaded.use_cache() == c.use_cache());
    };

    tests["defer"] = [=]
    {
        const auto c = make_inputs({ 1, 2, 3 });

        // single value
        const auto n = c.defer([](const collection<int>& self) { return self.count(); });
        VERIFY((n.to_array().values() == std::vector<size_t>{ 3 }));
        VERIFY((n.to_array().keys() == keys_t{ 0 }));

        // flattened
        const auto twice = c.defer([](const collection<int>& self)
        {
            return self.map([](int x) { return x * 2; });
        });
        VERIFY((twice.to_array().values() == vec_t{ 2, 4, 6 }));

        // absent
        const auto none = c.defer([](const collection<int>&) { return maybe<int>{}; });
        VERIFY(none.is_empty());

        const auto some = c.defer([](const collection<int>& self) { return maybe<int>{ self.last() }; });
        VERIFY((some.to_array().values() == vec_t{ 3 }));
    };

    tests["range-for"] = [=]
    {
        int64_t sum = 0;
        for(const auto& e : make_inputs({ 1, 2, 3 })) {
            sum += e.first.as_integer() * 100 + e.second;
        }
        VERIFY(sum == 306);

        for(const auto& e : make_inputs({})) {
            VERIFY(!"unreachable");
            (void)e;
        }
    };

    tests["map recursive"] = [=]
    {
        const auto res = make_inputs({ 1, 2, 3, 4 })
            .group_by([](int x) { return x % 2; })
            .map([](int x) { return x * 10; }, lazy::recursive)
            .to_array();

        VERIFY((res.keys() == keys_t{ 1, 0 }));
        VERIFY((res.at(1).values() == vec_t{ 10, 30 }));
        VERIFY((res.at(0).values() == vec_t{ 20, 40 }));
    };

    tests["to_array with callback"] = [=]
    {
        const auto res = make_inputs({ 1, 2, 3, 4 })
            .group_by([](int x) { return x % 2 ? "odd" : "even"; })
            .to_array([](int x, const key& k) { return k.to_string() + "=" + std::to_string(x); });

        VERIFY((res.at("odd").values()  == std::vector<std::string>{ "0=1", "2=3" }));
        VERIFY((res.at("even").values() == std::vector<std::string>{ "1=2", "3=4" }));
    };

    return tests;
}

static void run_tests()
{
    auto test_array = make_tests([](vec_t xs)
    {
        return collection<int>::create(std::move(xs));
    });

    auto test_factory = make_tests([](vec_t xs)
    {
        return collection<int>::create([xs]
        {
            return counting_producer(xs, std::make_shared<size_t>(0));
        });
    });

    auto test_cached = make_tests([](vec_t xs)
    {
        return collection<int>::create(counting_producer(std::move(xs), std::make_shared<size_t>(0)), true);
    });

    std::map<std::string, std::function<void()>> test_other{};

    /////////////////////////////////////////////////////////////////////////

    test_other["ordered_map"] = [&]
    {
        ordered_map<int> m{};
        VERIFY( m.set("a", 1));
        VERIFY( m.set(5, 2));
        VERIFY(!m.set("a", 3)); // overwritten in place
        m.push_back(4);

        VERIFY((m.keys() == keys_t{ "a", 5, 6 }));
        VERIFY((m.values() == vec_t{ 3, 2, 4 }));
        VERIFY( m.contains(6));
        VERIFY(!m.contains("6"));
        VERIFY(*m.find(5) == 2);
        VERIFY(m.find("b") == nullptr);

        m.reverse();
        VERIFY((m.keys() == keys_t{ 6, 5, "a" }));
        VERIFY(m.at("a") == 3);

        bool thrown = false;
        try {
            m.at("b");
        } catch(const std::out_of_range&) {
            thrown = true;
        }
        VERIFY(thrown);
    };

    test_other["loosely_equals"] = [&]
    {
        VERIFY( loosely_equals(1, 1));
        VERIFY( loosely_equals(1, "1"));
        VERIFY( loosely_equals("1.0", 1));
        VERIFY( loosely_equals("01", "1"));
        VERIFY( loosely_equals("a", "a"));
        VERIFY(!loosely_equals(1, "1a"));
        VERIFY(!loosely_equals(0, "a"));
        VERIFY(!loosely_equals(key{}, 0));
        VERIFY(!loosely_equals(key{}, ""));
        VERIFY( loosely_equals(key{}, key{}));
    };

    test_other["truthy"] = [&]
    {
        VERIFY(!impl::truthy(0));
        VERIFY( impl::truthy(-1));
        VERIFY(!impl::truthy(0.0));
        VERIFY(!impl::truthy(false));
        VERIFY(!impl::truthy(std::string{}));
        VERIFY(!impl::truthy(std::string{ "0" }));
        VERIFY( impl::truthy(std::string{ "00" }));
        VERIFY(!impl::truthy(vec_t{}));
        VERIFY( impl::truthy(vec_t{ 0 }));
        VERIFY(!impl::truthy(std::shared_ptr<int>{}));
        VERIFY(!impl::truthy(maybe<int>{}));
        VERIFY( impl::truthy(maybe<int>{ 0 }));
        VERIFY(!impl::truthy(key{ 0 }));
        VERIFY( impl::truthy(key{ "a" }));
        VERIFY( impl::truthy(point{ 0, 0 }));
    };

    test_other["generate"] = [&]
    {
        const auto keyed = lazy::from(lazy::generate([i = 0]() mutable
        {
            return i < 3 ? i++ : lazy::end_seq();
        }));
        VERIFY((keyed.to_array() == ordered_map<int>{ { 0, 0 }, { 1, 1 }, { 2, 2 } }));

        // entries are passed through with their keys
        const std::vector<entry<int>> src = { { "x", 1 }, { 7, 2 } };
        const auto entries = lazy::from(lazy::generate([src, i = size_t(0)]() mutable -> entry<int>
        {
            if(i == src.size()) {
                return lazy::end_seq();
            }
            return src[i++];
        }));
        VERIFY((entries.to_array().keys() == keys_t{ "x", 7 }));
    };

    test_other["from"] = [&]
    {
        const auto c = lazy::from(std::map<std::string, int>{ { "b", 2 }, { "a", 1 } });
        VERIFY((c.to_array().keys() == keys_t{ "a", "b" }));

        VERIFY(lazy::from(vec_t{ 1, 2 }, true).use_cache());
        VERIFY(lazy::from(ordered_map<int>{ { "z", 0 } }).get("z", -1) == 0);
    };

    test_other["caching_iterator"] = [&]
    {
        auto num_pulled = std::make_shared<size_t>(0);
        caching_iterator<int> it{ counting_producer({ 1, 2, 3 }, num_pulled) };

        // the first entry is pre-fetched
        VERIFY(*num_pulled == 1);
        VERIFY(it.valid());
        VERIFY(it.key() == 0);
        VERIFY(it.current() == 1);

        it.next();
        VERIFY(*num_pulled == 2);
        VERIFY(it.key() == 1);

        // draining does not move the cursor
        VERIFY(it.to_array().size() == 3);
        VERIFY(it.exhausted());
        VERIFY(it.key() == 1);

        it.next();
        it.next();
        VERIFY(!it.valid());
        VERIFY(it.key().is_null());

        it.next(); // no-op past the end
        VERIFY(!it.valid());

        it.rewind();
        VERIFY(it.current() == 1);
        VERIFY(*num_pulled == 3);
    };

    test_other["caching_iterator: rewind after partial read drains the source"] = [&]
    {
        auto num_pulled = std::make_shared<size_t>(0);
        caching_iterator<int> it{ counting_producer({ 1, 2, 3, 4 }, num_pulled) };

        it.next();
        VERIFY(*num_pulled == 2);
        VERIFY(!it.exhausted());

        it.rewind();
        VERIFY(*num_pulled == 4);
        VERIFY(it.exhausted());

        vec_t seen{};
        for(; it.valid(); it.next()) {
            seen.push_back(it.current());
        }
        VERIFY((seen == vec_t{ 1, 2, 3, 4 }));
    };

    test_other["caching_iterator: rewind before advancing is cheap"] = [&]
    {
        auto num_pulled = std::make_shared<size_t>(0);
        caching_iterator<int> it{ counting_producer({ 1, 2, 3 }, num_pulled) };
        it.rewind();
        VERIFY(*num_pulled == 1);
        VERIFY(!it.exhausted());
    };

    test_other["caching_iterator: duplicate keys"] = [&]
    {
        const std::vector<entry<int>> src = { { "a", 1 }, { "b", 2 }, { "a", 3 }, { "c", 4 } };
        caching_iterator<int> it{ lazy::generate([src, i = size_t(0)]() mutable -> entry<int>
        {
            if(i == src.size()) {
                return lazy::end_seq();
            }
            return src[i++];
        })};

        const auto& res = it.to_array();
        VERIFY((res.keys() == keys_t{ "a", "b", "c" }));
        VERIFY((res.values() == vec_t{ 3, 2, 4 }));
    };

    test_other["caching_iterator: empty source"] = [&]
    {
        caching_iterator<int> it{ counting_producer({}, std::make_shared<size_t>(0)) };
        VERIFY(!it.valid());
        VERIFY(it.exhausted());
        VERIFY(it.key().is_null());
        VERIFY(it.to_array().empty());
        it.rewind();
        VERIFY(!it.valid());
    };

    test_other["generator_iterator"] = [&]
    {
        generator_iterator<int> it{ counting_producer({ 1, 2 }, std::make_shared<size_t>(0)) };
        it.rewind(); // no-op before advancing
        VERIFY(it.current() == 1);
        it.next();
        VERIFY(it.key() == 1);

        bool thrown = false;
        try {
            it.rewind();
        } catch(const std::logic_error&) {
            thrown = true;
        }
        VERIFY(thrown);

        it.next();
        VERIFY(!it.valid());

        thrown = false;
        try {
            it.current();
        } catch(const std::logic_error&) {
            thrown = true;
        }
        VERIFY(thrown);
    };

    test_other["cached: the producer is consumed once"] = [&]
    {
        auto num_pulled = std::make_shared<size_t>(0);
        const auto c = collection<int>::create(counting_producer({ 1, 2, 3, 4 }, num_pulled), true)
            .filter([](int x) { return x > 1; });

        VERIFY(c.use_cache());
        VERIFY(*num_pulled == 0); // nothing is pulled until iterated

        const auto res = c.to_array();
        VERIFY(c.to_array() == res);
        VERIFY(c.count() == 3);
        VERIFY(*num_pulled == 4);
    };

    test_other["cached: partial drain, then re-iterate"] = [&]
    {
        auto num_pulled = std::make_shared<size_t>(0);
        const auto c = collection<int>::create(counting_producer({ 1, 2, 3, 4, 5 }, num_pulled), true);

        VERIFY(c.first([](int x) { return x == 2; }) == 2);
        VERIFY(*num_pulled == 2);

        vec_t visited{};
        c.each([&](int x) { visited.push_back(x); return x < 3; });
        VERIFY((visited == vec_t{ 1, 2, 3 }));

        VERIFY((c.to_array().values() == vec_t{ 1, 2, 3, 4, 5 }));
        VERIFY(*num_pulled == 5);
    };

    test_other["cached: count rewinds"] = [&]
    {
        const auto c = collection<int>::create(counting_producer({ 1, 2, 3 }, std::make_shared<size_t>(0)), true);
        VERIFY(c.count() == 3);
        VERIFY(c.cached_iterator()->valid());
        VERIFY(c.cached_iterator()->key() == 0);
        VERIFY(c.first() == 1);
    };

    test_other["uncached: factory re-runs on each terminal call"] = [&]
    {
        for(const bool use_cache : { false, true }) {
            auto num_calls = std::make_shared<size_t>(0);
            const auto c = collection<int>::create([num_calls]
            {
                ++*num_calls;
                return counting_producer({ 1, 2 }, std::make_shared<size_t>(0));
            }, use_cache);

            VERIFY(c.count() == 2);
            VERIFY(c.to_array().size() == 2);
            VERIFY(*num_calls == (use_cache ? 1UL : 2UL));
        }
    };

    test_other["uncached: looking at a one-shot producer does not consume it"] = [&]
    {
        auto num_pulled = std::make_shared<size_t>(0);
        const auto c = collection<int>::create(counting_producer({ 1, 2, 3 }, num_pulled));
        VERIFY(!c.is_empty());
        VERIFY(c.first() == 1);
        VERIFY(c.first() == 1);
        VERIFY(*num_pulled == 1);

        VERIFY((c.to_array().values() == vec_t{ 1, 2, 3 }));

        // exhausted; a one-shot producer can't be traversed again
        bool thrown = false;
        try {
            c.count();
        } catch(const std::logic_error&) {
            thrown = true;
        }
        VERIFY(thrown);
    };

    test_other["uncached: a derived node reads the one-shot source from its head"] = [&]
    {
        const auto c = collection<int>::create(counting_producer({ 1, 2, 3 }, std::make_shared<size_t>(0)));
        const auto tens = c.map([](int x) { return x * 10; });
        VERIFY(tens.first() == 10);
        VERIFY((tens.to_array().values() == vec_t{ 10, 20, 30 }));
    };

    test_other["factory receives the node"] = [&]
    {
        for(const bool use_cache : { false, true }) {
            bool seen = !use_cache;
            const auto c = collection<int>::create(collection<int>::factory_type{ [&seen](const collection<int>& self)
            {
                seen = self.use_cache();
                return counting_producer({ 1 }, std::make_shared<size_t>(0));
            }}, use_cache);

            VERIFY(seen != use_cache); // not called until iterated
            VERIFY(c.count() == 1);
            VERIFY(seen == use_cache);
        }
    };

    test_other["invalid source"] = [&]
    {
        // construction never inspects the source
        const auto no_producer = collection<int>::create(producer<int>{});
        const auto no_factory  = collection<int>::create(collection<int>::factory_type{});
        const auto no_result   = collection<int>::create(collection<int>::factory_type{ [](const collection<int>&)
        {
            return producer<int>{};
        }});

        size_t num_thrown = 0;

        try {
            no_producer.to_array();
        } catch(const invalid_source&) {
            num_thrown++;
        }

        try {
            no_factory.map([](int x) { return x; }).count();
        } catch(const invalid_source&) {
            num_thrown++;
        }

        try {
            no_result.is_empty();
        } catch(const invalid_producer_result&) {
            num_thrown++;
        }

        VERIFY(num_thrown == 3);
    };

    test_other["defer is invoked on first iteration"] = [&]
    {
        for(const bool use_cache : { false, true }) {
            auto num_calls = std::make_shared<size_t>(0);
            const auto d = collection<int>::create({ 1, 2 }, use_cache).defer([num_calls](const collection<int>& self)
            {
                ++*num_calls;
                return self.reverse();
            });

            VERIFY(*num_calls == 0);
            VERIFY((d.to_array().values() == vec_t{ 2, 1 }));
            VERIFY((d.to_array().keys() == keys_t{ 1, 0 }));
            VERIFY(*num_calls == (use_cache ? 1UL : 2UL));
        }
    };

    test_other["last: a found null is not the default"] = [&]
    {
        const auto c = collection<const char*>::create({ nullptr });
        VERIFY(c.last(nullptr, "default") == nullptr);
        VERIFY(c.first(nullptr, "default") == nullptr);

        VERIFY(collection<int>::empty().last(nullptr, 42) == 42);
    };

    test_other["group_by items by field"] = [&]
    {
        const auto groups = collection<item>::create({ { "a", 1 }, { "a", 2 }, { "b", 3 } }, true)
            .group_by([](const item& x) { return x.k; });

        VERIFY(groups.use_cache());

        const auto res = groups.to_array();
        VERIFY((res.keys() == keys_t{ "a", "b" }));
        VERIFY((res.at("a").keys() == keys_t{ 0, 1 }));
        VERIFY((res.at("b").keys() == keys_t{ 2 }));
        VERIFY(res.at("b").at(2).n == 3);

        VERIFY(groups.first().use_cache());
        VERIFY(groups.first().count() == 2);
    };

    test_other["group_by drops absent keys"] = [&]
    {
        const auto c = collection<int>::create({ 1, 2, 3, 4 });

        const auto by_maybe = c.group_by([](int x)
        {
            return x > 2 ? maybe<std::string>{ "big" } : maybe<std::string>{};
        });
        VERIFY((by_maybe.keys().to_array().values() == keys_t{ "big" }));
        VERIFY(by_maybe.first().count() == 2);

        const auto by_key = c.group_by([](int x, const key& k)
        {
            return x % 2 ? k : key{};
        });
        VERIFY((by_key.keys().to_array().values() == keys_t{ 0, 2 }));

        const auto by_object = c.group_by([](int x) { return point{ x, x }; });
        VERIFY(by_object.is_empty());
    };

    test_other["group_by: textual and integer keys stay distinct"] = [&]
    {
        const auto groups = collection<int>::create({ 1, 2, 3 }).group_by([](int x)
        {
            return x % 2 ? key{ "5" } : key{ 5 };
        });
        VERIFY((groups.keys().to_array().values() == keys_t{ "5", 5 }));
        VERIFY(groups.first().count() == 2);
        VERIFY(groups.last().count() == 1);
    };

    test_other["typed"] = [&]
    {
        const auto src = collection<std::string>::create({ "1", "22", "x3", "4" });
        const auto digits = lazy::typed("Digits", types::of<std::string>(types::char_class::digit), src);

        std::vector<std::string> visited{};
        bool thrown = false;
        try {
            digits.each([&](const std::string& s) { visited.push_back(s); });
        } catch(const type_mismatch& e) {
            thrown = true;
            VERIFY(e.declaring() == "Digits");
            VERIFY(e.expected() == "digit");
            VERIFY(e.actual() == "string");
            VERIFY(e.at() == 2);
            VERIFY(std::string{ e.what() } == "Each element of Digits must be digit, string given at \"2\" index");
        }
        VERIFY(thrown);
        VERIFY((visited == std::vector<std::string>{ "1", "22" }));

        // derived collections validate through the typed root
        thrown = false;
        try {
            digits.skip(3).count();
        } catch(const type_mismatch& e) {
            thrown = e.at() == 2;
        }
        VERIFY(thrown);
        VERIFY(digits.first() == "1");
    };

    test_other["typed: valid items pass through"] = [&]
    {
        const auto src = collection<int>::create({ 1, 2, 3 }, true);
        const auto ints = lazy::typed("Numbers", types::named<int>("int"), src);

        VERIFY(ints.use_cache());
        VERIFY((ints.map([](int x) { return x * 2; }).to_array().values() == vec_t{ 2, 4, 6 }));
    };

    test_other["typed: empty item type"] = [&]
    {
        const auto c = lazy::typed("Anything", types::validator<int>{}, collection<int>::create({ 1 }));

        bool thrown = false;
        try {
            c.count();
        } catch(const type_mismatch&) {
            ;
        } catch(const std::logic_error&) {
            thrown = true;
        }
        VERIFY(thrown);
    };

    /////////////////////////////////////////////////////////////////////////
    size_t num_failed = 0;
    size_t num_ok = 0;
    for(auto&& tests : { test_array, test_factory, test_cached, test_other })
        for(const auto& kv : tests)
    {
        try {
            kv.second();
            num_ok++;
        } catch(const std::exception& e) {
            num_failed++;
            std::cerr << "Failed test '" << kv.first << "' :" << e.what() << "\n";
        }
    }

    if(num_failed == 0) {
        std::cerr << "lazy: ran " << num_ok << " tests - OK\n";
    } else {
        throw std::runtime_error(std::to_string(num_failed) + " lazy tests failed.");
    }
}

} // namespace impl
} // namespace lazy
} // namespace lazycoll

#endif // LAZYCOLL_LAZY_ENABLE_RUN_TESTS

#endif // LAZYCOLL_LAZY_HPP_
