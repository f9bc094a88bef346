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
#ifndef LAZYCOLL_TYPES_HPP_
#define LAZYCOLL_TYPES_HPP_

#include <stdexcept>
#include <string>
#include <functional>
#include <memory>
#include <typeinfo>
#include <type_traits>
#include <utility>
#include <cctype>
#include <cstddef>


#define LAZYCOLL_THROW(exception_t, msg) throw exception_t( std::string{} + __FILE__ + ":" + std::to_string(__LINE__) + ": " + (msg) );

namespace lazycoll
{

/// @brief Item-type checks shared by typed pipelines and indexed collections.
///
/// A check is selected once, when a `validator` is built, from a closed set:
/// a primitive-kind tag, a character-class tag, or a capability (base class).
/// Validation itself is a pure function of the item and never throws.
namespace types
{
    /// Observed kind of a value.
    enum class kind
    {
        null,
        boolean,
        integer,
        floating,
        string,
        array,
        object
    };

    /// Primitive-kind predicates.
    enum class primitive
    {
        null,
        boolean,
        integer,
        floating,
        numeric,    // integer, floating, or a numeric string
        string,
        scalar,     // boolean, integer, floating, or string
        array,
        iterable,
        countable,
        object
    };

    /// Character-class predicates; hold for non-empty text where every char is in the class.
    enum class char_class
    {
        alnum,
        alpha,
        cntrl,
        digit,
        graph,
        lower,
        print,
        punct,
        space,
        upper,
        xdigit
    };

    inline const char* to_string(kind k)
    {
        switch(k) {
            case kind::null:     return "null";
            case kind::boolean:  return "bool";
            case kind::integer:  return "int";
            case kind::floating: return "float";
            case kind::string:   return "string";
            case kind::array:    return "array";
            case kind::object:   return "object";
        }
        return "unknown";
    }

    inline const char* to_string(primitive p)
    {
        switch(p) {
            case primitive::null:      return "null";
            case primitive::boolean:   return "bool";
            case primitive::integer:   return "int";
            case primitive::floating:  return "float";
            case primitive::numeric:   return "numeric";
            case primitive::string:    return "string";
            case primitive::scalar:    return "scalar";
            case primitive::array:     return "array";
            case primitive::iterable:  return "iterable";
            case primitive::countable: return "countable";
            case primitive::object:    return "object";
        }
        return "unknown";
    }

    inline const char* to_string(char_class c)
    {
        switch(c) {
            case char_class::alnum:  return "alnum";
            case char_class::alpha:  return "alpha";
            case char_class::cntrl:  return "cntrl";
            case char_class::digit:  return "digit";
            case char_class::graph:  return "graph";
            case char_class::lower:  return "lower";
            case char_class::print:  return "print";
            case char_class::punct:  return "punct";
            case char_class::space:  return "space";
            case char_class::upper:  return "upper";
            case char_class::xdigit: return "xdigit";
        }
        return "unknown";
    }

    template<typename T>
    kind kind_of(const T& x);

namespace impl
{
    /////////////////////////////////////////////////////////////////////////////
    // Will be used to control SFINAE priority of ambiguous overload resolutions.
    // https://stackoverflow.com/questions/34419045

    struct pr_lowest {};
    struct pr_low     : pr_lowest {};
    struct pr_high    : pr_low    {};
    struct pr_highest : pr_high   {};

    using resolve_overload = pr_highest;

    /////////////////////////////////////////////////////////////////////////
    // Member-detection traits.

    // A dynamically-typed value may report its own kind.
    template<typename T, typename = void>
    struct has_kind_member : std::false_type {};

    template<typename T>
    struct has_kind_member<T, decltype(void(std::declval<const T&>().kind()))>
        : std::is_same<decltype(std::declval<const T&>().kind()), types::kind> {};

    template<typename T, typename = void>
    struct has_begin_end : std::false_type {};

    template<typename T>
    struct has_begin_end<T, decltype(void(std::declval<const T&>().begin() != std::declval<const T&>().end()))>
        : std::true_type {};

    template<typename T, typename = void>
    struct has_size : std::false_type {};

    template<typename T>
    struct has_size<T, decltype(void(std::declval<const T&>().size()))> : std::true_type {};

    template<typename T, typename = void>
    struct has_count : std::false_type {};

    template<typename T>
    struct has_count<T, decltype(void(std::declval<const T&>().count()))> : std::true_type {};

    // A type may advertise capabilities by name.
    template<typename T, typename = void>
    struct has_implements_member : std::false_type {};

    template<typename T>
    struct has_implements_member<T, decltype(void(static_cast<bool>(std::declval<const T&>().implements(std::string{}))))>
        : std::true_type {};

    /////////////////////////////////////////////////////////////////////////
    template<typename T> struct pointee                     { using type = void; };
    template<typename T> struct pointee<T*>                 { using type = T;    };
    template<typename T> struct pointee<std::shared_ptr<T>> { using type = T;    };
    template<typename T, typename D>
                         struct pointee<std::unique_ptr<T, D>> { using type = T; };

    template<typename T>
    struct is_pointer_like
        : std::integral_constant<bool, !std::is_void<typename std::remove_cv<typename pointee<T>::type>::type>::value>
    {};

    template<typename T>
    struct is_text
        : std::integral_constant<bool, std::is_same<T, std::string>::value
                                    || std::is_same<T, const char*>::value
                                    || std::is_same<T, char*>::value>
    {};

    /////////////////////////////////////////////////////////////////////////
    // Static classification of T; the order matters (e.g. bool is integral,
    // char* is a pointer, std::string has begin/end and size).
    enum class cat { dynamic, null, boolean, integer, floating, text, pointer, array, object };

    template<cat C>
    using cat_tag = std::integral_constant<cat, C>;

    template<typename T>
    struct category
    {
        static constexpr cat value =
              has_kind_member<T>::value                        ? cat::dynamic
            : std::is_same<T, std::nullptr_t>::value           ? cat::null
            : std::is_same<T, bool>::value                     ? cat::boolean
            : std::is_integral<T>::value                       ? cat::integer
            : std::is_floating_point<T>::value                 ? cat::floating
            : is_text<T>::value                                ? cat::text
            : is_pointer_like<T>::value                        ? cat::pointer
            : has_begin_end<T>::value && has_size<T>::value    ? cat::array
            :                                                    cat::object;
    };

    template<typename T>
    using category_tag = cat_tag<category<T>::value>;

    /////////////////////////////////////////////////////////////////////////
    inline bool assign_text(const std::string& s, std::string& out)
    {
        out = s;
        return true;
    }

    inline bool assign_text(const char* s, std::string& out)
    {
        if(!s) {
            return false;
        }
        out = s;
        return true;
    }

    template<typename T>
    bool text(const T& x, std::string& out);

    template<typename T>
    bool text(const T& x, std::string& out, cat_tag<cat::text>)
    {
        return assign_text(x, out);
    }

    template<typename T>
    bool text(const T& p, std::string& out, cat_tag<cat::pointer>)
    {
        return p && impl::text(*p, out);
    }

    template<typename T, typename Tag>
    bool text(const T&, std::string&, Tag)
    {
        return false;
    }

    /// Extract the text of a textual item, looking through pointer-likes.
    template<typename T>
    bool text(const T& x, std::string& out)
    {
        return impl::text(x, out, category_tag<T>{});
    }

    /////////////////////////////////////////////////////////////////////////
    template<typename T>
    kind classify(const T& x, cat_tag<cat::dynamic>)
    {
        return x.kind();
    }

    template<typename T> kind classify(const T&, cat_tag<cat::null>)     { return kind::null;     }
    template<typename T> kind classify(const T&, cat_tag<cat::boolean>)  { return kind::boolean;  }
    template<typename T> kind classify(const T&, cat_tag<cat::integer>)  { return kind::integer;  }
    template<typename T> kind classify(const T&, cat_tag<cat::floating>) { return kind::floating; }
    template<typename T> kind classify(const T&, cat_tag<cat::array>)    { return kind::array;    }
    template<typename T> kind classify(const T&, cat_tag<cat::object>)   { return kind::object;   }

    template<typename T>
    kind classify(const T& x, cat_tag<cat::text>)
    {
        std::string s;
        return assign_text(x, s) ? kind::string : kind::null;
    }

    template<typename T>
    kind classify(const T& p, cat_tag<cat::pointer>)
    {
        return p ? types::kind_of(*p) : kind::null;
    }

    /////////////////////////////////////////////////////////////////////////
    template<typename T>
    bool is_iterable(const T& x);

    template<typename T>
    bool is_iterable(const T& p, cat_tag<cat::pointer>)
    {
        return p && impl::is_iterable(*p);
    }

    template<typename T, typename Tag>
    bool is_iterable(const T&, Tag)
    {
        return has_begin_end<T>::value;
    }

    template<typename T>
    bool is_iterable(const T& x)
    {
        return impl::is_iterable(x, category_tag<T>{});
    }

    template<typename T>
    bool is_countable(const T& x);

    template<typename T>
    bool is_countable(const T& p, cat_tag<cat::pointer>)
    {
        return p && impl::is_countable(*p);
    }

    template<typename T, typename Tag>
    bool is_countable(const T&, Tag)
    {
        return has_size<T>::value || has_count<T>::value;
    }

    template<typename T>
    bool is_countable(const T& x)
    {
        return impl::is_countable(x, category_tag<T>{});
    }

    /////////////////////////////////////////////////////////////////////////
    // PHP-like numeric-string: [ws][sign](digits[.digits]|.digits)[(e|E)[sign]digits][ws]
    inline bool is_numeric_text(const std::string& s)
    {
        const auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
        const auto is_digit = [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; };

        size_t i = 0;
        const size_t n = s.size();

        while(i < n && is_space(s[i])) {
            ++i;
        }

        if(i < n && (s[i] == '+' || s[i] == '-')) {
            ++i;
        }

        size_t num_digits = 0;
        for(; i < n && is_digit(s[i]); ++i) {
            ++num_digits;
        }

        if(i < n && s[i] == '.') {
            for(++i; i < n && is_digit(s[i]); ++i) {
                ++num_digits;
            }
        }

        if(num_digits == 0) {
            return false;
        }

        if(i < n && (s[i] == 'e' || s[i] == 'E')) {
            size_t j = i + 1;
            if(j < n && (s[j] == '+' || s[j] == '-')) {
                ++j;
            }

            size_t num_exp_digits = 0;
            for(; j < n && is_digit(s[j]); ++j) {
                ++num_exp_digits;
            }

            if(num_exp_digits == 0) {
                return false;
            }
            i = j;
        }

        while(i < n && is_space(s[i])) {
            ++i;
        }

        return i == n;
    }

    inline bool in_class(char_class c, unsigned char ch)
    {
        switch(c) {
            case char_class::alnum:  return std::isalnum(ch)  != 0;
            case char_class::alpha:  return std::isalpha(ch)  != 0;
            case char_class::cntrl:  return std::iscntrl(ch)  != 0;
            case char_class::digit:  return std::isdigit(ch)  != 0;
            case char_class::graph:  return std::isgraph(ch)  != 0;
            case char_class::lower:  return std::islower(ch)  != 0;
            case char_class::print:  return std::isprint(ch)  != 0;
            case char_class::punct:  return std::ispunct(ch)  != 0;
            case char_class::space:  return std::isspace(ch)  != 0;
            case char_class::upper:  return std::isupper(ch)  != 0;
            case char_class::xdigit: return std::isxdigit(ch) != 0;
        }
        return false;
    }

    inline bool all_in_class(const std::string& s, char_class c)
    {
        if(s.empty()) {
            return false;
        }

        for(const char ch : s) {
            if(!in_class(c, static_cast<unsigned char>(ch))) {
                return false;
            }
        }
        return true;
    }

    /////////////////////////////////////////////////////////////////////////
    template<typename T>
    bool satisfies(const T& x, primitive p)
    {
        const kind k = types::kind_of(x);

        switch(p) {
            case primitive::null:     return k == kind::null;
            case primitive::boolean:  return k == kind::boolean;
            case primitive::integer:  return k == kind::integer;
            case primitive::floating: return k == kind::floating;
            case primitive::string:   return k == kind::string;
            case primitive::array:    return k == kind::array;
            case primitive::object:   return k == kind::object;

            case primitive::numeric:
            {
                if(k == kind::integer || k == kind::floating) {
                    return true;
                }
                std::string s;
                return k == kind::string && impl::text(x, s) && is_numeric_text(s);
            }

            case primitive::scalar:
                return k == kind::boolean
                    || k == kind::integer
                    || k == kind::floating
                    || k == kind::string;

            case primitive::iterable:  return k == kind::array || impl::is_iterable(x);
            case primitive::countable: return k == kind::array || impl::is_countable(x);
        }
        return false;
    }

    /////////////////////////////////////////////////////////////////////////
    template<typename I, typename T>
    bool is_instance_of(const T& x, std::true_type) // both polymorphic
    {
        return dynamic_cast<const I*>(&x) != nullptr;
    }

    template<typename I, typename T>
    bool is_instance_of(const T&, std::false_type)
    {
        return std::is_same<I, T>::value || std::is_base_of<I, T>::value;
    }

    template<typename I, typename T>
    bool implements(const T& x);

    template<typename I, typename T>
    bool implements(const T& p, cat_tag<cat::pointer>)
    {
        return p && impl::implements<I>(*p);
    }

    template<typename I, typename T, typename Tag>
    bool implements(const T& x, Tag)
    {
        using both_polymorphic = std::integral_constant<bool, std::is_polymorphic<T>::value
                                                           && std::is_polymorphic<I>::value>;
        return impl::is_instance_of<I>(x, both_polymorphic{});
    }

    template<typename I, typename T>
    bool implements(const T& x)
    {
        return impl::implements<I>(x, category_tag<T>{});
    }

    /////////////////////////////////////////////////////////////////////////
    template<typename T>
    bool advertises(const T& x, const std::string& name);

    template<typename T>
    bool advertises_member(const T& x, const std::string& name, std::true_type)
    {
        return static_cast<bool>(x.implements(name));
    }

    template<typename T>
    bool advertises_member(const T&, const std::string&, std::false_type)
    {
        return false;
    }

    template<typename T>
    bool advertises(const T& p, const std::string& name, cat_tag<cat::pointer>)
    {
        return p && impl::advertises(*p, name);
    }

    template<typename T, typename Tag>
    bool advertises(const T& x, const std::string& name, Tag)
    {
        return impl::advertises_member(x, name, has_implements_member<T>{});
    }

    template<typename T>
    bool advertises(const T& x, const std::string& name)
    {
        return impl::advertises(x, name, category_tag<T>{});
    }

    /////////////////////////////////////////////////////////////////////////
    template<typename T>
    std::string describe(const T& x);

    template<typename T>
    std::string describe(const T& p, cat_tag<cat::pointer>)
    {
        return p ? impl::describe(*p) : std::string{ to_string(kind::null) };
    }

    template<typename T, typename Tag>
    std::string describe(const T& x, Tag)
    {
        const kind k = types::kind_of(x);
        return k == kind::object ? std::string{ typeid(x).name() }
                                 : std::string{ to_string(k) };
    }

    template<typename T>
    std::string describe(const T& x)
    {
        return impl::describe(x, category_tag<T>{});
    }

    /////////////////////////////////////////////////////////////////////////
    inline std::string lowercase(std::string s)
    {
        for(auto& ch : s) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return s;
    }

    inline bool parse(const std::string& name, primitive& out)
    {
        static const struct { const char* name; primitive p; } names[] =
        {
            { "null",      primitive::null      },
            { "bool",      primitive::boolean   },
            { "int",       primitive::integer   },
            { "integer",   primitive::integer   },
            { "long",      primitive::integer   },
            { "float",     primitive::floating  },
            { "double",    primitive::floating  },
            { "numeric",   primitive::numeric   },
            { "string",    primitive::string    },
            { "scalar",    primitive::scalar    },
            { "array",     primitive::array     },
            { "iterable",  primitive::iterable  },
            { "countable", primitive::countable },
            { "object",    primitive::object    },
        };

        for(const auto& n : names) {
            if(name == n.name) {
                out = n.p;
                return true;
            }
        }
        return false;
    }

    inline bool parse(const std::string& name, char_class& out)
    {
        static const char_class classes[] =
        {
            char_class::alnum, char_class::alpha, char_class::cntrl,
            char_class::digit, char_class::graph, char_class::lower,
            char_class::print, char_class::punct, char_class::space,
            char_class::upper, char_class::xdigit
        };

        for(const auto c : classes) {
            if(name == to_string(c)) {
                out = c;
                return true;
            }
        }
        return false;
    }

}   // namespace impl

    /////////////////////////////////////////////////////////////////////////
    /// @brief Observed kind of `x`.
    ///
    /// Pointer-likes (raw, `shared_ptr`, `unique_ptr`) are `null` when empty
    /// and otherwise report the kind of the pointee. A type with a member
    /// `types::kind kind() const` reports its own kind (dynamic values).
    template<typename T>
    kind kind_of(const T& x)
    {
        return impl::classify(x, impl::category_tag<T>{});
    }

    /// @brief Name of the observed kind of `x` (or RTTI type-name for objects); for diagnostics.
    template<typename T>
    std::string describe(const T& x)
    {
        return impl::describe(x);
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief A named item-type predicate.
    ///
    /// A default-constructed validator has an empty name and accepts nothing.
    template<typename T>
    class validator
    {
    public:
        using value_type     = T;
        using predicate_type = std::function<bool(const T&)>;

        validator() = default;

        validator(std::string name, predicate_type pred)
            : m_name{ std::move(name) }
            , m_pred{ std::move(pred) }
        {}

        bool operator()(const T& x) const
        {
            return m_pred && m_pred(x);
        }

        /// Expected-type name, as reported in type-mismatch errors.
        const std::string& name() const
        {
            return m_name;
        }

    private:
        std::string m_name;
        predicate_type m_pred;
    };

    /// @brief Primitive-kind check.
    template<typename T>
    validator<T> of(primitive p)
    {
        return { to_string(p), [p](const T& x)
        {
            return impl::satisfies(x, p);
        }};
    }

    /// @brief Character-class check (textual items only).
    template<typename T>
    validator<T> of(char_class c)
    {
        return { to_string(c), [c](const T& x)
        {
            std::string s;
            return impl::text(x, s) && impl::all_in_class(s, c);
        }};
    }

    /// @brief Capability check: `x` (or its pointee) is an `I`.
    template<typename I, typename T>
    validator<T> implementing(std::string name = typeid(I).name())
    {
        return { std::move(name), [](const T& x)
        {
            return impl::implements<I>(x);
        }};
    }

    /// @brief Check by type-name.
    ///
    /// The name is lower-cased and "boolean" is normalized to "bool". Then, in order:
    /// primitive-kind check; character-class check; a capability the item (or its pointee)
    /// advertises via `bool implements(const std::string&) const`; otherwise false.
    template<typename T>
    validator<T> named(std::string type_name)
    {
        auto norm = impl::lowercase(type_name);
        if(norm == "boolean") {
            norm = "bool";
        }

        primitive p = primitive::null;
        char_class c = char_class::alnum;

        const bool has_primitive = impl::parse(norm, p);
        const bool has_class     = impl::parse(norm, c);

        return { type_name, [=](const T& x)
        {
            if(has_primitive && impl::satisfies(x, p)) {
                return true;
            }

            if(has_class) {
                std::string s;
                if(impl::text(x, s) && impl::all_in_class(s, c)) {
                    return true;
                }
            }

            return impl::advertises(x, type_name);
        }};
    }

    template<typename T>
    bool is_valid(const T& x, const validator<T>& v)
    {
        return v(x);
    }

    template<typename T>
    bool is_valid(const T& x, const std::string& type_name)
    {
        return types::named<T>(type_name)(x);
    }

} // namespace types
} // namespace lazycoll


#if LAZYCOLL_TYPES_ENABLE_RUN_TESTS
#include <map>
#include <vector>
#include <iostream>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) LAZYCOLL_THROW(std::logic_error, "Assertion failed: ( "#expr" ).");
#endif

namespace lazycoll
{
namespace types
{
namespace impl
{

struct shape
{
    virtual ~shape() = default;
};

struct circle : shape {};
struct square : shape {};

// Reports its kind dynamically, like a variant-backed value would.
struct dynamic_value
{
    types::kind k;

    types::kind kind() const
    {
        return k;
    }
};

struct plugin
{
    std::string capability;

    bool implements(const std::string& name) const
    {
        return name == capability;
    }
};

static void run_tests()
{
    std::map<std::string, std::function<void()>> tests{};

    tests["kind_of"] = [&]
    {
        VERIFY(types::kind_of(42) == kind::integer);
        VERIFY(types::kind_of(true) == kind::boolean);
        VERIFY(types::kind_of(4.2) == kind::floating);
        VERIFY(types::kind_of(std::string{ "abc" }) == kind::string);
        VERIFY(types::kind_of(static_cast<const char*>(nullptr)) == kind::null);
        VERIFY(types::kind_of(nullptr) == kind::null);
        VERIFY(types::kind_of(std::vector<int>{{ 1, 2 }}) == kind::array);
        VERIFY((types::kind_of(std::map<int, int>{}) == kind::array));
        VERIFY(types::kind_of(circle{}) == kind::object);

        // pointer-likes report the pointee
        VERIFY(types::kind_of(std::make_shared<int>(1)) == kind::integer);
        VERIFY(types::kind_of(std::shared_ptr<int>{}) == kind::null);
        VERIFY(types::kind_of(std::unique_ptr<circle>{ new circle{} }) == kind::object);

        VERIFY(types::kind_of(dynamic_value{ kind::floating }) == kind::floating);
    };

    tests["primitive"] = [&]
    {
        VERIFY( types::of<int>(primitive::integer)(5));
        VERIFY(!types::of<int>(primitive::string)(5));
        VERIFY( types::of<int>(primitive::scalar)(5));
        VERIFY( types::of<double>(primitive::numeric)(0.5));

        const auto numeric = types::of<std::string>(primitive::numeric);
        VERIFY( numeric("12"));
        VERIFY( numeric("-12.5"));
        VERIFY( numeric(".5"));
        VERIFY( numeric("1e3"));
        VERIFY( numeric(" 7 "));
        VERIFY(!numeric(""));
        VERIFY(!numeric("abc"));
        VERIFY(!numeric("1e"));
        VERIFY(!numeric("0x1A"));

        VERIFY( types::of<std::vector<int>>(primitive::array)({}));
        VERIFY( types::of<std::vector<int>>(primitive::countable)({}));
        VERIFY(!types::of<circle>(primitive::iterable)(circle{}));
        VERIFY( types::of<std::shared_ptr<int>>(primitive::null)(nullptr));
        VERIFY(types::of<int>(primitive::integer).name() == "int");
    };

    tests["char_class"] = [&]
    {
        const auto digits = types::of<std::string>(char_class::digit);
        VERIFY( digits("0123"));
        VERIFY(!digits("12a"));
        VERIFY(!digits(""));

        VERIFY( types::of<std::string>(char_class::upper)("ABC"));
        VERIFY(!types::of<std::string>(char_class::upper)("AbC"));
        VERIFY( types::of<const char*>(char_class::xdigit)("ff00"));
        VERIFY(!types::of<const char*>(char_class::xdigit)(nullptr));

        // only textual items
        VERIFY(!types::of<int>(char_class::digit)(5));
    };

    tests["implementing"] = [&]
    {
        using shape_ptr = std::shared_ptr<shape>;
        const auto is_circle = types::implementing<circle, shape_ptr>("circle");

        VERIFY( is_circle(std::make_shared<circle>()));
        VERIFY(!is_circle(std::make_shared<square>()));
        VERIFY(!is_circle(shape_ptr{}));
        VERIFY( is_circle.name() == "circle");

        VERIFY( (types::implementing<shape, circle>()(circle{})));
        VERIFY(!(types::implementing<circle, int>()(1)));
    };

    tests["named"] = [&]
    {
        VERIFY( types::is_valid(true, "boolean"));
        VERIFY( types::is_valid(true, "BOOL"));
        VERIFY(!types::is_valid(1,    "bool"));
        VERIFY( types::is_valid(1,    "Integer"));
        VERIFY( types::is_valid(2.5,  "double"));

        // primitive check first, then char-class
        VERIFY( types::is_valid(std::string{ "123" }, "string"));
        VERIFY( types::is_valid(std::string{ "123" }, "digit"));
        VERIFY( types::is_valid(std::string{ "123" }, "numeric"));
        VERIFY(!types::is_valid(std::string{ "12 3" }, "digit"));

        // then capability advertised by name, then false
        VERIFY( types::is_valid(plugin{ "Exporter" }, "Exporter"));
        VERIFY(!types::is_valid(plugin{ "Exporter" }, "Importer"));
        VERIFY( types::is_valid(std::make_shared<plugin>(plugin{ "Exporter" }), "Exporter"));
        VERIFY(!types::is_valid(42, "widget"));

        const auto v = types::named<int>("Integer");
        VERIFY(v.name() == "Integer");
        VERIFY(types::is_valid(7, v));

        VERIFY(!types::validator<int>{}(1));
    };

    tests["describe"] = [&]
    {
        VERIFY(types::describe(1) == "int");
        VERIFY(types::describe(std::string{}) == "string");
        VERIFY(types::describe(std::shared_ptr<int>{}) == "null");
        VERIFY(types::describe(std::make_shared<double>(1.0)) == "float");
        VERIFY(types::describe(circle{}) == typeid(circle).name());

        // RTTI name of the dynamic type
        const std::shared_ptr<shape> s = std::make_shared<square>();
        VERIFY(types::describe(s) == typeid(square).name());
    };

    /////////////////////////////////////////////////////////////////////////
    size_t num_failed = 0;
    size_t num_ok = 0;
    for(const auto& kv : tests) {
        try {
            kv.second();
            num_ok++;
        } catch(const std::exception& e) {
            num_failed++;
            std::cerr << "Failed test '" << kv.first << "' :" << e.what() << "\n";
        }
    }

    if(num_failed == 0) {
        std::cerr << "types: ran " << num_ok << " tests - OK\n";
    } else {
        throw std::runtime_error(std::to_string(num_failed) + " types tests failed.");
    }
}

} // namespace impl
} // namespace types
} // namespace lazycoll

#endif // LAZYCOLL_TYPES_ENABLE_RUN_TESTS

#endif // LAZYCOLL_TYPES_HPP_
