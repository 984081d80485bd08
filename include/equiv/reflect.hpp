// reflect.hpp - capture plain C++ objects as object graphs.
//
// Composite types opt in with an ADL-visible introspect function listing their members:
//
//   template<class In> void introspect(In&& inspect, Order const& o){
//       inspect(o.id, "Id");
//       inspect(o.lines, "Lines");
//   }
//
// Enums are named through an ADL to_string(E), or an introspect_enum(In&&, E&) listing
// inspect(e, E::value, "name") for each enumerator; otherwise the underlying number is used.
// Ancestors are declared with EQUIV_BASES(Derived, Base...) and display names can be
// overridden with EQUIV_TYPE_NAME(T, "Name"); both macros go at global namespace scope.
#pragma once
#include "equiv/assert.hpp"
#include "equiv/graph.hpp"
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <llvm/Support/TypeName.h>

namespace equiv
{

    template <class... Ts>
    struct type_list
    {
    };

    template <class T>
    struct type_name_trait
    {
        static std::string name() { return llvm::getTypeName<T>().str(); }
    };

    template <class T>
    struct bases_trait
    {
        using type = type_list<>;
    };

    template <class T>
    std::string type_name_of() { return type_name_trait<std::remove_cv_t<T>>::name(); }

    namespace detail
    {
        template <class T> struct is_optional : std::false_type {};
        template <class T> struct is_optional<std::optional<T>> : std::true_type {};

        template <class T> struct is_smart_ptr : std::false_type {};
        template <class T, class D> struct is_smart_ptr<std::unique_ptr<T, D>> : std::true_type {};
        template <class T> struct is_smart_ptr<std::shared_ptr<T>> : std::true_type {};

        template <class T> struct is_pair : std::false_type {};
        template <class A, class B> struct is_pair<std::pair<A, B>> : std::true_type {};

        struct member_probe
        {
            template <class M>
            void operator()(M const &, std::string_view) {}
        };

        template <class T, class = void>
        struct has_introspect : std::false_type {};
        template <class T>
        struct has_introspect<T, std::void_t<decltype(introspect(std::declval<member_probe &>(), std::declval<T const &>()))>> : std::true_type {};

        template <class E, class = void>
        struct has_enum_to_string : std::false_type {};
        template <class E>
        struct has_enum_to_string<E, std::enable_if_t<std::is_convertible_v<decltype(to_string(std::declval<E>())), std::string>>> : std::true_type {};

        template <class E>
        struct enum_namer
        {
            E value;
            const char *name = nullptr;
            void operator()(E &, E candidate, const char *candidate_name)
            {
                if (!name && candidate == value)
                    name = candidate_name;
            }
        };

        template <class E, class = void>
        struct has_introspect_enum : std::false_type {};
        template <class E>
        struct has_introspect_enum<E, std::void_t<decltype(introspect_enum(std::declval<enum_namer<E> &>(), std::declval<E &>()))>> : std::true_type {};

        template <class T, class = void>
        struct is_range : std::false_type {};
        template <class T>
        struct is_range<T, std::void_t<decltype(std::begin(std::declval<T const &>())), decltype(std::end(std::declval<T const &>()))>> : std::true_type {};

        template <class T, class = void>
        struct is_equality_comparable : std::false_type {};
        template <class T>
        struct is_equality_comparable<T, std::enable_if_t<std::is_convertible_v<decltype(std::declval<T const &>() == std::declval<T const &>()), bool>>> : std::true_type {};

        template <class T, class = void>
        struct is_streamable : std::false_type {};
        template <class T>
        struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream &>() << std::declval<T const &>())>> : std::true_type {};

        template <class T>
        constexpr bool dependent_false = false;

        template <class E>
        std::string enum_label(E e)
        {
            if constexpr (has_enum_to_string<E>::value)
            {
                return std::string(to_string(e));
            }
            else
            {
                if constexpr (has_introspect_enum<E>::value)
                {
                    enum_namer<E> namer{e};
                    E probe = e;
                    introspect_enum(namer, probe);
                    if (namer.name)
                        return namer.name;
                }
                return std::to_string(static_cast<long long>(static_cast<std::underlying_type_t<E>>(e)));
            }
        }
    } // namespace detail

    // Value type compared with its own operator==.
    template <class T>
    class boxed_value final : public opaque_value
    {
    public:
        boxed_value(std::string type, T value) : type_(std::move(type)), value_(std::move(value)) {}
        const std::string &type() const override { return type_; }
        bool equals(const opaque_value &other) const override
        {
            if (auto *b = dynamic_cast<const boxed_value<T> *>(&other))
                return value_ == b->value_;
            return render() == other.render();
        }
        std::string render() const override
        {
            if constexpr (detail::is_streamable<T>::value)
            {
                std::ostringstream os;
                os << value_;
                return os.str();
            }
            else
            {
                return "<" + type_ + ">";
            }
        }
        const T &value() const { return value_; }

    private:
        std::string type_;
        T value_;
    };

    // Converts C++ values to nodes. Every call builds fresh nodes: members handed to
    // inspect() may be temporaries whose storage is reused, so addresses never identify objects.
    class capturer
    {
    public:
        template <class T>
        node_ptr capture(const T &v);

    private:
        struct member_collector
        {
            capturer &ctx;
            std::vector<field> &out;
            template <class M>
            void operator()(M const &m, std::string_view name)
            {
                for (const auto &f : out)
                    if (f.name == name)
                        return;
                out.push_back(fld(std::string(name), ctx.capture(m)));
            }
        };

        template <class T>
        void collect_bases(const T &v, record &r, type_list<>) {}

        template <class T, class B, class... Rest>
        void collect_bases(const T &v, record &r, type_list<B, Rest...>)
        {
            r.bases.push_back(type_name_of<B>());
            collect_bases(static_cast<const B &>(v), r, typename bases_trait<B>::type{});
            collect_members(static_cast<const B &>(v), r);
            collect_bases(v, r, type_list<Rest...>{});
        }

        template <class T>
        void collect_members(const T &v, record &r)
        {
            if constexpr (detail::has_introspect<T>::value)
            {
                member_collector c{*this, r.fields};
                introspect(c, v);
            }
        }

        template <class T>
        node_ptr capture_record(const T &v)
        {
            record r;
            r.type = type_name_of<T>();
            collect_bases(v, r, typename bases_trait<T>::type{});
            collect_members(v, r);
            return detail::make_node(std::move(r));
        }

        template <class T>
        node_ptr capture_range(const T &v)
        {
            std::vector<node_ptr> elems;
            for (const auto &e : v)
                elems.push_back(capture(e));
            return n_seq(type_name_of<T>(), std::move(elems));
        }

    };

    template <class T>
    node_ptr capturer::capture(const T &v)
    {
        using U = std::remove_cv_t<T>;
        if constexpr (std::is_same_v<U, node_ptr>)
        {
            return v;
        }
        else if constexpr (std::is_same_v<U, std::nullptr_t>)
        {
            return n_null();
        }
        else if constexpr (std::is_array_v<U> && std::is_same_v<std::remove_cv_t<std::remove_extent_t<U>>, char>)
        {
            return n_str(std::string(v));
        }
        else if constexpr (std::is_same_v<U, const char *> || std::is_same_v<U, char *>)
        {
            return v ? n_str(std::string(v)) : n_null();
        }
        else if constexpr (detail::is_optional<U>::value || detail::is_smart_ptr<U>::value || std::is_pointer_v<U>)
        {
            if (!v)
                return n_null();
            return capture(*v);
        }
        else if constexpr (std::is_same_v<U, bool>)
        {
            return n_bool(v);
        }
        else if constexpr (std::is_enum_v<U>)
        {
            return n_enum(type_name_of<U>(), detail::enum_label(v));
        }
        else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>)
        {
            return n_i64(static_cast<int64_t>(v));
        }
        else if constexpr (std::is_integral_v<U>)
        {
            return n_u64(static_cast<uint64_t>(v));
        }
        else if constexpr (std::is_floating_point_v<U>)
        {
            return n_f64(static_cast<double>(v));
        }
        else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, std::string_view>)
        {
            return n_str(std::string(v));
        }
        else if constexpr (detail::has_introspect<U>::value)
        {
            return capture_record(v);
        }
        else if constexpr (detail::is_pair<U>::value)
        {
            return n_record("pair", {fld("first", capture(v.first)), fld("second", capture(v.second))});
        }
        else if constexpr (detail::is_range<U>::value)
        {
            return capture_range(v);
        }
        else if constexpr (detail::is_equality_comparable<U>::value && std::is_copy_constructible_v<U>)
        {
            return n_opaque(std::make_shared<boxed_value<U>>(type_name_of<U>(), v));
        }
        else
        {
            static_assert(detail::dependent_false<U>, "equiv::capture: type has no introspect(), range interface or operator==");
        }
    }

    template <class T>
    node_ptr capture(const T &v)
    {
        return capturer().capture(v);
    }

    // Capture each side on its own and assert their equivalence. The same object passed
    // as both sides is accepted without capturing.
    template <class A, class E>
    void should_be_equivalent_to(const A &actual, const E &expected, MessageFn message = nullptr)
    {
        if constexpr (std::is_same_v<A, E>)
        {
            if (std::addressof(actual) == std::addressof(expected))
                return;
        }
        node_ptr a = capture(actual);
        node_ptr e = capture(expected);
        assert_equivalent(a, e, message, "should_be_equivalent_to");
    }

    template <class A, class E>
    void should_be_equivalent_to(const A &actual, const E &expected, const std::string &message)
    {
        should_be_equivalent_to(actual, expected, [&] { return message; });
    }

} // namespace equiv

#define EQUIV_TYPE_NAME(T, Name)                        \
    namespace equiv                                     \
    {                                                   \
        template <>                                     \
        struct type_name_trait<T>                       \
        {                                               \
            static std::string name() { return Name; }  \
        };                                              \
    }

#define EQUIV_BASES(T, ...)                             \
    namespace equiv                                     \
    {                                                   \
        template <>                                     \
        struct bases_trait<T>                           \
        {                                               \
            using type = type_list<__VA_ARGS__>;        \
        };                                              \
    }
