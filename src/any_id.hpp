#pragma once

#include "config.hpp"
#include "id.hpp"
#include "result.hpp"

#include <boost/functional/hash.hpp>
#include <boost/variant.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <tuple>
#include <type_traits>
#include <cstddef>

namespace kind {

//! An id of any one of a fixed list of classes, e.g.
//!
//!     using pet_id = kind::any_id<dog, cat>;
//!
//! The class is recovered from the prefix when parsing.
template <typename... Ts>
class any_id {
    static_assert(sizeof...(Ts) > 0, "");

    using types = std::tuple<Ts...>;

    struct public_id_visitor : boost::static_visitor<std::string> {
        template <typename T>
        std::string operator()(::kind::id<T> const& i) const {
            return i.public_id();
        }
    };

    struct hash_visitor : boost::static_visitor<size_t> {
        template <typename T>
        size_t operator()(::kind::id<T> const& i) const noexcept {
            return hash_value(i);
        }
    };
public:
    using variant_type = boost::variant<::kind::id<Ts>...>;

    template <typename T>
    any_id(::kind::id<T> const i)
      : value_ (i)
    {
    }

    //! Try each class's public id parser in declaration order. The first
    //! class that recognizes the prefix decides the outcome: its id on
    //! success, its error otherwise (a malformed id is never retried as
    //! another class). wrong_class if no class recognizes the prefix.
    static result<any_id> parse(string_view const public_id) {
        return parse_(public_id, std::integral_constant<size_t, 0> {});
    }

    std::string public_id() const {
        return boost::apply_visitor(public_id_visitor {}, value_);
    }

    //! Position of the held class in the declaration list.
    int index() const noexcept { return value_.which(); }

    template <typename T>
    bool is() const noexcept {
        return get<T>() != nullptr;
    }

    template <typename T>
    ::kind::id<T> const* get() const noexcept {
        return boost::get<::kind::id<T>>(&value_);
    }

    template <typename Visitor>
    decltype(auto) apply_visitor(Visitor&& visitor) const {
        return boost::apply_visitor(std::forward<Visitor>(visitor), value_);
    }

    variant_type const& variant() const noexcept { return value_; }

    size_t hash() const noexcept {
        auto seed = static_cast<size_t>(index());
        boost::hash_combine(seed, boost::apply_visitor(hash_visitor {}, value_));
        return seed;
    }
private:
    static result<any_id> parse_(
        string_view
      , std::integral_constant<size_t, sizeof...(Ts)>
    ) {
        return id_error::wrong_class;
    }

    template <size_t I>
    static result<any_id> parse_(
        string_view const public_id
      , std::integral_constant<size_t, I>
    ) {
        using T = std::tuple_element_t<I, types>;

        auto const r = ::kind::id<T>::from_public_id(public_id);
        if (r) {
            return any_id {r.value()};
        } else if (r.error() != id_error::wrong_class) {
            return r.error();
        }

        return parse_(public_id, std::integral_constant<size_t, I + 1> {});
    }

    variant_type value_;
};

template <typename... Ts>
bool operator==(any_id<Ts...> const& a, any_id<Ts...> const& b) {
    return a.variant() == b.variant();
}

template <typename... Ts>
bool operator!=(any_id<Ts...> const& a, any_id<Ts...> const& b) {
    return !(a == b);
}

template <typename... Ts>
std::ostream& operator<<(std::ostream& out, any_id<Ts...> const& i) {
    return out << i.public_id();
}

template <typename... Ts>
inline size_t hash_value(any_id<Ts...> const& i) noexcept {
    return i.hash();
}

} //namespace kind

namespace std {

template <typename... Ts>
struct hash<::kind::any_id<Ts...>> {
    size_t operator()(::kind::any_id<Ts...> const& i) const noexcept {
        return i.hash();
    }
};

} // namespace std
