#pragma once

#include "id.hpp"

#include <functional>
#include <utility>
#include <cstddef>

namespace kind {

//! An entity together with its id ("identified").
//!
//! Most often the entity is the identifiable type itself, as in
//! ided<invoice>, but any payload can be attached to an id, as in
//! ided<invoice, invoice_summary>.
//!
//! Comparison is split:
//!  - == and != (and the hash) look at the id only: two ided values are the
//!    same object when their ids match, whatever their payloads hold;
//!  - <, >, <= and >= look at the entity only, and are available only when
//!    the entity itself is ordered.
//! So !(a < b) && !(b < a) does not imply a == b.
template <typename T, typename E = T>
class ided {
public:
    using id_type     = ::kind::id<T>;
    using entity_type = E;

    ided(id_type const i, E entity)
      : id_     {i}
      , entity_ {std::move(entity)}
    {
    }

    id_type id() const noexcept { return id_; }

    E const& entity() const noexcept { return entity_; }
    E&       entity_mut()   noexcept { return entity_; }

    E take_entity() && {
        return std::move(entity_);
    }

    std::pair<id_type, E> dismantle() && {
        return {id_, std::move(entity_)};
    }
private:
    id_type id_;
    E       entity_;
};

template <typename T, typename E>
bool operator==(ided<T, E> const& a, ided<T, E> const& b) noexcept {
    return a.id() == b.id();
}

template <typename T, typename E>
bool operator!=(ided<T, E> const& a, ided<T, E> const& b) noexcept {
    return !(a == b);
}

template <typename T, typename E>
bool operator<(ided<T, E> const& a, ided<T, E> const& b) {
    return a.entity() < b.entity();
}

template <typename T, typename E>
bool operator>(ided<T, E> const& a, ided<T, E> const& b) {
    return b < a;
}

template <typename T, typename E>
bool operator<=(ided<T, E> const& a, ided<T, E> const& b) {
    return !(b < a);
}

template <typename T, typename E>
bool operator>=(ided<T, E> const& a, ided<T, E> const& b) {
    return !(a < b);
}

template <typename T, typename E>
inline size_t hash_value(ided<T, E> const& x) noexcept {
    return hash_value(x.id());
}

} //namespace kind

namespace std {

template <typename T, typename E>
struct hash<::kind::ided<T, E>> {
    size_t operator()(::kind::ided<T, E> const& x) const noexcept {
        return ::kind::hash_value(x.id());
    }
};

} // namespace std
