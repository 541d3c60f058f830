#pragma once

#include "config.hpp"
#include "id_class.hpp"
#include "result.hpp"
#include "uuid.hpp"

#include <boost/functional/hash.hpp>
#include <boost/uuid/uuid_hash.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <cstddef>

struct sqlite3_stmt;

namespace kind { class random_state; }

namespace kind {

//! Maps an entity type to its id_class. Specialize through
//! KIND_IDENTIFIABLE. There is no primary definition, so using
//! id<T> with an undeclared T does not compile.
template <typename T>
struct identifiable;

template <typename T>
class id;

template <typename T>
result<id<T>> column_id(sqlite3_stmt* stmt, int column) noexcept;

namespace detail {

//! The codecs that read from a source already scoped to one class (a typed
//! database column) build ids through here, skipping every check. Only those
//! codecs are friends.
class id_access {
    template <typename U>
    friend result<id<U>> kind::column_id(sqlite3_stmt* stmt, int column) noexcept;

    template <typename T>
    static id<T> from_unchecked(uuid const& u) noexcept {
        return id<T> {u};
    }
};

} // namespace detail

//! A uuid tagged with the class of object it identifies.
//!
//! There are two textual forms:
//!  - the public id, "<prefix>_<uuid>", used everywhere outside the database;
//!  - the db id, the bare hyphenated uuid, used only to talk to a column whose
//!    type already fixes the class.
//!
//! Ordering is over the raw value, which is the same as ordering either
//! textual form as a string.
template <typename T>
class id {
    friend detail::id_access;
public:
    using tag = T;

    //! A fresh version 4 uuid from the calling thread's random state.
    static id random_v4() {
        return id {random_uuid_v4()};
    }

    static id random_v4(random_state& rng) {
        return id {random_uuid_v4(rng)};
    }

    //! Parse the public form, checking the class.
    //!
    //! This is the only parse to use on text whose class is not already
    //! trusted (request payloads, urls, user input).
    static result<id> from_public_id(string_view const public_id) noexcept {
        auto const u = class_of().parse_public_id(public_id);
        if (!u) {
            return u.error();
        }

        return id {u.value()};
    }

    //! Parse the database form. The class is not part of that form, so it is
    //! not, and can not be, checked: this never fails with wrong_class.
    //! Never feed it untrusted text.
    static result<id> from_db_id(string_view const db_id) noexcept {
        auto const u = parse_hyphenated(db_id);
        if (!u) {
            return u.error();
        }

        return id {u.value()};
    }

    static id_class const& class_of() noexcept {
        return identifiable<T>::class_of();
    }

    //! The underlying 128-bit value.
    uuid const& raw() const noexcept { return value_; }

    std::string public_id() const {
        return class_of().public_id(value_);
    }

    std::string db_id() const {
        return to_hyphenated(value_);
    }

    std::string debug_string() const {
        std::string out {"id{class="};
        out.append(class_of().prefix().data(), class_of().prefix().size());
        out.append(", uuid=");
        out.append(db_id());
        out.push_back('}');
        return out;
    }
private:
    explicit id(uuid const& u) noexcept
      : value_ {u}
    {
    }

    uuid value_;
};

template <typename T>
inline bool operator==(id<T> const& a, id<T> const& b) noexcept {
    return a.raw() == b.raw();
}

template <typename T>
inline bool operator!=(id<T> const& a, id<T> const& b) noexcept {
    return !(a == b);
}

template <typename T>
inline bool operator<(id<T> const& a, id<T> const& b) noexcept {
    return a.raw() < b.raw();
}

template <typename T>
inline bool operator>(id<T> const& a, id<T> const& b) noexcept {
    return b < a;
}

template <typename T>
inline bool operator<=(id<T> const& a, id<T> const& b) noexcept {
    return !(b < a);
}

template <typename T>
inline bool operator>=(id<T> const& a, id<T> const& b) noexcept {
    return !(a < b);
}

template <typename T>
std::ostream& operator<<(std::ostream& out, id<T> const& i) {
    return out << i.public_id();
}

template <typename T>
inline size_t hash_value(id<T> const& i) noexcept {
    return boost::hash<uuid> {}(i.raw());
}

} //namespace kind

namespace std {

template <typename T>
struct hash<::kind::id<T>> {
    size_t operator()(::kind::id<T> const& i) const noexcept {
        return ::kind::hash_value(i);
    }
};

} // namespace std

//! Declare @p type identifiable with the class @p prefix.
//!
//! Use at global namespace scope with a fully qualified type name, once per
//! type. The prefix must be a string literal of ASCII letters and digits;
//! this is checked at compile time.
#define KIND_IDENTIFIABLE(type, prefix)                                       \
    static_assert(::kind::is_valid_class_prefix(prefix)                       \
      , "invalid id class prefix for " #type);                                \
    namespace kind {                                                          \
    template <>                                                               \
    struct identifiable<type> {                                               \
        static id_class const& class_of() noexcept {                          \
            static id_class const instance {prefix};                          \
            return instance;                                                  \
        }                                                                     \
    };                                                                        \
    }                                                                         \
    static_assert(true, "")
