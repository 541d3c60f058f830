#pragma once

#include "config.hpp"
#include "result.hpp"
#include "uuid.hpp"

#include <iosfwd>
#include <string>

namespace kind {

//! True for a non-empty, NUL terminated run of ASCII letters and digits.
constexpr bool is_valid_class_prefix(char const* const prefix) noexcept {
    if (!prefix || !*prefix) {
        return false;
    }

    for (auto p = prefix; *p; ++p) {
        auto const c = *p;
        if (!((c >= '0' && c <= '9')
           || (c >= 'a' && c <= 'z')
           || (c >= 'A' && c <= 'Z'))) {
            return false;
        }
    }

    return true;
}

bool is_valid_class_prefix(string_view prefix) noexcept;

//! A category of identifiable objects, named by a short alphanumeric prefix.
//!
//! Instances are meant to be created once per entity type, through
//! KIND_IDENTIFIABLE, and never change afterwards. The prefix is not copied:
//! it must outlive the class (string literals do).
class id_class {
public:
    //! Terminates the program if @p prefix is not a valid class prefix; a
    //! malformed class is a programming error.
    explicit id_class(string_view prefix) noexcept;

    string_view prefix() const noexcept { return prefix_; }

    //! Remove "<prefix>_" from a public id, comparing the prefix without
    //! regard to ASCII case. Returns what follows the separator, unchecked.
    //!
    //! wrong_class    : the text does not start with the prefix.
    //! invalid_format : the prefix is not followed by '_'.
    result<string_view> strip_prefix(string_view public_id) const noexcept;

    //! strip_prefix followed by a strict uuid parse of the remainder.
    result<uuid> parse_public_id(string_view public_id) const noexcept;

    //! "<prefix>_<lower-case hyphenated uuid>"
    std::string public_id(uuid const& u) const;
private:
    string_view prefix_;
};

//! Prefixes compared without regard to ASCII case, as strip_prefix does.
bool operator==(id_class const& a, id_class const& b) noexcept;

inline bool operator!=(id_class const& a, id_class const& b) noexcept {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& out, id_class const& c);

} //namespace kind
