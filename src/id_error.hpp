#pragma once

#include <iosfwd>
#include <cstdint>

namespace kind {

//! Reasons an identifier could not be decoded.
enum class id_error : uint8_t {
    wrong_class    //!< the prefix names another class
  , invalid_format //!< bad separator or malformed uuid
  , empty_db_id    //!< a database column held no value
};

char const* to_string(id_error e) noexcept;

std::ostream& operator<<(std::ostream& out, id_error e);

} //namespace kind
