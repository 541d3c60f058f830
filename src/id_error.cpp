#include "id_error.hpp"

#include <bkassert/assert.hpp>

#include <ostream>

namespace kind {

char const* to_string(id_error const e) noexcept {
    #define KIND_ENUM_MAPPING(x, s) case id_error::x : return s
    switch (e) {
        KIND_ENUM_MAPPING(wrong_class,    "wrong class");
        KIND_ENUM_MAPPING(invalid_format, "invalid format");
        KIND_ENUM_MAPPING(empty_db_id,    "empty db id");
    }
    #undef KIND_ENUM_MAPPING

    BK_ASSERT(false);
    return "unknown";
}

std::ostream& operator<<(std::ostream& out, id_error const e) {
    return out << to_string(e);
}

} //namespace kind
