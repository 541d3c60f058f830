#pragma once

#include "config.hpp"
#include "result.hpp"

#include <boost/uuid/uuid.hpp>

#include <string>
#include <cstddef>

namespace kind { class random_state; }

namespace kind {

using uuid = boost::uuids::uuid;

//! Length of the hyphenated form "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
constexpr size_t uuid_text_size = 36;

//! Lower-case hyphenated form; also the database encoding of an id.
std::string to_hyphenated(uuid const& u);

//! Parse exactly the 8-4-4-4-12 hyphenated form, hex digits in either case.
//! Anything else (braces, urn prefix, missing hyphens) is invalid_format.
result<uuid> parse_hyphenated(string_view text) noexcept;

//! RFC 4122 section 4.4 random uuid (version 4, variant 10).
uuid random_uuid_v4(random_state& rng);

//! As above, drawing from the operating system's entropy source. Throws
//! boost::uuids::entropy_error if it is unavailable.
uuid random_uuid_v4();

} //namespace kind
