#include "uuid.hpp"
#include "random.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cstdint>

namespace kind {

namespace {

int hex_digit_value(char const c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }

    return -1;
}

constexpr bool is_hyphen_offset(size_t const i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

std::string to_hyphenated(uuid const& u) {
    return boost::uuids::to_string(u);
}

result<uuid> parse_hyphenated(string_view const text) noexcept {
    if (text.size() != uuid_text_size) {
        return id_error::invalid_format;
    }

    uuid u {};
    auto out = u.begin();

    for (size_t i = 0; i < uuid_text_size; ) {
        if (is_hyphen_offset(i)) {
            if (text[i] != '-') {
                return id_error::invalid_format;
            }

            ++i;
            continue;
        }

        // hex pairs never straddle a hyphen
        auto const hi = hex_digit_value(text[i]);
        auto const lo = hex_digit_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return id_error::invalid_format;
        }

        *out++ = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }

    return u;
}

uuid random_uuid_v4(random_state& rng) {
    boost::uuids::basic_random_generator<random_state> gen {rng};
    return gen();
}

uuid random_uuid_v4() {
    // no engine state of its own: every call reads the OS entropy source
    thread_local boost::uuids::random_generator gen;
    return gen();
}

} //namespace kind
