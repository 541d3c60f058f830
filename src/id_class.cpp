#include "id_class.hpp"

#include <algorithm>
#include <exception>
#include <ostream>

#include <cstdio>

namespace kind {

namespace {

constexpr char ascii_lower(char const c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr bool is_ascii_alnum(char const c) noexcept {
    return (c >= '0' && c <= '9')
        || (c >= 'a' && c <= 'z')
        || (c >= 'A' && c <= 'Z');
}

} // namespace

bool is_valid_class_prefix(string_view const prefix) noexcept {
    return !prefix.empty()
        && std::all_of(prefix.begin(), prefix.end(), is_ascii_alnum);
}

id_class::id_class(string_view const prefix) noexcept
  : prefix_ {prefix}
{
    if (!is_valid_class_prefix(prefix_)) {
        std::fprintf(stderr, "kind: invalid id class prefix \"%.*s\".\n"
          , static_cast<int>(prefix_.size()), prefix_.data());
        std::terminate();
    }
}

result<string_view> id_class::strip_prefix(string_view const public_id) const noexcept {
    if (public_id.size() < prefix_.size()) {
        return id_error::wrong_class;
    }

    for (size_t i = 0; i < prefix_.size(); ++i) {
        if (ascii_lower(public_id[i]) != ascii_lower(prefix_[i])) {
            return id_error::wrong_class;
        }
    }

    if (public_id.size() == prefix_.size() || public_id[prefix_.size()] != '_') {
        return id_error::invalid_format;
    }

    return public_id.substr(prefix_.size() + 1);
}

result<uuid> id_class::parse_public_id(string_view const public_id) const noexcept {
    auto const db_id = strip_prefix(public_id);
    if (!db_id) {
        return db_id.error();
    }

    return parse_hyphenated(db_id.value());
}

std::string id_class::public_id(uuid const& u) const {
    std::string out;
    out.reserve(prefix_.size() + 1 + uuid_text_size);

    out.append(prefix_.data(), prefix_.size());
    out.push_back('_');
    out.append(to_hyphenated(u));

    return out;
}

bool operator==(id_class const& a, id_class const& b) noexcept {
    auto const pa = a.prefix();
    auto const pb = b.prefix();

    return pa.size() == pb.size()
        && std::equal(pa.begin(), pa.end(), pb.begin()
             , [](char const x, char const y) noexcept {
                   return ascii_lower(x) == ascii_lower(y);
               });
}

std::ostream& operator<<(std::ostream& out, id_class const& c) {
    return out.write(c.prefix().data()
                   , static_cast<std::streamsize>(c.prefix().size()));
}

} //namespace kind
