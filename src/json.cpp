#include "json.hpp"

namespace kind {

bool parse_json(string_view const text, rapidjson::Document& doc) {
    doc.Parse(text.data(), text.size());
    return !doc.HasParseError();
}

void write_json_string(json_writer& w, string_view const s) {
    w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

result<string_view> read_json_string(rapidjson::Value const& v) noexcept {
    if (!v.IsString()) {
        return id_error::invalid_format;
    }

    return string_view {v.GetString(), v.GetStringLength()};
}

rapidjson::Value const* find_json_member(
    rapidjson::Value const& object
  , char const* const key
) noexcept {
    if (!object.IsObject()) {
        return nullptr;
    }

    auto const it = object.FindMember(key);
    return (it == object.MemberEnd()) ? nullptr : &it->value;
}

} //namespace kind
