#pragma once

//
// JSON text encoding of ids. Ids always travel as their public form, so the
// class is checked again wherever JSON is read back.
//

#include "config.hpp"
#include "any_id.hpp"
#include "id.hpp"
#include "ided.hpp"
#include "result.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>

namespace kind {

using json_writer = rapidjson::Writer<rapidjson::StringBuffer>;

//! Describes how the fields of an entity sit in a JSON object; specialize for
//! every payload stored in an ided.
//!
//!     template <> struct json_fields<customer> {
//!         static void write(json_writer& w, customer const& c);
//!         static bool read(rapidjson::Value const& object, customer& c);
//!     };
//!
//! write emits key/value pairs only (the enclosing object is already open);
//! read is given the whole object, "id" included, and returns false when a
//! field is missing or mistyped.
template <typename E>
struct json_fields;

//! Parse @p text into @p doc; false on a syntax error.
bool parse_json(string_view text, rapidjson::Document& doc);

void write_json_string(json_writer& w, string_view s);

//! The string content of @p v, or invalid_format if it is not a string.
result<string_view> read_json_string(rapidjson::Value const& v) noexcept;

//! The member @p key of @p object, or nullptr.
rapidjson::Value const* find_json_member(
    rapidjson::Value const& object, char const* key) noexcept;

//===------------------------------------------------------------------------===
//                                  id
//===------------------------------------------------------------------------===
template <typename T>
void write_json(json_writer& w, id<T> const& i) {
    write_json_string(w, i.public_id());
}

template <typename T>
result<id<T>> read_json_id(rapidjson::Value const& v) noexcept {
    auto const s = read_json_string(v);
    if (!s) {
        return s.error();
    }

    return id<T>::from_public_id(s.value());
}

//! Read the raw database form, no class check. Only for documents that come
//! straight out of storage.
template <typename T>
result<id<T>> read_json_db_id(rapidjson::Value const& v) noexcept {
    auto const s = read_json_string(v);
    if (!s) {
        return s.error();
    }

    return id<T>::from_db_id(s.value());
}

//===------------------------------------------------------------------------===
//                                  any_id
//===------------------------------------------------------------------------===
template <typename... Ts>
void write_json(json_writer& w, any_id<Ts...> const& i) {
    write_json_string(w, i.public_id());
}

template <typename A>
result<A> read_json_any_id(rapidjson::Value const& v) {
    auto const s = read_json_string(v);
    if (!s) {
        return s.error();
    }

    return A::parse(s.value());
}

//===------------------------------------------------------------------------===
//                                  ided
//===------------------------------------------------------------------------===
//! {"id": "<public id>", <entity fields>...}
template <typename T, typename E>
void write_json(json_writer& w, ided<T, E> const& x) {
    w.StartObject();
    w.Key("id");
    write_json(w, x.id());
    json_fields<E>::write(w, x.entity());
    w.EndObject();
}

template <typename T, typename E = T>
result<ided<T, E>> read_json_ided(rapidjson::Value const& v) {
    if (!v.IsObject()) {
        return id_error::invalid_format;
    }

    auto const member = find_json_member(v, "id");
    if (!member) {
        return id_error::invalid_format;
    }

    auto const i = read_json_id<T>(*member);
    if (!i) {
        return i.error();
    }

    E entity {};
    if (!json_fields<E>::read(v, entity)) {
        return id_error::invalid_format;
    }

    return ided<T, E> {i.value(), std::move(entity)};
}

//===------------------------------------------------------------------------===
//                              Whole documents
//===------------------------------------------------------------------------===
template <typename T>
std::string to_json(T const& value) {
    rapidjson::StringBuffer buffer;
    json_writer w {buffer};

    write_json(w, value);

    return {buffer.GetString(), buffer.GetSize()};
}

template <typename T>
result<id<T>> id_from_json(string_view const text) {
    rapidjson::Document doc;
    if (!parse_json(text, doc)) {
        return id_error::invalid_format;
    }

    return read_json_id<T>(doc);
}

template <typename T, typename E = T>
result<ided<T, E>> ided_from_json(string_view const text) {
    rapidjson::Document doc;
    if (!parse_json(text, doc)) {
        return id_error::invalid_format;
    }

    return read_json_ided<T, E>(doc);
}

} //namespace kind
