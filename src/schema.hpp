#pragma once

//
// Schema descriptions of ids for documentation tooling (JSON Schema and the
// OpenAPI components section). An id is always described by its public form.
//

#include "id.hpp"
#include "ided.hpp"
#include "json.hpp"

#include <string>

namespace kind {

//! Describes an entity for schema generation; specialize for every payload
//! whose ided schema is wanted.
//!
//!     template <> struct json_schema<customer> {
//!         static char const* name() noexcept { return "customer"; }
//!         static void write_properties(json_writer& w);
//!     };
//!
//! write_properties emits "field": {schema} pairs only.
template <typename E>
struct json_schema;

//! The illustrative value used in every example.
extern char const* const example_uuid;

//! "<prefix>_uuid"
std::string id_schema_name(id_class const& c);

//! {"type": "string", "format": "string", "description": ..., "example": ...}
void write_id_schema(json_writer& w, id_class const& c);

//! Name of the component written by write_openapi_id_schema.
char const* openapi_id_schema_name() noexcept;

//! The single "Id" component shared by every class.
void write_openapi_id_schema(json_writer& w);

template <typename T>
std::string id_schema_name() {
    return id_schema_name(id<T>::class_of());
}

template <typename T>
void write_id_schema(json_writer& w) {
    write_id_schema(w, id<T>::class_of());
}

template <typename T, typename E = T>
std::string ided_schema_name() {
    return std::string {json_schema<E>::name()} + "_ided";
}

//! An object with the entity's properties plus "id".
template <typename T, typename E = T>
void write_ided_schema(json_writer& w) {
    w.StartObject();

    w.Key("type");
    w.String("object");

    w.Key("description");
    write_json_string(w, std::string {"Identified version of "}
                       + json_schema<E>::name());

    w.Key("properties");
    w.StartObject();
    json_schema<E>::write_properties(w);
    w.Key("id");
    write_id_schema<T>(w);
    w.EndObject();

    w.EndObject();
}

//! Run @p write against a fresh writer and return the text produced.
template <typename Write>
std::string schema_to_json(Write write) {
    rapidjson::StringBuffer buffer;
    json_writer w {buffer};

    write(w);

    return {buffer.GetString(), buffer.GetSize()};
}

} //namespace kind
