#include "schema.hpp"

namespace kind {

char const* const example_uuid = "c40bea18-c0c9-44b1-bd0c-43f5283e1670";

std::string id_schema_name(id_class const& c) {
    std::string name (c.prefix().data(), c.prefix().size());
    name.append("_uuid");
    return name;
}

void write_id_schema(json_writer& w, id_class const& c) {
    std::string const prefix (c.prefix().data(), c.prefix().size());

    w.StartObject();

    w.Key("type");
    w.String("string");

    w.Key("format");
    w.String("string");

    w.Key("description");
    write_json_string(w, "Unique identifier of a " + prefix
                       + " object: the class prefix, an underscore and a UUID");

    w.Key("example");
    write_json_string(w, prefix + "_" + example_uuid);

    w.EndObject();
}

char const* openapi_id_schema_name() noexcept {
    return "Id";
}

void write_openapi_id_schema(json_writer& w) {
    w.StartObject();

    w.Key("type");
    w.String("string");

    w.Key("description");
    w.String("Unique identifier of an object. Consists of object class prefix and a UUID");

    w.Key("example");
    write_json_string(w, std::string {"Cust_"} + example_uuid);

    w.EndObject();
}

} //namespace kind
