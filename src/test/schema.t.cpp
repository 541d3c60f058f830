#if !defined(KIND_NO_TESTS)
#include "catch.hpp"
#include "entities.hpp"
#include "schema.hpp"

#include <string>

namespace kind {

template <>
struct json_schema<kind_test::test_struct> {
    static char const* name() noexcept { return "test_struct"; }

    static void write_properties(json_writer& w) {
        w.Key("field");
        w.StartObject();
        w.Key("type");
        w.String("string");
        w.EndObject();

        w.Key("answer");
        w.StartObject();
        w.Key("type");
        w.String("integer");
        w.EndObject();
    }
};

} //namespace kind

namespace {

std::string member_string(rapidjson::Value const& object, char const* const key) {
    auto const v = kind::find_json_member(object, key);
    REQUIRE(v);
    REQUIRE(v->IsString());
    return v->GetString();
}

} // namespace

TEST_CASE("id schema") {
    using namespace kind;

    REQUIRE(id_schema_name<kind_test::customer>() == "Cust_uuid");
    REQUIRE(id_schema_name(id<kind_test::dog>::class_of()) == "Dog_uuid");

    auto const text = schema_to_json([](json_writer& w) {
        write_id_schema<kind_test::customer>(w);
    });

    rapidjson::Document doc;
    REQUIRE(parse_json(text, doc));
    REQUIRE(doc.IsObject());

    REQUIRE(member_string(doc, "type") == "string");
    REQUIRE(member_string(doc, "format") == "string");
    REQUIRE(member_string(doc, "example")
         == "Cust_c40bea18-c0c9-44b1-bd0c-43f5283e1670");
    REQUIRE(member_string(doc, "description").find("Cust") != std::string::npos);

    // the example is itself a valid id of the class
    REQUIRE(id<kind_test::customer>::from_public_id(member_string(doc, "example")));
}

TEST_CASE("openapi id schema") {
    using namespace kind;

    REQUIRE(std::string {openapi_id_schema_name()} == "Id");

    auto const text = schema_to_json([](json_writer& w) {
        write_openapi_id_schema(w);
    });

    rapidjson::Document doc;
    REQUIRE(parse_json(text, doc));

    REQUIRE(member_string(doc, "type") == "string");
    REQUIRE(member_string(doc, "example")
         == "Cust_c40bea18-c0c9-44b1-bd0c-43f5283e1670");
    REQUIRE(member_string(doc, "description")
         == "Unique identifier of an object. Consists of object class prefix and a UUID");
    REQUIRE(find_json_member(doc, "format") == nullptr);
}

TEST_CASE("ided schema") {
    using namespace kind;
    using kind_test::test_struct;

    REQUIRE(ided_schema_name<test_struct>() == "test_struct_ided");

    auto const text = schema_to_json([](json_writer& w) {
        write_ided_schema<test_struct>(w);
    });

    rapidjson::Document doc;
    REQUIRE(parse_json(text, doc));

    REQUIRE(member_string(doc, "type") == "object");
    REQUIRE(member_string(doc, "description") == "Identified version of test_struct");

    auto const properties = find_json_member(doc, "properties");
    REQUIRE(properties);
    REQUIRE(properties->IsObject());
    REQUIRE(properties->MemberCount() == 3);

    auto const field = find_json_member(*properties, "field");
    REQUIRE(field);
    REQUIRE(member_string(*field, "type") == "string");

    auto const answer = find_json_member(*properties, "answer");
    REQUIRE(answer);
    REQUIRE(member_string(*answer, "type") == "integer");

    auto const i = find_json_member(*properties, "id");
    REQUIRE(i);
    REQUIRE(member_string(*i, "example")
         == "Test_c40bea18-c0c9-44b1-bd0c-43f5283e1670");
}

#endif // !defined(KIND_NO_TESTS)
