#if !defined(KIND_NO_TESTS)
#include "catch.hpp"
#include "entities.hpp"
#include "id.hpp"
#include "random.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace {

using customer_id = kind::id<kind_test::customer>;
using contract_id = kind::id<kind_test::contract>;

constexpr auto customer_text = "Cust_371c35ec-34d9-4315-ab31-7ea8889a419a";
constexpr auto db_text       = "371c35ec-34d9-4315-ab31-7ea8889a419a";

} // namespace

TEST_CASE("id layout") {
    static_assert(sizeof(customer_id) == sizeof(kind::uuid), "");
    static_assert(std::is_trivially_copyable<customer_id>::value, "");
}

TEST_CASE("id public form") {
    using namespace kind;

    auto const r = customer_id::from_public_id(customer_text);
    REQUIRE(r);

    auto const i = r.value();
    REQUIRE(i.public_id() == customer_text);
    REQUIRE(i.db_id() == db_text);
    REQUIRE(customer_id::class_of().prefix() == "Cust");

    SECTION("prefix case and hex case are ignored") {
        for (auto const s : {"CUST_371c35ec-34d9-4315-ab31-7ea8889a419a"
                           , "cust_371c35ec-34d9-4315-ab31-7ea8889a419a"
                           , "Cust_371C35EC-34D9-4315-AB31-7EA8889A419A"}) {
            auto const j = customer_id::from_public_id(s);
            REQUIRE(j);
            REQUIRE(j.value() == i);
            REQUIRE(j.value().public_id() == customer_text);
        }
    }

    SECTION("another class is rejected") {
        REQUIRE(contract_id::from_public_id(customer_text) == id_error::wrong_class);
        REQUIRE(customer_id::from_public_id("Cont_371c35ec-34d9-4315-ab31-7ea8889a419a")
             == id_error::wrong_class);
        REQUIRE(customer_id::from_public_id(db_text) == id_error::wrong_class);
    }

    SECTION("malformed ids are rejected") {
        REQUIRE(customer_id::from_public_id("Cust_not-a-uuid") == id_error::invalid_format);
        REQUIRE(customer_id::from_public_id("Cust_") == id_error::invalid_format);
        REQUIRE(customer_id::from_public_id("Cust") == id_error::invalid_format);
        REQUIRE(customer_id::from_public_id("Cust371c35ec-34d9-4315-ab31-7ea8889a419a")
             == id_error::invalid_format);
    }

    SECTION("stream output is the public id") {
        std::ostringstream out;
        out << i;
        REQUIRE(out.str() == customer_text);
    }

    SECTION("debug string names the class") {
        REQUIRE(i.debug_string()
             == "id{class=Cust, uuid=371c35ec-34d9-4315-ab31-7ea8889a419a}");
    }
}

TEST_CASE("id db form") {
    using namespace kind;

    auto const r = contract_id::from_db_id(db_text);
    REQUIRE(r);
    REQUIRE(r.value().db_id() == db_text);
    REQUIRE(r.value().public_id() == "Cont_371c35ec-34d9-4315-ab31-7ea8889a419a");

    // the db form carries no class
    REQUIRE(customer_id::from_db_id(db_text).value().raw() == r.value().raw());

    REQUIRE(customer_id::from_db_id("") == id_error::invalid_format);
    REQUIRE(customer_id::from_db_id("Cust_371c35ec-34d9-4315-ab31-7ea8889a419a")
         == id_error::invalid_format);
    REQUIRE(customer_id::from_db_id("not-a-uuid") == id_error::invalid_format);
}

TEST_CASE("id random") {
    using namespace kind;

    auto const a = customer_id::random_v4();
    auto const b = customer_id::random_v4();
    REQUIRE(a != b);
    REQUIRE(a.raw().version() == uuid::version_random_number_based);

    auto const parsed = customer_id::from_public_id(a.public_id());
    REQUIRE(parsed);
    REQUIRE(parsed.value() == a);

    auto const from_db = customer_id::from_db_id(a.db_id());
    REQUIRE(from_db);
    REQUIRE(from_db.value() == a);

    auto rng0 = make_random_state(7);
    auto rng1 = make_random_state(7);
    REQUIRE(customer_id::random_v4(*rng0) == customer_id::random_v4(*rng1));
}

TEST_CASE("id ordering follows the text") {
    using namespace kind;

    auto rng = make_random_state(1234);

    std::vector<customer_id> ids;
    for (int i = 0; i < 200; ++i) {
        ids.push_back(customer_id::random_v4(*rng));
    }

    std::vector<std::string> db_ids;
    std::vector<std::string> public_ids;
    for (auto const& i : ids) {
        db_ids.push_back(i.db_id());
        public_ids.push_back(i.public_id());
    }

    std::sort(begin(ids), end(ids));
    std::sort(begin(db_ids), end(db_ids));
    std::sort(begin(public_ids), end(public_ids));

    for (size_t i = 0; i < ids.size(); ++i) {
        REQUIRE(ids[i].db_id() == db_ids[i]);
        REQUIRE(ids[i].public_id() == public_ids[i]);
    }

    SECTION("sequences compare like their concatenated text") {
        std::vector<customer_id> const x {ids[0], ids[5]};
        std::vector<customer_id> const y {ids[0], ids[3], ids[9]};

        auto const concat = [](std::vector<customer_id> const& v) {
            std::string out;
            for (auto const& i : v) {
                out += i.db_id();
            }
            return out;
        };

        REQUIRE((x < y) == (concat(x) < concat(y)));
        REQUIRE((y < x) == (concat(y) < concat(x)));
    }

    SECTION("relational operators agree") {
        auto const& lo = ids.front();
        auto const& hi = ids.back();

        REQUIRE(lo < hi);
        REQUIRE(hi > lo);
        REQUIRE(lo <= hi);
        REQUIRE(hi >= lo);
        REQUIRE(lo <= lo);
        REQUIRE(lo >= lo);
        REQUIRE_FALSE(lo < lo);
    }
}

TEST_CASE("id hashing") {
    using namespace kind;

    auto rng = make_random_state(99);

    std::unordered_set<customer_id> set;
    std::set<customer_id> ordered;

    for (int i = 0; i < 100; ++i) {
        auto const x = customer_id::random_v4(*rng);
        set.insert(x);
        set.insert(x);
        ordered.insert(x);
    }

    REQUIRE(set.size() == 100);
    REQUIRE(ordered.size() == 100);

    for (auto const& x : ordered) {
        REQUIRE(set.count(x) == 1);

        auto const copy = customer_id::from_public_id(x.public_id()).value();
        REQUIRE(std::hash<customer_id> {}(copy) == std::hash<customer_id> {}(x));
        REQUIRE(hash_value(copy) == hash_value(x));
    }
}

#endif // !defined(KIND_NO_TESTS)
