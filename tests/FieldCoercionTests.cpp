#include "ck/schema/FieldCoercion.hpp"
#include "ck/schema/ISerializable.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

using nlohmann::json;
namespace schema = ck::schema;

TEST_CASE("Primitive checks accept only their own kind", "[schema]") {
    REQUIRE(schema::CheckBool(json(true)).Value());
    REQUIRE_FALSE(schema::CheckBool(json("true")));
    REQUIRE_FALSE(schema::CheckBool(json(1)));

    REQUIRE(schema::CheckInt(json(-12)).Value() == -12);
    REQUIRE_FALSE(schema::CheckInt(json(1.5)));
    REQUIRE_FALSE(schema::CheckInt(json(true)));
    REQUIRE_FALSE(schema::CheckInt(json(18446744073709551615ULL)));

    REQUIRE(schema::CheckString(json("abc")).Value() == "abc");
    REQUIRE_FALSE(schema::CheckString(json(nullptr)));

    REQUIRE(schema::CheckNull(json(nullptr)));
    REQUIRE_FALSE(schema::CheckNull(json(0)));
    REQUIRE_FALSE(schema::CheckNull(json::array()));
}

TEST_CASE("Failed checks explain what was expected", "[schema]") {
    const auto result = schema::CheckInt(json("seven"));
    REQUIRE_FALSE(result.Ok());
    REQUIRE(result.Reason() == "expected integer, got string");
}

TEST_CASE("Expect forms throw TypeMismatchError", "[schema]") {
    REQUIRE(schema::ExpectString(json("x")) == "x");
    REQUIRE_THROWS_AS(schema::ExpectBool(json("x")), ck::core::TypeMismatchError);
    REQUIRE_THROWS_AS(schema::ExpectInt(json(nullptr)), ck::core::TypeMismatchError);
    REQUIRE_THROWS_AS(schema::ExpectNull(json(false)), ck::core::TypeMismatchError);
    REQUIRE_NOTHROW(schema::ExpectNull(json(nullptr)));
}

TEST_CASE("CheckBoolWord coerces strings through the word recognizer", "[schema]") {
    REQUIRE(schema::CheckBoolWord(json("Yes")).Value());
    REQUIRE_FALSE(schema::CheckBoolWord(json("nope")).Value());
    REQUIRE_FALSE(schema::CheckBoolWord(json(true)).Ok());
}

TEST_CASE("ExpectList validates every element in order", "[schema]") {
    const schema::Check<std::string> element = schema::CheckString;

    REQUIRE(schema::ExpectList(element, json::array()).empty());

    const auto items = schema::ExpectList(element, json::parse(R"(["a", "b", "c"])"));
    REQUIRE(items.size() == 3);
    REQUIRE(items[2] == "c");

    const auto bad = schema::CheckList(element, json::parse(R"(["a", 2, null])"));
    REQUIRE_FALSE(bad.Ok());
    REQUIRE(bad.Reason().find("element [1]") != std::string::npos);

    REQUIRE_THROWS_AS(schema::ExpectList(element, json("a")), ck::core::TypeMismatchError);
}

TEST_CASE("Nested failures report the path to the offending element", "[schema]") {
    const auto decoder = schema::FromDecoder<std::int64_t>([](const json& value) -> std::int64_t {
        const schema::AlternativeChain<std::optional<std::int64_t>> inner{
            schema::PresentAlternative<std::int64_t>("integer", schema::CheckInt)};
        return *schema::ExpectOneOf(inner, value.at("id"), "id");
    });
    const schema::AlternativeChain<std::optional<std::vector<std::int64_t>>> chain{
        schema::PresentAlternative<std::vector<std::int64_t>>("list", schema::ListOf<std::int64_t>(decoder)),
        schema::NullAlternative<std::vector<std::int64_t>>()};

    try {
        schema::ExpectOneOf(chain, json::parse(R"([{"id": 1}, {"id": 2}, {"id": "x"}])"), "items");
        FAIL("expected a TypeMismatchError");
    } catch (const ck::core::TypeMismatchError& e) {
        REQUIRE(e.field() == "items[2].id");
    }

    REQUIRE(schema::JoinFieldPath("items", "") == "items");
    REQUIRE(schema::JoinFieldPath("", "id") == "id");
    REQUIRE(schema::JoinFieldPath("[0]", "id") == "[0].id");
}

TEST_CASE("ExpectOneOf returns the first matching alternative", "[schema]") {
    const schema::AlternativeChain<std::optional<bool>> chain{
        schema::PresentAlternative<bool>("boolean word", schema::CheckBoolWord),
        schema::PresentAlternative<bool>("boolean", schema::CheckBool),
        schema::NullAlternative<bool>()};

    REQUIRE(schema::ExpectOneOf(chain, json("y")) == std::optional<bool>(true));
    REQUIRE(schema::ExpectOneOf(chain, json(false)) == std::optional<bool>(false));
    REQUIRE_FALSE(schema::ExpectOneOf(chain, json(nullptr)).has_value());
}

TEST_CASE("ExpectOneOf failure lists every attempted shape", "[schema]") {
    const schema::AlternativeChain<std::optional<std::int64_t>> chain{
        schema::NullAlternative<std::int64_t>(),
        schema::PresentAlternative<std::int64_t>("integer", schema::CheckInt)};

    try {
        schema::ExpectOneOf(chain, json("not a number"), "sample_int");
        FAIL("expected a TypeMismatchError");
    } catch (const ck::core::TypeMismatchError& e) {
        REQUIRE(e.field() == "sample_int");
        REQUIRE(e.rawValue() == "\"not a number\"");
        const std::vector<std::string> expected{"null", "integer"};
        REQUIRE(e.expected() == expected);
        REQUIRE(e.details().find("null: expected null, got string") != std::string::npos);
        REQUIRE(e.details().find("integer: expected integer, got string") != std::string::npos);
    }
}

TEST_CASE("FromDecoder only converts shape mismatches into failures", "[schema]") {
    const auto mismatching = schema::FromDecoder<int>([](const json& value) -> int {
        throw ck::core::TypeMismatchError({}, value.dump(), {"object"});
    });
    REQUIRE_FALSE(mismatching(json(1)).Ok());

    const auto missing = schema::FromDecoder<int>([](const json&) -> int {
        throw ck::core::NotFoundError("Path", "/missing");
    });
    REQUIRE_THROWS_AS(missing(json(1)), ck::core::NotFoundError);
}

namespace {

struct Point : public schema::ISerializable {
    int x = 0;
    json Serialize() const override { return json{{"x", x}}; }
};

struct Scalar : public schema::ISerializable {
    json Serialize() const override { return json(5); }
};

} // namespace

TEST_CASE("ToSerializable returns the record's mapping", "[schema]") {
    Point point;
    point.x = 3;
    REQUIRE(schema::ToSerializable(point) == json::object({{"x", 3}}));
    REQUIRE_THROWS_AS(schema::ToSerializable(Scalar{}), ck::core::TypeMismatchError);
}
