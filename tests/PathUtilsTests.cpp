#include "ck/utils/PathUtils.hpp"
#include "ck/core/Error.hpp"

#include "TestHelpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>

TEST_CASE("ValidatePath resolves existing paths to absolute form", "[utils][paths]") {
    TempDir dir;
    WriteFile(dir.path / "file.txt", "x");
    std::filesystem::create_directories(dir.path / "sub");

    const auto resolved = ck::utils::ValidatePath(dir.path / "sub" / ".." / "file.txt");
    REQUIRE(resolved.is_absolute());
    REQUIRE(resolved.string() == (dir.path / "file.txt").string());
}

TEST_CASE("ValidatePath rejects missing and empty paths", "[utils][paths]") {
    REQUIRE_THROWS_AS(ck::utils::ValidatePath("/definitely/does/not/exist"), ck::core::NotFoundError);
    REQUIRE_THROWS_AS(ck::utils::ValidatePath(""), ck::core::NotFoundError);
}

TEST_CASE("ReadJsonObject returns the decoded object", "[utils][paths]") {
    TempDir dir;
    WriteFile(dir.path / "doc.json", R"({"a": 1, "b": [true, null]})");

    const nlohmann::json document = ck::utils::ReadJsonObject(dir.path / "doc.json");
    REQUIRE(document.is_object());
    REQUIRE(document["a"] == 1);
    REQUIRE(document["b"].size() == 2);
}

TEST_CASE("ReadJsonObject reports malformed and non-object documents", "[utils][paths]") {
    TempDir dir;
    WriteFile(dir.path / "broken.json", "{ this is not valid json");
    WriteFile(dir.path / "array.json", "[1, 2, 3]");

    REQUIRE_THROWS_AS(ck::utils::ReadJsonObject(dir.path / "broken.json"), ck::core::ParseError);
    REQUIRE_THROWS_AS(ck::utils::ReadJsonObject(dir.path / "array.json"), ck::core::ParseError);
    REQUIRE_THROWS_AS(ck::utils::ReadJsonObject(dir.path / "missing.json"), ck::core::NotFoundError);
}
