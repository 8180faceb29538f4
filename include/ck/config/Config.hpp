#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ck/schema/ISerializable.hpp"

namespace ck::config {

namespace keys {
inline constexpr const char* kSampleBool = "sample_bool";
inline constexpr const char* kSamplePath = "sample_path";
inline constexpr const char* kSampleString = "sample_string";
inline constexpr const char* kSampleInt = "sample_int";
inline constexpr const char* kSimpleList = "simple_list";
inline constexpr const char* kObjectList = "object_list";

inline constexpr const char* kObjId = "obj_id";
inline constexpr const char* kObjDesc = "obj_desc";
} // namespace keys

struct ObjectEntry : public ck::schema::ISerializable {
    std::optional<std::int64_t> objId;
    std::optional<std::string> objDesc;

    ObjectEntry() = default;
    ObjectEntry(std::optional<std::int64_t> id, std::optional<std::string> desc);

    // @throws ck::core::TypeMismatchError naming the offending field.
    static ObjectEntry FromJson(const nlohmann::json& value);

    nlohmann::json Serialize() const override;

    bool operator==(const ObjectEntry& other) const;
    bool operator!=(const ObjectEntry& other) const { return !(*this == other); }
};

/**
 * @brief Validated configuration record.
 *
 * Every field is optional on its own; a missing key and an explicit null both
 * leave the field empty and both serialize back to null.
 */
struct Config : public ck::schema::ISerializable {
    std::optional<bool> sampleBool;
    std::optional<std::string> samplePath;   // absolute, existed when validated
    std::optional<std::string> sampleString;
    std::optional<std::int64_t> sampleInt;
    std::optional<std::vector<std::string>> simpleList;
    std::optional<std::vector<ObjectEntry>> objectList;

    /**
     * @brief Builds a Config from a decoded top-level object. Unknown keys are ignored.
     * @throws ck::core::TypeMismatchError if a field matches none of its shapes.
     * @throws ck::core::NotFoundError if sample_path names a missing path.
     */
    static Config FromJson(const nlohmann::json& document);

    // Re-validates every field and returns an object carrying all six keys.
    nlohmann::json Serialize() const override;

    bool operator==(const Config& other) const;
    bool operator!=(const Config& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& json, const ObjectEntry& entry);

} // namespace ck::config
