#include "ck/config/Config.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "ck/schema/FieldCoercion.hpp"
#include "ck/utils/PathUtils.hpp"

namespace ck::config {

namespace {

using ck::schema::AlternativeChain;
using ck::schema::ListOf;
using ck::schema::NullAlternative;
using ck::schema::PresentAlternative;

const nlohmann::json& FieldOrNull(const nlohmann::json& document, const char* key) {
    static const nlohmann::json kAbsent;
    auto it = document.find(key);
    return it == document.end() ? kAbsent : *it;
}

// Strings go through the word recognizer before plain booleans are tried.
AlternativeChain<std::optional<bool>> SampleBoolChain() {
    return {PresentAlternative<bool>("boolean word", ck::schema::CheckBoolWord),
            PresentAlternative<bool>("boolean", ck::schema::CheckBool),
            NullAlternative<bool>()};
}

AlternativeChain<std::optional<bool>> OptionalBoolChain() {
    return {NullAlternative<bool>(),
            PresentAlternative<bool>("boolean", ck::schema::CheckBool)};
}

AlternativeChain<std::optional<std::string>> OptionalStringChain() {
    return {NullAlternative<std::string>(),
            PresentAlternative<std::string>("string", ck::schema::CheckString)};
}

AlternativeChain<std::optional<std::int64_t>> OptionalIntChain() {
    return {NullAlternative<std::int64_t>(),
            PresentAlternative<std::int64_t>("integer", ck::schema::CheckInt)};
}

AlternativeChain<std::optional<std::vector<std::string>>> StringListChain() {
    return {PresentAlternative<std::vector<std::string>>(
                "list<string>", ListOf<std::string>(ck::schema::CheckString)),
            NullAlternative<std::vector<std::string>>()};
}

AlternativeChain<std::optional<std::vector<ObjectEntry>>> ObjectListChain() {
    return {PresentAlternative<std::vector<ObjectEntry>>(
                "list<ObjectEntry>",
                ListOf<ObjectEntry>(ck::schema::FromDecoder<ObjectEntry>(&ObjectEntry::FromJson))),
            NullAlternative<std::vector<ObjectEntry>>()};
}

// Strings must be valid UTF-8 to be written out.
void RequireEncodable(const char* field, const nlohmann::json& encoded) {
    try {
        static_cast<void>(encoded.dump());
    } catch (const nlohmann::json::type_error& e) {
        throw ck::core::TypeMismatchError(
            field, encoded.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
            {"UTF-8 string"}, e.what());
    }
}

// Encodes an in-memory field and runs the encoded value back through its chain.
template <typename T>
nlohmann::json EncodeField(const char* field,
                           const AlternativeChain<std::optional<T>>& chain,
                           const std::optional<T>& value) {
    nlohmann::json encoded = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    ck::schema::ExpectOneOf(chain, encoded, field);
    RequireEncodable(field, encoded);
    return encoded;
}

} // namespace

ObjectEntry::ObjectEntry(std::optional<std::int64_t> id, std::optional<std::string> desc)
    : objId(std::move(id)),
      objDesc(std::move(desc)) {}

ObjectEntry ObjectEntry::FromJson(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw ck::core::TypeMismatchError({}, value.dump(), {"object"},
                                          fmt::format("expected object, got {}", value.type_name()));
    }
    ObjectEntry entry;
    entry.objId = ck::schema::ExpectOneOf(OptionalIntChain(), FieldOrNull(value, keys::kObjId), keys::kObjId);
    entry.objDesc = ck::schema::ExpectOneOf(OptionalStringChain(), FieldOrNull(value, keys::kObjDesc), keys::kObjDesc);
    return entry;
}

nlohmann::json ObjectEntry::Serialize() const {
    nlohmann::json result = nlohmann::json::object();
    result[keys::kObjId] = EncodeField(keys::kObjId, OptionalIntChain(), objId);
    result[keys::kObjDesc] = EncodeField(keys::kObjDesc, OptionalStringChain(), objDesc);
    return result;
}

bool ObjectEntry::operator==(const ObjectEntry& other) const {
    return objId == other.objId && objDesc == other.objDesc;
}

void to_json(nlohmann::json& json, const ObjectEntry& entry) {
    json = ck::schema::ToSerializable(entry);
}

Config Config::FromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ck::core::TypeMismatchError({}, document.dump(), {"object"},
                                          fmt::format("expected object, got {}", document.type_name()));
    }

    Config config;
    config.sampleBool = ck::schema::ExpectOneOf(
        SampleBoolChain(), FieldOrNull(document, keys::kSampleBool), keys::kSampleBool);

    config.samplePath = ck::schema::ExpectOneOf(
        OptionalStringChain(), FieldOrNull(document, keys::kSamplePath), keys::kSamplePath);
    if (config.samplePath) {
        config.samplePath = ck::utils::ValidatePath(*config.samplePath, keys::kSamplePath).string();
    }

    config.sampleString = ck::schema::ExpectOneOf(
        OptionalStringChain(), FieldOrNull(document, keys::kSampleString), keys::kSampleString);
    config.sampleInt = ck::schema::ExpectOneOf(
        OptionalIntChain(), FieldOrNull(document, keys::kSampleInt), keys::kSampleInt);
    config.simpleList = ck::schema::ExpectOneOf(
        StringListChain(), FieldOrNull(document, keys::kSimpleList), keys::kSimpleList);
    config.objectList = ck::schema::ExpectOneOf(
        ObjectListChain(), FieldOrNull(document, keys::kObjectList), keys::kObjectList);
    return config;
}

nlohmann::json Config::Serialize() const {
    nlohmann::json result = nlohmann::json::object();
    result[keys::kSampleBool] = EncodeField(keys::kSampleBool, OptionalBoolChain(), sampleBool);
    result[keys::kSamplePath] = EncodeField(keys::kSamplePath, OptionalStringChain(), samplePath);
    result[keys::kSampleString] = EncodeField(keys::kSampleString, OptionalStringChain(), sampleString);
    result[keys::kSampleInt] = EncodeField(keys::kSampleInt, OptionalIntChain(), sampleInt);
    result[keys::kSimpleList] = EncodeField(keys::kSimpleList, StringListChain(), simpleList);
    result[keys::kObjectList] = EncodeField(keys::kObjectList, ObjectListChain(), objectList);
    return result;
}

bool Config::operator==(const Config& other) const {
    return sampleBool == other.sampleBool &&
           samplePath == other.samplePath &&
           sampleString == other.sampleString &&
           sampleInt == other.sampleInt &&
           simpleList == other.simpleList &&
           objectList == other.objectList;
}

} // namespace ck::config
