#include "ck/schema/FieldCoercion.hpp"
#include "ck/schema/ISerializable.hpp"

#include <limits>

#include "ck/utils/StringUtils.hpp"

namespace ck::schema {

namespace {

template <typename T>
CheckResult<T> Mismatch(std::string_view expected, const nlohmann::json& value) {
    return CheckResult<T>::Failure(fmt::format("expected {}, got {}", expected, value.type_name()));
}

template <typename T>
T OrThrow(CheckResult<T> result, const char* expected, const nlohmann::json& value) {
    if (!result) {
        throw ck::core::TypeMismatchError({}, value.dump(), {expected}, result.Reason());
    }
    return result.TakeValue();
}

} // namespace

CheckResult<bool> CheckBool(const nlohmann::json& value) {
    if (!value.is_boolean()) {
        return Mismatch<bool>("boolean", value);
    }
    return CheckResult<bool>::Success(value.get<bool>());
}

CheckResult<std::int64_t> CheckInt(const nlohmann::json& value) {
    if (!value.is_number_integer()) {
        return Mismatch<std::int64_t>("integer", value);
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return CheckResult<std::int64_t>::Failure("integer out of 64-bit signed range");
    }
    return CheckResult<std::int64_t>::Success(value.get<std::int64_t>());
}

CheckResult<std::string> CheckString(const nlohmann::json& value) {
    if (!value.is_string()) {
        return Mismatch<std::string>("string", value);
    }
    return CheckResult<std::string>::Success(value.get<std::string>());
}

CheckResult<std::monostate> CheckNull(const nlohmann::json& value) {
    if (!value.is_null()) {
        return Mismatch<std::monostate>("null", value);
    }
    return CheckResult<std::monostate>::Success(std::monostate{});
}

CheckResult<bool> CheckBoolWord(const nlohmann::json& value) {
    if (!value.is_string()) {
        return Mismatch<bool>("string", value);
    }
    return CheckResult<bool>::Success(ck::utils::StrToBool(value.get_ref<const std::string&>()));
}

bool ExpectBool(const nlohmann::json& value) {
    return OrThrow(CheckBool(value), "boolean", value);
}

std::int64_t ExpectInt(const nlohmann::json& value) {
    return OrThrow(CheckInt(value), "integer", value);
}

std::string ExpectString(const nlohmann::json& value) {
    return OrThrow(CheckString(value), "string", value);
}

void ExpectNull(const nlohmann::json& value) {
    OrThrow(CheckNull(value), "null", value);
}

nlohmann::json ToSerializable(const ISerializable& record) {
    nlohmann::json mapping = record.Serialize();
    if (!mapping.is_object()) {
        throw ck::core::TypeMismatchError({}, mapping.dump(), {"object"}, "serialized record is not a mapping");
    }
    return mapping;
}

} // namespace ck::schema
