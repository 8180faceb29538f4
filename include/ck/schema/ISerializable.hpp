#pragma once

#include <nlohmann/json_fwd.hpp>

namespace ck::schema {

/**
 * @brief Implemented by records that can produce their own JSON mapping.
 */
class ISerializable {
public:
    virtual ~ISerializable() = default;

    virtual nlohmann::json Serialize() const = 0;
};

/**
 * @brief Returns the JSON-ready mapping of @p record.
 * @throws ck::core::TypeMismatchError if the record produced something other than an object.
 */
nlohmann::json ToSerializable(const ISerializable& record);

} // namespace ck::schema
