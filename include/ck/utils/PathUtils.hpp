#pragma once

#include <filesystem>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace ck::utils {

/**
 * @brief Resolves @p path to its absolute canonical form and checks that it exists.
 * @param subject Names the path in the error message ("Config file", "Output directory", ...).
 * @throws ck::core::NotFoundError if @p path is empty or does not exist.
 */
std::filesystem::path ValidatePath(const std::filesystem::path& path,
                                   std::string_view subject = "Path");

/**
 * @brief Reads a JSON document whose top level must be an object.
 * @throws ck::core::NotFoundError if the file does not exist.
 * @throws ck::core::IoError if the file cannot be opened.
 * @throws ck::core::ParseError on malformed JSON or a non-object top level.
 */
nlohmann::json ReadJsonObject(const std::filesystem::path& path);

} // namespace ck::utils
