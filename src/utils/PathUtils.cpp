#include "ck/utils/PathUtils.hpp"

#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ck/core/Error.hpp"

namespace ck::utils {

std::filesystem::path ValidatePath(const std::filesystem::path& path, std::string_view subject) {
    if (path.empty()) {
        throw ck::core::NotFoundError(subject, std::string());
    }

    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    if (!std::filesystem::exists(absolute, ec)) {
        throw ck::core::NotFoundError(subject, absolute.lexically_normal().string());
    }

    std::filesystem::path canonical = std::filesystem::canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return canonical;
}

nlohmann::json ReadJsonObject(const std::filesystem::path& path) {
    const std::filesystem::path resolved = ValidatePath(path, "JSON file");

    std::ifstream file(resolved);
    if (!file) {
        throw ck::core::IoError("open for reading", resolved.string());
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ck::core::ParseError(resolved.string(), e.what());
    }

    if (!document.is_object()) {
        throw ck::core::ParseError(
            resolved.string(),
            fmt::format("top-level value must be an object, got {}", document.type_name()));
    }
    return document;
}

} // namespace ck::utils
