#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "ck/config/Config.hpp"

namespace ck::core {
class ILogSink;
}

namespace ck::config {

/**
 * @brief Loads a Config from a JSON file and writes it back out.
 *
 * Failures are reported to the sink at Critical level and then rethrown as
 * the matching ck::core error; nothing is defaulted on failure.
 */
class ConfigSerializer {
public:
    explicit ConfigSerializer(ck::core::ILogSink& log);

    /**
     * @throws ck::core::NotFoundError  missing file or sample_path
     * @throws ck::core::ParseError     invalid JSON or non-object top level
     * @throws ck::core::TypeMismatchError  a field matched none of its shapes
     */
    Config Deserialize(const std::filesystem::path& path) const;

    // Writes directory/filename with 4-space indentation, truncating any existing file.
    void Serialize(const Config& config,
                   const std::filesystem::path& directory,
                   const std::string& filename) const;

private:
    ck::core::ILogSink& m_log;
};

nlohmann::json ToJson(const Config& config);

} // namespace ck::config
