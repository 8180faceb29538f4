#include "ck/config/ConfigSerializer.hpp"

#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ck/core/Error.hpp"
#include "ck/core/ILogSink.hpp"
#include "ck/schema/FieldCoercion.hpp"
#include "ck/utils/PathUtils.hpp"

namespace ck::config {

namespace {

constexpr int kIndent = 4;

} // namespace

ConfigSerializer::ConfigSerializer(ck::core::ILogSink& log)
    : m_log(log) {}

Config ConfigSerializer::Deserialize(const std::filesystem::path& path) const {
    try {
        const nlohmann::json document = ck::utils::ReadJsonObject(path);
        Config config = Config::FromJson(document);

        if (config.objectList) {
            for (const auto& entry : *config.objectList) {
                m_log.Debug("[ConfigSerializer] ObjectEntry obj_id: {}, obj_desc: {}",
                            entry.objId ? std::to_string(*entry.objId) : "null",
                            entry.objDesc.value_or("null"));
            }
        }
        m_log.Info("[ConfigSerializer] Config deserialized from '{}': {}",
                   path.string(), ToJson(config).dump());
        return config;
    } catch (const ck::core::Error& e) {
        m_log.Critical("[ConfigSerializer] Failed to load '{}': {}", path.string(), e.what());
        throw;
    }
}

void ConfigSerializer::Serialize(const Config& config,
                                 const std::filesystem::path& directory,
                                 const std::string& filename) const {
    try {
        const std::filesystem::path resolved = ck::utils::ValidatePath(directory, "Output directory");
        const std::filesystem::path name(filename);
        if (name.empty() || name != name.filename() || name == "." || name == "..") {
            throw ck::core::InvariantViolationError(
                "Serialize", fmt::format("output name '{}' must be a plain file name", filename));
        }
        const std::string text = ToJson(config).dump(kIndent);

        const std::filesystem::path target = resolved / filename;
        std::ofstream file(target, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw ck::core::IoError("open for writing", target.string());
        }
        file << text;
        file.close();
        if (file.fail()) {
            throw ck::core::IoError("write", target.string());
        }

        m_log.Info("[ConfigSerializer] Config serialized to '{}'", target.string());
    } catch (const ck::core::Error& e) {
        m_log.Critical("[ConfigSerializer] Failed to save config: {}", e.what());
        throw;
    }
}

nlohmann::json ToJson(const Config& config) {
    return ck::schema::ToSerializable(config);
}

} // namespace ck::config
