#include <exception>
#include <filesystem>

#include "ck/config/ConfigSerializer.hpp"
#include "ck/core/Error.hpp"
#include "ck/core/Logger.hpp"

int main() {
  ck::core::Logger logger(ck::core::LoggerOptions::FromEnvironment());

  try {
    ck::config::ConfigSerializer serializer(logger);

    const std::filesystem::path configPath = std::filesystem::path(CK_DEFAULT_CONFIG_PATH);
    const ck::config::Config config = serializer.Deserialize(configPath);
    serializer.Serialize(config, std::filesystem::current_path(), CK_DEFAULT_OUTPUT_NAME);
  } catch (const ck::core::Error&) {
    // Already reported by the serializer.
    return 1;
  } catch (const std::exception& ex) {
    logger.Critical("[main] Fatal exception: {}", ex.what());
    return 1;
  }

  logger.Debug("program terminated");
  return 0;
}
