// === Configuration ===========================================================
//
// Process-level settings that do not belong on the command line: where logs
// go, how verbose they are, and how to reach the cluster the adapter serves.
// `ConfigurationLoader` reads them from the environment so the rest of the
// adapter never calls `std::getenv` for these values.

#pragma once

#include <string>

#include "metrics_adapter/rest_config.hpp"

namespace metrics_adapter {

/**
 * @brief Environment-derived settings for one adapter process.
 */
struct Configuration final {
    std::string log_directory{}; /**< Destination directory for structured logs. */
    std::string log_level{};     /**< spdlog level name; empty keeps the default. */
    RestConfig client_config{};  /**< External cluster connection; empty when none is available. */
};

/**
 * @brief Hydrates Configuration from environment variables and initializes
 *        the shared logger as a side effect.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static RestConfig load_client_config();
};

}  // namespace metrics_adapter
