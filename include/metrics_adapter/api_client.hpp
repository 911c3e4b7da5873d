// === API Client ==============================================================
//
// Versioned API client derived from a REST configuration, and the factory
// collaborator the options pipeline uses to build it together with the shared
// informer factory handed to feature wiring.

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "metrics_adapter/rest_config.hpp"
#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

class SharedInformerFactory;

/** @brief Raised when a REST configuration cannot produce a client. */
class ClientConstructionError final : public std::runtime_error {
  public:
    explicit ClientConstructionError(const std::string& message);
};

/** @brief Scheme/host/port/prefix split out of RestConfig::host. */
struct ServerUrl final {
    std::string scheme{};
    std::string host{};
    int port{};
    std::string path_prefix{};

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Parse "[scheme://]host[:port][/prefix]"; the scheme defaults to
 *        https and the port to the scheme default.
 *
 * Throws ClientConstructionError for unsupported schemes or bad ports.
 */
ServerUrl parse_server_url(const std::string& raw_host);

/** @brief Client bound to one API server with fixed rate limits. */
class ApiClient final {
  public:
    ApiClient(RestConfig config, ServerUrl server_url);

    /** @brief Configuration the client was built from, defaults applied. */
    [[nodiscard]] const RestConfig& config() const noexcept;
    /** @brief Parsed server endpoint. */
    [[nodiscard]] const ServerUrl& server_url() const noexcept;
    [[nodiscard]] float qps() const noexcept;
    [[nodiscard]] int burst() const noexcept;
    [[nodiscard]] const std::string& user_agent() const noexcept;

    /**
     * @brief Collection path for a resource: "/api/v1/<resource>" for the core
     *        group, "/apis/<group>/<version>/<resource>" otherwise.
     */
    [[nodiscard]] std::string resource_path(const std::string& group,
                                            const std::string& version,
                                            const std::string& resource) const;

  private:
    RestConfig config_;
    ServerUrl server_url_;
};

using ApiClientPtr = std::shared_ptr<ApiClient>;
using SharedInformerFactoryPtr = std::shared_ptr<SharedInformerFactory>;

/**
 * @brief Builds clients and informer factories from external configuration.
 */
class ClientFactory {
  public:
    virtual ~ClientFactory() = default;

    /** @brief Build a client; throws ClientConstructionError on malformed input. */
    [[nodiscard]] virtual ApiClientPtr new_for_config(const RestConfig& config) const = 0;
    /** @brief Build an informer factory bound to @p client resyncing every @p resync_period. */
    [[nodiscard]] virtual SharedInformerFactoryPtr new_informer_factory(ApiClientPtr client, Duration resync_period) const = 0;
};

/** @brief Factory applying the standard client validation and defaults. */
class DefaultClientFactory final : public ClientFactory {
  public:
    [[nodiscard]] ApiClientPtr new_for_config(const RestConfig& config) const override;
    [[nodiscard]] SharedInformerFactoryPtr new_informer_factory(ApiClientPtr client, Duration resync_period) const override;
};

}  // namespace metrics_adapter
