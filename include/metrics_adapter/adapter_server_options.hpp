// === Adapter Server Options ==================================================
//
// Aggregate of every server concern's options. Validation reports all
// problems at once; application runs the concerns in dependency order and
// stops at the first failure, leaving earlier effects in place.

#pragma once

#include <chrono>
#include <memory>

#include <boost/program_options/options_description.hpp>

#include "metrics_adapter/api_client.hpp"
#include "metrics_adapter/apply_error.hpp"
#include "metrics_adapter/audit_options.hpp"
#include "metrics_adapter/authentication_options.hpp"
#include "metrics_adapter/authorization_options.hpp"
#include "metrics_adapter/component_options.hpp"
#include "metrics_adapter/feature_options.hpp"
#include "metrics_adapter/openapi_config.hpp"
#include "metrics_adapter/rest_config.hpp"
#include "metrics_adapter/secure_serving_options.hpp"
#include "metrics_adapter/server_config.hpp"

namespace metrics_adapter {

/** @brief Resync period of the informer factory built during application. */
inline constexpr Duration k_informer_resync{std::chrono::minutes{10}};

/**
 * @brief Options of the metrics adapter API server.
 *
 * Component pointers are never null after create(); the OpenAPI descriptors
 * are optional.
 */
struct AdapterServerOptions final {
    std::shared_ptr<SecureServingOptions> secure_serving{};
    std::shared_ptr<AuthenticationOptions> authentication{};
    std::shared_ptr<AuthorizationOptions> authorization{};
    std::shared_ptr<AuditOptions> audit{};
    std::shared_ptr<FeatureOptions> features{};

    OpenApiConfigPtr openapi_config{};
    OpenApiV3ConfigPtr openapi_v3_config{};
    bool enable_metrics{true};

    /** @brief Options with every component at its defaults. */
    static AdapterServerOptions create();

    /** @brief Errors of every component, in component order. */
    [[nodiscard]] ValidationErrorList validate() const;

    /** @brief Register every component's flags on @p flag_set. */
    void add_flags(boost::program_options::options_description& flag_set);

    /**
     * @brief Apply all options to @p server_config using the default client factory.
     *
     * Throws ApplyError tagged with the failing stage. Stages that completed
     * before the failure keep their effects on @p server_config.
     */
    void apply_to(ServerConfig& server_config, const RestConfig& client_config);

    /** @brief As above, with the client factory supplied by the caller. */
    void apply_to(ServerConfig& server_config, const RestConfig& client_config, const ClientFactory& client_factory);
};

}  // namespace metrics_adapter
