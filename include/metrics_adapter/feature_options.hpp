// === Feature Options =========================================================
//
// Optional server features: profiling endpoints, the debug socket, and API
// priority and fairness.

#pragma once

#include <string>

#include "metrics_adapter/api_client.hpp"
#include "metrics_adapter/component_options.hpp"
#include "metrics_adapter/server_config.hpp"

namespace metrics_adapter {

class FeatureOptions final : public ComponentOptions {
  public:
    FeatureOptions() = default;

    [[nodiscard]] ValidationErrorList validate() const override;
    void add_flags(boost::program_options::options_description& flag_set) override;

    /**
     * @brief Copy feature switches into @p server_config and, with priority
     *        and fairness enabled, install its flow controller.
     *
     * Throws when priority and fairness lacks a client, an informer factory,
     * or a positive in-flight limit.
     */
    void apply_to(ServerConfig& server_config,
                  const ApiClientPtr& client,
                  const SharedInformerFactoryPtr& informers) const;

    bool enable_profiling{true};
    bool enable_contention_profiling{};
    std::string debug_socket_path{};
    bool enable_priority_and_fairness{true};
};

}  // namespace metrics_adapter
