// === Flow Control ============================================================
//
// API priority and fairness: a concurrency limit shared by priority levels,
// with flow schemas and priority levels watched from the cluster through the
// shared informer factory.

#pragma once

#include <memory>

#include "metrics_adapter/shared_informer_factory.hpp"

namespace metrics_adapter {

/** @brief API group and version serving the flow-control objects. */
inline constexpr char k_flowcontrol_group[] = "flowcontrol.apiserver.k8s.io";
inline constexpr char k_flowcontrol_version[] = "v1";

class FlowController final {
  public:
    /**
     * @brief Register flow-control informers on @p informers.
     *
     * Throws std::invalid_argument for a null client or factory, or for a
     * non-positive @p server_concurrency_limit.
     */
    FlowController(ApiClientPtr client, SharedInformerFactoryPtr informers, int server_concurrency_limit);

    [[nodiscard]] int server_concurrency_limit() const noexcept;
    [[nodiscard]] const InformerPtr& flow_schemas() const noexcept;
    [[nodiscard]] const InformerPtr& priority_levels() const noexcept;
    [[nodiscard]] const SharedInformerFactoryPtr& informer_factory() const noexcept;

  private:
    ApiClientPtr client_;
    SharedInformerFactoryPtr informers_;
    int server_concurrency_limit_;
    InformerPtr flow_schemas_;
    InformerPtr priority_levels_;
};

using FlowControllerPtr = std::shared_ptr<FlowController>;

}  // namespace metrics_adapter
