#include "metrics_adapter/flow_control.hpp"

#include <stdexcept>
#include <utility>

#include "metrics_adapter/logging.hpp"

namespace metrics_adapter {

FlowController::FlowController(ApiClientPtr client, SharedInformerFactoryPtr informers, int server_concurrency_limit)
    : client_(std::move(client)),
      informers_(std::move(informers)),
      server_concurrency_limit_(server_concurrency_limit) {
    if (!client_) {
        throw std::invalid_argument("priority and fairness requires a core API client");
    }
    if (!informers_) {
        throw std::invalid_argument("priority and fairness requires a shared informer factory");
    }
    if (server_concurrency_limit_ <= 0) {
        throw std::invalid_argument("priority and fairness requires a positive server concurrency limit");
    }

    flow_schemas_ = informers_->informer_for({k_flowcontrol_group, k_flowcontrol_version, "flowschemas"});
    priority_levels_ = informers_->informer_for({k_flowcontrol_group, k_flowcontrol_version, "prioritylevelconfigurations"});

    get_logger()->debug("Flow control watching {} and {} with concurrency limit {}",
                        flow_schemas_->list_path(), priority_levels_->list_path(), server_concurrency_limit_);
}

int FlowController::server_concurrency_limit() const noexcept {
    return server_concurrency_limit_;
}

const InformerPtr& FlowController::flow_schemas() const noexcept {
    return flow_schemas_;
}

const InformerPtr& FlowController::priority_levels() const noexcept {
    return priority_levels_;
}

const SharedInformerFactoryPtr& FlowController::informer_factory() const noexcept {
    return informers_;
}

}  // namespace metrics_adapter
