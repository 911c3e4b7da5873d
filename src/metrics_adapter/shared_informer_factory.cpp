#include "metrics_adapter/shared_informer_factory.hpp"

#include <stdexcept>
#include <utility>

#include "metrics_adapter/logging.hpp"

namespace metrics_adapter {

std::string GroupVersionResource::to_string() const {
    if (group.empty()) {
        return version + "/" + resource;
    }
    return group + "/" + version + "/" + resource;
}

Informer::Informer(GroupVersionResource resource, std::string list_path, Duration resync_period)
    : resource_(std::move(resource)),
      str_list_path_(std::move(list_path)),
      resync_period_(resync_period) {}

const GroupVersionResource& Informer::resource() const noexcept {
    return resource_;
}

const std::string& Informer::list_path() const noexcept {
    return str_list_path_;
}

Duration Informer::resync_period() const noexcept {
    return resync_period_;
}

bool Informer::running() const noexcept {
    return flag_running_.load();
}

SharedInformerFactory::SharedInformerFactory(ApiClientPtr client, Duration default_resync)
    : client_(std::move(client)),
      default_resync_(default_resync) {
    if (!client_) {
        throw std::invalid_argument("SharedInformerFactory requires a client");
    }
}

const ApiClientPtr& SharedInformerFactory::client() const noexcept {
    return client_;
}

Duration SharedInformerFactory::default_resync() const noexcept {
    return default_resync_;
}

InformerPtr SharedInformerFactory::informer_for(const GroupVersionResource& resource) {
    std::scoped_lock lock(mutex_);
    const auto iterator_informer = map_informers_.find(resource);
    if (iterator_informer != map_informers_.end()) {
        return iterator_informer->second;
    }
    auto informer = std::make_shared<Informer>(
        resource,
        client_->resource_path(resource.group, resource.version, resource.resource),
        default_resync_
    );
    if (flag_started_.load()) {
        informer->flag_running_.store(true);
    }
    map_informers_.emplace(resource, informer);
    return informer;
}

std::vector<GroupVersionResource> SharedInformerFactory::registered_resources() const {
    std::scoped_lock lock(mutex_);
    std::vector<GroupVersionResource> resources;
    resources.reserve(map_informers_.size());
    for (const auto& [resource, informer] : map_informers_) {
        resources.push_back(resource);
    }
    return resources;
}

void SharedInformerFactory::start() {
    std::scoped_lock lock(mutex_);
    flag_started_.store(true);
    for (const auto& [resource, informer] : map_informers_) {
        if (!informer->flag_running_.load()) {
            get_logger()->info("Starting informer for {} every {}", resource.to_string(), format_duration(default_resync_));
            informer->flag_running_.store(true);
        }
    }
}

void SharedInformerFactory::shutdown() {
    std::scoped_lock lock(mutex_);
    flag_started_.store(false);
    for (const auto& [resource, informer] : map_informers_) {
        informer->flag_running_.store(false);
    }
}

bool SharedInformerFactory::started() const noexcept {
    return flag_started_.load();
}

}  // namespace metrics_adapter
