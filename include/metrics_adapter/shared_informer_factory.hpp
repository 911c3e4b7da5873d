// === Shared Informer Factory =================================================
//
// Hands out one watch-backed cache per resource so every consumer of the same
// resource shares a single list/watch against the API server. The factory is
// built during option application but started later by the server runtime.

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "metrics_adapter/api_client.hpp"
#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

/** @brief Group/version/resource triple naming a watched collection. */
struct GroupVersionResource final {
    std::string group{};
    std::string version{};
    std::string resource{};

    [[nodiscard]] std::string to_string() const;
    friend bool operator<(const GroupVersionResource& lhs, const GroupVersionResource& rhs) {
        return std::tie(lhs.group, lhs.version, lhs.resource) < std::tie(rhs.group, rhs.version, rhs.resource);
    }
};

/** @brief Cache of a single resource collection; started by its factory. */
class Informer final {
  public:
    Informer(GroupVersionResource resource, std::string list_path, Duration resync_period);

    [[nodiscard]] const GroupVersionResource& resource() const noexcept;
    /** @brief API path the informer lists and watches. */
    [[nodiscard]] const std::string& list_path() const noexcept;
    [[nodiscard]] Duration resync_period() const noexcept;
    [[nodiscard]] bool running() const noexcept;

  private:
    friend class SharedInformerFactory;

    GroupVersionResource resource_;
    std::string str_list_path_;
    Duration resync_period_;
    std::atomic<bool> flag_running_{false};
};

using InformerPtr = std::shared_ptr<Informer>;

/** @brief Registry of shared informers bound to one client. */
class SharedInformerFactory final {
  public:
    SharedInformerFactory(ApiClientPtr client, Duration default_resync);

    [[nodiscard]] const ApiClientPtr& client() const noexcept;
    [[nodiscard]] Duration default_resync() const noexcept;

    /** @brief Return the informer for @p resource, registering it on first use. */
    InformerPtr informer_for(const GroupVersionResource& resource);
    /** @brief Resources registered so far, in sorted order. */
    [[nodiscard]] std::vector<GroupVersionResource> registered_resources() const;

    /** @brief Start every registered informer that is not running yet. */
    void start();
    /** @brief Stop all informers. */
    void shutdown();
    [[nodiscard]] bool started() const noexcept;

  private:
    ApiClientPtr client_;
    Duration default_resync_;
    mutable std::mutex mutex_;
    std::map<GroupVersionResource, InformerPtr> map_informers_;
    std::atomic<bool> flag_started_{false};
};

}  // namespace metrics_adapter
