// === OpenAPI Descriptors =====================================================
//
// Optional schema-publication settings attached to the runtime configuration.
// Their contents are consumed by the document generator, not inspected here.

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace metrics_adapter {

/** @brief "info" block shared by both document versions. */
struct OpenApiInfo final {
    std::string title{};
    std::string version{};
    std::string description{};
};

/** @brief Settings for the OpenAPI v2 (swagger) document. */
struct OpenApiConfig final {
    OpenApiInfo info{};
    std::vector<std::string> ignore_prefixes{}; /**< Paths left out of the document. */
    std::string default_response_description{"Default Response."};
};

/** @brief Settings for the per-group OpenAPI v3 documents. */
struct OpenApiV3Config final {
    OpenApiInfo info{};
    std::vector<std::string> ignore_prefixes{};
};

using OpenApiConfigPtr = std::shared_ptr<OpenApiConfig>;
using OpenApiV3ConfigPtr = std::shared_ptr<OpenApiV3Config>;

}  // namespace metrics_adapter
