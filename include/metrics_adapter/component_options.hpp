// === Component Options =======================================================
//
// Shared contract for every independently configurable server concern. Each
// concern validates itself and registers its own flags; applying it is a
// concern-specific operation because every concern writes into a different
// part of the runtime configuration.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>

#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

/**
 * @brief One misconfiguration reported by a component's validation.
 */
struct ValidationError final {
    std::string flag{};    /**< Flag the problem is attributed to, without leading dashes. */
    std::string message{}; /**< Operator-facing description. */

    /** @brief Render as "--flag: message", or the bare message when no flag applies. */
    [[nodiscard]] std::string to_string() const;
};

using ValidationErrorList = std::vector<ValidationError>;

/**
 * @brief Base class for the options of a single server concern.
 */
class ComponentOptions {
  public:
    virtual ~ComponentOptions() = default;

    /** @brief Report every problem with the current values; never throws. */
    [[nodiscard]] virtual ValidationErrorList validate() const = 0;
    /** @brief Register this component's flags, bound to its own fields. */
    virtual void add_flags(boost::program_options::options_description& flag_set) = 0;
};

/** @brief Flag bound to a Duration, spelled like "10s" or "1m30s". */
boost::program_options::typed_value<std::string>* duration_value(Duration& target);
/** @brief Flag bound to a comma-separated list. */
boost::program_options::typed_value<std::string>* list_value(std::vector<std::string>& target);
/** @brief Boolean flag accepting both "--name" and "--name=false". */
boost::program_options::typed_value<bool>* switch_value(bool& target);

}  // namespace metrics_adapter
