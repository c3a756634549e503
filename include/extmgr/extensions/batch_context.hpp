#pragma once

#include <string>
#include <vector>

namespace extmgr {
namespace extensions {

/**
 * @brief A per-item failure that did not abort its batch.
 */
struct ItemFailure {
    std::string package;
    std::string messageKey;               ///< Message key, or what() for non-domain errors
    std::vector<std::string> parameters;
};

/**
 * @brief State threaded through the pre/post hooks of one bulk operation.
 *
 * A fresh context is created for every install, update or remove call and
 * returned to the caller afterwards.
 */
struct BatchContext {
    /// Extensions that were enabled before an update started, in request order
    std::vector<std::string> enabledExtensions;

    /// Failures swallowed by the enable/disable brackets
    std::vector<ItemFailure> failures;

    bool ok() const { return failures.empty(); }
};

} // namespace extensions
} // namespace extmgr
