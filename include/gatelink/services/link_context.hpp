/**
 * @file link_context.hpp
 * @brief Long-lived collaborators shared by the local API.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/core/discovery_aggregator.hpp"
#include "gatelink/security/auth_token_store.hpp"
#include "gatelink/security/device_identity.hpp"

#include <memory>

namespace gatelink {
namespace services {

/**
 * @struct LinkContext
 * @brief Built once by the daemon and handed to every service.
 */
struct LinkContext {
    std::shared_ptr<core::DiscoveryAggregator> aggregator;
    std::shared_ptr<security::DeviceIdentityStore> identity;
    std::shared_ptr<security::AuthTokenStore> tokens;
};

}  // namespace services
}  // namespace gatelink
