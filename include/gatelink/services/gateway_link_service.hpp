/**
 * @file gateway_link_service.hpp
 * @brief Callback gRPC service exposing discovery, identity and tokens.
 *
 * GatewayLinkService is the API local collaborators use:
 * - ListGateways / WatchGateways: discovery snapshots (WatchGateways streams)
 * - GetDeviceIdentity / SignPayload / VerifySignature: device identity
 * - SaveToken / LoadToken / ClearToken / GetTokenStatus: device tokens
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/services/export.hpp"
#include "gatelink/services/link_context.hpp"

#include <grpcpp/grpcpp.h>

#include "gatelink/proto/gateway_link.grpc.pb.h"

namespace gatelink {
namespace services {

/// Copy a discovery snapshot into its wire message.
GATELINK_SERVICES_API void toProto(const core::DiscoveryState& state, link::DiscoveryState* out);

/**
 * @class GatewayLinkServiceImpl
 * @brief Implementation of the GatewayLinkService gRPC service.
 *
 * Usage:
 * @code
 * GatewayLinkServiceImpl service(context);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("127.0.0.1:5710", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class GATELINK_SERVICES_API GatewayLinkServiceImpl final
    : public link::GatewayLinkService::CallbackService {
public:
    explicit GatewayLinkServiceImpl(LinkContext context);

    grpc::ServerUnaryReactor* ListGateways(
        grpc::CallbackServerContext* context,
        const link::ListGatewaysRequest* request,
        link::DiscoveryState* response) override;

    /**
     * @brief Stream the current state, then every change until cancelled.
     *
     * Intermediate states are coalesced while a write is in flight; the
     * client always ends up with the latest version.
     */
    grpc::ServerWriteReactor<link::DiscoveryState>* WatchGateways(
        grpc::CallbackServerContext* context,
        const link::WatchGatewaysRequest* request) override;

    grpc::ServerUnaryReactor* GetDeviceIdentity(
        grpc::CallbackServerContext* context,
        const link::GetDeviceIdentityRequest* request,
        link::DeviceIdentityInfo* response) override;

    grpc::ServerUnaryReactor* SignPayload(
        grpc::CallbackServerContext* context,
        const link::SignPayloadRequest* request,
        link::SignPayloadResponse* response) override;

    grpc::ServerUnaryReactor* VerifySignature(
        grpc::CallbackServerContext* context,
        const link::VerifySignatureRequest* request,
        link::VerifySignatureResponse* response) override;

    grpc::ServerUnaryReactor* SaveToken(
        grpc::CallbackServerContext* context,
        const link::SaveTokenRequest* request,
        link::SaveTokenResponse* response) override;

    grpc::ServerUnaryReactor* LoadToken(
        grpc::CallbackServerContext* context,
        const link::TokenKey* request,
        link::LoadTokenResponse* response) override;

    grpc::ServerUnaryReactor* ClearToken(
        grpc::CallbackServerContext* context,
        const link::TokenKey* request,
        link::ClearTokenResponse* response) override;

    grpc::ServerUnaryReactor* GetTokenStatus(
        grpc::CallbackServerContext* context,
        const link::TokenKey* request,
        link::TokenStatus* response) override;

private:
    LinkContext context_;
};

}  // namespace services
}  // namespace gatelink
