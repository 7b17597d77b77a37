/**
 * @file gateway_link_service.cpp
 * @brief GatewayLinkServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/services/gateway_link_service.hpp"
#include "gatelink/utils/logger.hpp"
#include "gatelink/utils/string_utils.hpp"

#include <mutex>
#include <optional>

namespace gatelink {
namespace services {

void toProto(const core::DiscoveryState& state, link::DiscoveryState* out) {
    out->set_version(state.version);
    out->set_status(state.status);
    out->set_local_count(static_cast<int32_t>(state.local_count));
    out->set_wide_area_count(static_cast<int32_t>(state.wide_area_count));

    for (const auto& ep : state.endpoints) {
        auto* msg = out->add_endpoints();
        msg->set_stable_id(ep.stable_id);
        msg->set_name(ep.name);
        msg->set_host(ep.host);
        msg->set_port(ep.port);
        msg->set_lan_host(ep.lan_host.value_or(""));
        msg->set_tailnet_dns(ep.tailnet_dns.value_or(""));
        msg->set_gateway_port(ep.gateway_port.value_or(0));
        msg->set_canvas_port(ep.canvas_port.value_or(0));
        msg->set_tls_enabled(ep.tls_enabled);
        msg->set_tls_fingerprint_sha256(ep.tls_fingerprint_sha256.value_or(""));
    }
}

namespace {

grpc::Status checkTokenKey(const link::TokenKey& key) {
    if (utils::trim(key.device_id()).empty() || utils::trim(key.role()).empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "device_id and role are required");
    }
    return grpc::Status::OK;
}

/**
 * @brief Loads the identity, mapping provider failures to FAILED_PRECONDITION.
 */
grpc::Status loadIdentity(security::DeviceIdentityStore& store,
                          std::shared_ptr<const security::DeviceIdentity>& out) {
    try {
        out = store.loadOrCreate();
        return grpc::Status::OK;
    } catch (const security::CryptoError& e) {
        LOG_ERROR("Service", "Device identity unavailable: {}", e.what());
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "device identity unavailable");
    }
}

}  // namespace

// =============================================================================
// ListGateways
// =============================================================================

class ListGatewaysReactor : public grpc::ServerUnaryReactor {
public:
    ListGatewaysReactor(const LinkContext& context, link::DiscoveryState* response) {
        toProto(context.aggregator->state(), response);
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// WatchGateways
// =============================================================================

class WatchGatewaysReactor : public grpc::ServerWriteReactor<link::DiscoveryState> {
public:
    explicit WatchGatewaysReactor(std::shared_ptr<core::DiscoveryAggregator> aggregator)
        : aggregator_(std::move(aggregator))
        , stream_(std::make_shared<Stream>())
    {
        stream_->reactor = this;

        std::weak_ptr<Stream> weak = stream_;
        listenerId_ = aggregator_->addListener([weak](const core::DiscoveryState& state) {
            if (auto stream = weak.lock()) {
                push(*stream, state);
            }
        });

        LOG_DEBUG("Service", "WatchGateways: stream opened");
        push(*stream_, aggregator_->state());
    }

    void OnWriteDone(bool ok) override {
        std::lock_guard<std::mutex> lock(stream_->mutex);
        if (!ok) {
            finishLocked(*stream_, grpc::Status::OK);
            return;
        }
        if (stream_->pending && !stream_->finished) {
            stream_->current = std::move(*stream_->pending);
            stream_->pending.reset();
            StartWrite(&stream_->current);
            return;
        }
        stream_->writing = false;
    }

    void OnCancel() override {
        LOG_DEBUG("Service", "WatchGateways: stream cancelled");
        std::lock_guard<std::mutex> lock(stream_->mutex);
        finishLocked(*stream_, grpc::Status::CANCELLED);
    }

    void OnDone() override {
        aggregator_->removeListener(listenerId_);
        {
            std::lock_guard<std::mutex> lock(stream_->mutex);
            stream_->finished = true;
            stream_->reactor = nullptr;
        }
        delete this;
    }

private:
    struct Stream {
        std::mutex mutex;
        WatchGatewaysReactor* reactor = nullptr;
        link::DiscoveryState current;
        std::optional<link::DiscoveryState> pending;
        uint64_t lastVersion = 0;
        bool sentAny = false;
        bool writing = false;
        bool finished = false;
    };

    static void push(Stream& stream, const core::DiscoveryState& state) {
        std::lock_guard<std::mutex> lock(stream.mutex);
        if (stream.finished || !stream.reactor) {
            return;
        }
        if (stream.sentAny && state.version <= stream.lastVersion) {
            return;
        }
        stream.sentAny = true;
        stream.lastVersion = state.version;

        link::DiscoveryState msg;
        toProto(state, &msg);
        if (stream.writing) {
            stream.pending = std::move(msg);
            return;
        }
        stream.writing = true;
        stream.current = std::move(msg);
        stream.reactor->StartWrite(&stream.current);
    }

    void finishLocked(Stream& stream, const grpc::Status& status) {
        if (stream.finished) {
            return;
        }
        stream.finished = true;
        stream.pending.reset();
        Finish(status);
    }

    std::shared_ptr<core::DiscoveryAggregator> aggregator_;
    std::shared_ptr<Stream> stream_;
    uint64_t listenerId_ = 0;
};

// =============================================================================
// Device identity
// =============================================================================

class GetDeviceIdentityReactor : public grpc::ServerUnaryReactor {
public:
    GetDeviceIdentityReactor(const LinkContext& context, link::DeviceIdentityInfo* response) {
        std::shared_ptr<const security::DeviceIdentity> identity;
        grpc::Status status = loadIdentity(*context.identity, identity);
        if (status.ok()) {
            response->set_device_id(identity->deviceId());
            response->set_public_key_base64url(context.identity->publicKeyBase64Url(identity));
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

class SignPayloadReactor : public grpc::ServerUnaryReactor {
public:
    SignPayloadReactor(const LinkContext& context,
                       const link::SignPayloadRequest* request,
                       link::SignPayloadResponse* response) {
        std::shared_ptr<const security::DeviceIdentity> identity;
        grpc::Status status = loadIdentity(*context.identity, identity);
        if (status.ok()) {
            try {
                response->set_signature_base64url(
                    context.identity->signPayload(request->payload(), identity));
            } catch (const security::IdentityStateError& e) {
                LOG_ERROR("Service", "SignPayload: {}", e.what());
                status = grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, e.what());
            } catch (const security::CryptoError& e) {
                LOG_ERROR("Service", "SignPayload failed: {}", e.what());
                status = grpc::Status(grpc::StatusCode::INTERNAL, "signing failed");
            }
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

class VerifySignatureReactor : public grpc::ServerUnaryReactor {
public:
    VerifySignatureReactor(const LinkContext& context,
                           const link::VerifySignatureRequest* request,
                           link::VerifySignatureResponse* response) {
        std::shared_ptr<const security::DeviceIdentity> identity;
        grpc::Status status = loadIdentity(*context.identity, identity);
        if (status.ok()) {
            response->set_valid(context.identity->verifySelfSignature(
                request->payload(), request->signature_base64url(), identity));
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// Device tokens
// =============================================================================

class SaveTokenReactor : public grpc::ServerUnaryReactor {
public:
    SaveTokenReactor(const LinkContext& context,
                     const link::SaveTokenRequest* request,
                     link::SaveTokenResponse* response) {
        grpc::Status status = checkTokenKey(request->key());
        if (status.ok()) {
            const bool stored = context.tokens->saveToken(
                request->key().device_id(), request->key().role(), request->token());
            response->set_stored(stored);
            if (!stored) {
                status = grpc::Status(grpc::StatusCode::INTERNAL, "token could not be stored");
            }
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

class LoadTokenReactor : public grpc::ServerUnaryReactor {
public:
    LoadTokenReactor(const LinkContext& context,
                     const link::TokenKey* request,
                     link::LoadTokenResponse* response) {
        grpc::Status status = checkTokenKey(*request);
        if (status.ok()) {
            auto token = context.tokens->loadToken(request->device_id(), request->role());
            response->set_found(token.has_value());
            if (token) {
                response->set_token(*token);
            }
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

class ClearTokenReactor : public grpc::ServerUnaryReactor {
public:
    ClearTokenReactor(const LinkContext& context, const link::TokenKey* request) {
        grpc::Status status = checkTokenKey(*request);
        if (status.ok()) {
            context.tokens->clearToken(request->device_id(), request->role());
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

class GetTokenStatusReactor : public grpc::ServerUnaryReactor {
public:
    GetTokenStatusReactor(const LinkContext& context,
                          const link::TokenKey* request,
                          link::TokenStatus* response) {
        grpc::Status status = checkTokenKey(*request);
        if (status.ok()) {
            auto expires = context.tokens->getTokenExpiration(request->device_id(), request->role());
            response->set_valid(expires.has_value());
            response->set_expires_at_ms(expires.value_or(0));
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// GatewayLinkServiceImpl
// =============================================================================

GatewayLinkServiceImpl::GatewayLinkServiceImpl(LinkContext context)
    : context_(std::move(context))
{
    LOG_INFO("Service", "Created gateway link service");
}

grpc::ServerUnaryReactor* GatewayLinkServiceImpl::ListGateways(
    grpc::CallbackServerContext* context,
    const link::ListGatewaysRequest* request,
    link::DiscoveryState* response) {
    return new ListGatewaysReactor(context_, response);
}

grpc::ServerWriteReactor<link::DiscoveryState>* GatewayLinkServiceImpl::WatchGateways(
    grpc::CallbackServerContext* context,
    const link::WatchGatewaysRequest* request) {
    return new WatchGatewaysReactor(context_.aggregator);
}

grpc::ServerUnaryReactor* GatewayLinkServiceImpl::GetDeviceIdentity(
    grpc::CallbackServerContext* context,
    const link::GetDeviceIdentityRequest* request,
    link::DeviceIdentityInfo* response) {
    return new GetDeviceIdentityReactor(context_, response);
}

grpc::ServerUnaryReactor* GatewayLinkServiceImpl::SignPayload(
    grpc::CallbackServerContext* context,
    const link::SignPayloadRequest* request,
    link::SignPayloadResponse* response) {
    return new SignPayloadReactor(context_, request, response);
}

grpc::ServerUnaryReactor* GatewayLinkServiceImpl::VerifySignature(
    grpc::CallbackServerContext* context,
    const link::VerifySignatureRequest* request,
    link::VerifySignatureResponse* response) {
    return new VerifySignatureReactor(context_, request, response);
}

grpc::ServerUnaryReactor* GatewayLinkServiceImpl::SaveToken(
    grpc::CallbackServerContext* context,
    const link::SaveTokenRequest* request,
    link::SaveTokenResponse* response) {
    return new SaveTokenReactor(context_, request, response);
}

grpc::ServerUnaryReactor* GatewayLinkServiceImpl::LoadToken(
    grpc::CallbackServerContext* context,
    const link::TokenKey* request,
    link::LoadTokenResponse* response) {
    return new LoadTokenReactor(context_, request, response);
}

grpc::ServerUnaryReactor* GatewayLinkServiceImpl::ClearToken(
    grpc::CallbackServerContext* context,
    const link::TokenKey* request,
    link::ClearTokenResponse* response) {
    return new ClearTokenReactor(context_, request);
}

grpc::ServerUnaryReactor* GatewayLinkServiceImpl::GetTokenStatus(
    grpc::CallbackServerContext* context,
    const link::TokenKey* request,
    link::TokenStatus* response) {
    return new GetTokenStatusReactor(context_, request, response);
}

}  // namespace services
}  // namespace gatelink
