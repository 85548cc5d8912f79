//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.h
// Purpose: Typed request/response/event dispatcher for the client-facing gateway protocol
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "dlab/Transport.h"
#include "dlab/protocol/Catalog.h"
#include "dlab/protocol/MessageFactory.h"
#include "dlab/protocol/Messages.h"

namespace dlab {

//==========================================================================================================
// Gateway
// Purpose: Answers catalog requests and emits sequenced push events.
// Notes:
//   Handlers are registered before serving (Seal()); afterwards HandleMessage may run on several threads.
//   Every Emit draws its seq and reaches the sink under one lock, so sink order equals seq order.
//==========================================================================================================
class Gateway : public IMessageHandler {
public:
    // Receives validated params ({} when absent) and returns the payload; exceptions become failures.
    using MethodHandler = std::function<JSONValue(const JSONValue& params)>;
    // Receives each serialized event line.
    using EventSink = std::function<void(const std::string& line)>;

    explicit Gateway(protocol::EventSequencer& sequencer);
    ~Gateway() override;

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    //==========================================================================================================
    // Registers or replaces the handler of a catalog method (ping is built in).
    // Throws:
    //   std::invalid_argument for an empty handler; std::logic_error after Seal().
    //==========================================================================================================
    void RegisterMethod(protocol::Method method, MethodHandler handler);

    // Typed form: params are decoded into MethodTraits<M>::Params and the result encoded with ToJSON.
    template <protocol::Method M>
    void RegisterTypedMethod(
        std::function<typename protocol::MethodTraits<M>::Result(const typename protocol::MethodTraits<M>::Params&)> fn) {
        if (!fn) {
            throw std::invalid_argument(std::string("Gateway: empty handler for ") + protocol::toString(M));
        }
        RegisterMethod(M, [fn = std::move(fn)](const JSONValue& params) -> JSONValue {
            typename protocol::MethodTraits<M>::Params typed{};
            if (!protocol::FromJSON(params, typed)) {
                throw std::invalid_argument(std::string("Cannot decode params for ") + protocol::toString(M));
            }
            return protocol::ToJSON(fn(typed));
        });
    }

    void Seal();
    bool IsImplemented(protocol::Method method) const;

    // Destination of Emit. Replaces any previous sink.
    void SetEventSink(EventSink sink);

    //==========================================================================================================
    // Dispatches a decoded value.
    // Returns:
    //   A response for requests (and for unrecognized input carrying a string id); std::nullopt for
    //   responses and events from the peer and for anything uncorrelatable.
    //==========================================================================================================
    std::optional<protocol::Response> HandleMessage(const JSONValue& value);

    // Parses then dispatches. Unparsable input is answered with an unsequenced "error" event.
    std::optional<std::string> HandleLine(const std::string& line) override;
    std::optional<std::string> HandleFramingError(const std::string& reason) override;

    //==========================================================================================================
    // Emits an event with the next sequence number and the current timestamp.
    // Returns:
    //   The event as sent.
    //==========================================================================================================
    protocol::Event Emit(protocol::EventType type, JSONValue payload);

    template <protocol::EventType E>
    protocol::Event Emit(const typename protocol::EventTraits<E>::Payload& payload) {
        return Emit(E, protocol::ToJSON(payload));
    }

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dlab
