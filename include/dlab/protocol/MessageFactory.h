//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageFactory.h
// Purpose: Construction of well-formed requests, responses and events plus the event sequencer
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "dlab/protocol/Catalog.h"
#include "dlab/protocol/Messages.h"

namespace dlab {
namespace protocol {

// Fresh RFC 4122 version-4 UUID in canonical 36-character form.
std::string NewCorrelationId();

// Wall-clock milliseconds since the Unix epoch.
int64_t NowMillis();

//==========================================================================================================
// CreateRequest
// Purpose: Build a request for a catalog method with a fresh correlation id.
// Args:
//   method: Catalog method; names outside the catalog cannot be expressed.
//   params: Params value, normally produced by ToJSON on MethodTraits<M>::Params.
//==========================================================================================================
Request CreateRequest(Method method, JSONValue params);

template <Method M>
Request CreateRequest(const typename MethodTraits<M>::Params& params) {
    return CreateRequest(M, ToJSON(params));
}

Response CreateSuccessResponse(std::string id, JSONValue payload);
Response CreateFailureResponse(std::string id, std::string error);

template <Method M>
Response CreateResponse(std::string id, const typename MethodTraits<M>::Result& result) {
    return CreateSuccessResponse(std::move(id), ToJSON(result));
}

//==========================================================================================================
// CreateEvent
// Purpose: Build an event stamped with the current time.
// Args:
//   type: Catalog event kind.
//   payload: Event payload.
//   seq: Sequence number; when supplied it must come from EventSequencer::Next() at emission time.
//==========================================================================================================
Event CreateEvent(EventType type, JSONValue payload, std::optional<int64_t> seq = std::nullopt);

template <EventType E>
Event CreateEvent(const typename EventTraits<E>::Payload& payload, std::optional<int64_t> seq = std::nullopt) {
    return CreateEvent(E, ToJSON(payload), seq);
}

//==========================================================================================================
// EventSequencer
// Purpose: Rising event sequence counter owned by a host (gateway, test) rather than a process global.
// Methods:
//   Next(): Increments then returns; the first call after construction or Reset() returns 1.
//   Reset(): Back to zero. Intended for test isolation.
//   Current(): Last value handed out (0 when none).
//==========================================================================================================
class EventSequencer {
public:
    EventSequencer() = default;
    EventSequencer(const EventSequencer&) = delete;
    EventSequencer& operator=(const EventSequencer&) = delete;

    int64_t Next() noexcept { return counter.fetch_add(1, std::memory_order_relaxed) + 1; }
    void Reset() noexcept { counter.store(0, std::memory_order_relaxed); }
    int64_t Current() const noexcept { return counter.load(std::memory_order_relaxed); }

private:
    std::atomic<int64_t> counter{0};
};

} // namespace protocol
} // namespace dlab
