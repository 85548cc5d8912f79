//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageFactory.cpp
// Purpose: Message construction helpers
//==========================================================================================================

#include "dlab/protocol/MessageFactory.h"

#include <chrono>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"

namespace dlab {
namespace protocol {

std::string NewCorrelationId() {
    // random_generator is not thread-safe; one per thread.
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

int64_t NowMillis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

Request CreateRequest(Method method, JSONValue params) {
    FUNC_SCOPE();
    Request r;
    r.id = NewCorrelationId();
    r.method = toString(method);
    r.params = std::move(params);
    return r;
}

Response CreateSuccessResponse(std::string id, JSONValue payload) {
    return Response::Success(std::move(id), std::move(payload));
}

Response CreateFailureResponse(std::string id, std::string error) {
    return Response::Failure(std::move(id), std::move(error));
}

Event CreateEvent(EventType type, JSONValue payload, std::optional<int64_t> seq) {
    Event e;
    e.event = toString(type);
    e.payload = std::move(payload);
    e.seq = seq;
    e.timestamp = NowMillis();
    return e;
}

} // namespace protocol
} // namespace dlab
