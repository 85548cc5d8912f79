//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validator.h
// Purpose: Structural validation of values against shapes, with path-qualified error reporting
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "dlab/JSONValue.h"
#include "dlab/validation/Shape.h"

namespace dlab {
namespace validation {

// Path used for the value passed to Validate; children append ".<key>" or ".<index>".
inline constexpr const char* kRootPath = "root";

struct ValidationError {
    std::string path;
    std::string message;
    std::optional<std::string> expected;
    std::optional<std::string> received;
};

struct ValidationResult {
    bool valid{true};
    std::vector<ValidationError> errors;
};

//==========================================================================================================
// Validate
// Purpose: Walk value against shape and collect every violation.
// Notes:
//   Object nodes report missing required keys first, then recurse into declared properties in declaration
//   order, then report unexpected keys when additionalProperties is false. Never throws on the value.
//==========================================================================================================
std::vector<ValidationError> Validate(const JSONValue& value, const Shape& shape,
                                      const std::string& path = kRootPath);

ValidationResult ValidateValue(const JSONValue& value, const Shape& shape);

// Envelope shapes for the three wire variants.
const Shape& RequestEnvelopeShape();
const Shape& ResponseEnvelopeShape();
const Shape& EventEnvelopeShape();

ValidationResult ValidateRequest(const JSONValue& message);
ValidationResult ValidateResponse(const JSONValue& message);
ValidationResult ValidateEvent(const JSONValue& message);

//==========================================================================================================
// ValidateMethodParams
// Purpose: Check params against the catalog's parameter shape for method.
// Args:
//   method: Method name as received on the wire.
//   params: Params value; absent or null is treated as {}.
// Returns:
//   Single error { path:"method", message:"Unknown method: <method>" } when the method is not in the
//   catalog, otherwise the result of validating params.
//==========================================================================================================
ValidationResult ValidateMethodParams(const std::string& method, const std::optional<JSONValue>& params);

// Same contract as ValidateMethodParams for event payloads; unknown events yield one error at path "event".
ValidationResult ValidateEventPayload(const std::string& event, const JSONValue& payload);

// One line per error: "path: message (expected: X) (received: Y)", parts omitted when absent.
std::string FormatValidationErrors(const std::vector<ValidationError>& errors);

// Array of { path, message, expected?, received? } objects.
JSONValue ToJSON(const std::vector<ValidationError>& errors);

} // namespace validation
} // namespace dlab
