// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <bytecheck/verify/common/enum_names.hpp>

namespace bytecheck::verify {

std::string_view to_string(VerificationError err) {
    return enum_label(err);
}

std::string_view to_string(Stage stage) {
    return enum_label(stage);
}

static std::string make_message(VerificationError err, Stage stage, const std::string& message) {
    std::string what{to_string(stage)};
    what.append(" stage failed: ");
    what.append(to_string(err));
    if (!message.empty()) {
        what.append(" (").append(message).append(")");
    }
    return what;
}

VerificationException::VerificationException(VerificationError err, Stage stage, const std::string& message)
    : std::runtime_error{make_message(err, stage, message)}, err_{err}, stage_{stage} {}

RequestValidationError::RequestValidationError(std::string field, const std::string& message, VerificationError err)
    : VerificationException{err, Stage::kRequest, "invalid " + field + (message.empty() ? "" : ": " + message)},
      field_{std::move(field)} {}

}  // namespace bytecheck::verify
