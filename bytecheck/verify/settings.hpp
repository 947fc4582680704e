// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <bytecheck/infra/common/log.hpp>
#include <bytecheck/verify/build/build_orchestrator.hpp>

namespace bytecheck::verify {

inline constexpr const char* kDefaultRpcUrl{"http://127.0.0.1:8545"};

struct VerifierSettings {
    log::Settings log_settings;
    std::string rpc_url{kDefaultRpcUrl};
    uint32_t rpc_timeout_ms{60'000};
    BuildSettings build_settings;
};

}  // namespace bytecheck::verify
