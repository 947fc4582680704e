// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <gmock/gmock.h>

#include <bytecheck/verify/chain/rpc_provider.hpp>

namespace bytecheck::verify::test_util {

//! \brief gMock mock class for RpcProvider
class MockRpcProvider : public RpcProvider {
  public:
    ~MockRpcProvider() override = default;

    MOCK_METHOD((Bytes), code_at, (const evmc::address&), (override));
    MOCK_METHOD((std::optional<Transaction>), transaction, (const evmc::bytes32&), (override));
    MOCK_METHOD((std::optional<TransactionReceipt>), receipt, (const evmc::bytes32&), (override));
    MOCK_METHOD((nlohmann::json), debug_trace, (const evmc::bytes32&), (override));
};

}  // namespace bytecheck::verify::test_util
