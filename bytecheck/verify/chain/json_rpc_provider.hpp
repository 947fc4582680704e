// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <bytecheck/verify/chain/rpc_provider.hpp>

namespace bytecheck::verify {

//! Error object returned by the node, or a response not complying with JSON-RPC 2.0
class RpcError : public std::runtime_error {
  public:
    RpcError(int64_t code, const std::string& message);

    int64_t code() const noexcept { return code_; }

  private:
    int64_t code_;
};

//! Plain HTTP endpoint: http://host[:port][/path]
struct RpcEndpoint {
    std::string host;
    std::string port{"80"};
    std::string target{"/"};
};

std::optional<RpcEndpoint> parse_rpc_endpoint(std::string_view url);

nlohmann::json make_json_request(uint32_t id, std::string_view method, nlohmann::json params);

//! \brief Extracts the result from a JSON-RPC response body
//! \throws RpcError for error objects, malformed bodies or mismatching identifiers
nlohmann::json parse_json_response(std::string_view body, uint32_t id);

//! JSON-RPC 2.0 client over HTTP/1.1 based on Boost.Beast, one synchronous connection per call
class JsonRpcProvider : public RpcProvider {
  public:
    explicit JsonRpcProvider(RpcEndpoint endpoint, std::chrono::milliseconds timeout = std::chrono::seconds{60});
    ~JsonRpcProvider() override = default;

    Bytes code_at(const evmc::address& address) override;
    std::optional<Transaction> transaction(const evmc::bytes32& tx_hash) override;
    std::optional<TransactionReceipt> receipt(const evmc::bytes32& tx_hash) override;
    nlohmann::json debug_trace(const evmc::bytes32& tx_hash) override;

    nlohmann::json call(std::string_view method, nlohmann::json params);

  protected:
    //! \brief Sends the request body and returns the response body
    //! \throws boost::system::system_error on transport failures, RpcError on HTTP error status
    virtual std::string post(const std::string& body);

  private:
    RpcEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
    uint32_t next_id_{1};
};

}  // namespace bytecheck::verify
