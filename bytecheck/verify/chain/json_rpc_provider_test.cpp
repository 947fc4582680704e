// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc_provider.hpp"

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <bytecheck/infra/test_util/log.hpp>
#include <bytecheck/verify/test_util/sample_bytecode.hpp>

namespace bytecheck::verify {

using namespace evmc::literals;

static constexpr auto kTxHash{0x7f6268ff5bd05d1b61c19889a46eb9a38563accce441dcfcf0c7515b1733503e_bytes32};

//! Provider answering from canned response bodies and recording the requests
class CannedJsonRpcProvider : public JsonRpcProvider {
  public:
    CannedJsonRpcProvider() : JsonRpcProvider{RpcEndpoint{"localhost", "8545", "/"}} {}

    void add_result(nlohmann::json result) {
        results_.push_back(std::move(result));
    }

    const std::vector<nlohmann::json>& requests() const { return requests_; }

  protected:
    std::string post(const std::string& body) override {
        requests_.push_back(nlohmann::json::parse(body));
        nlohmann::json response{{"jsonrpc", "2.0"}, {"id", requests_.back()["id"]}, {"result", results_.front()}};
        results_.pop_front();
        return response.dump();
    }

  private:
    std::deque<nlohmann::json> results_;
    std::vector<nlohmann::json> requests_;
};

TEST_CASE("parse_rpc_endpoint", "[bytecheck][verify][chain]") {
    SECTION("host only") {
        const auto endpoint{parse_rpc_endpoint("http://localhost")};
        REQUIRE(endpoint);
        CHECK(endpoint->host == "localhost");
        CHECK(endpoint->port == "80");
        CHECK(endpoint->target == "/");
    }
    SECTION("host, port and path") {
        const auto endpoint{parse_rpc_endpoint("http://127.0.0.1:8545/rpc/v1")};
        REQUIRE(endpoint);
        CHECK(endpoint->host == "127.0.0.1");
        CHECK(endpoint->port == "8545");
        CHECK(endpoint->target == "/rpc/v1");
    }
    SECTION("invalid") {
        CHECK(!parse_rpc_endpoint("https://mainnet.example.org"));
        CHECK(!parse_rpc_endpoint("localhost:8545"));
        CHECK(!parse_rpc_endpoint("http://:8545"));
        CHECK(!parse_rpc_endpoint("http://localhost:port"));
        CHECK(!parse_rpc_endpoint("http://localhost:"));
    }
}

TEST_CASE("parse_json_response", "[bytecheck][verify][chain]") {
    SECTION("result") {
        CHECK(parse_json_response(R"({"jsonrpc":"2.0","id":7,"result":"0x6080"})", 7) == "0x6080");
        CHECK(parse_json_response(R"({"jsonrpc":"2.0","id":7,"result":null})", 7).is_null());
    }
    SECTION("error object") {
        try {
            parse_json_response(R"({"jsonrpc":"2.0","id":7,"error":{"code":-32601,"message":"the method debug_traceTransaction does not exist"}})", 7);
            FAIL("expected RpcError");
        } catch (const RpcError& e) {
            CHECK(e.code() == -32601);
            CHECK(std::string{e.what()}.find("debug_traceTransaction") != std::string::npos);
        }
    }
    SECTION("malformed") {
        CHECK_THROWS_AS(parse_json_response("<html>bad gateway</html>", 7), RpcError);
        CHECK_THROWS_AS(parse_json_response(R"({"jsonrpc":"2.0","id":8,"result":"0x"})", 7), RpcError);
        CHECK_THROWS_AS(parse_json_response(R"({"jsonrpc":"2.0","id":7})", 7), RpcError);
    }
}

TEST_CASE("JsonRpcProvider requests", "[bytecheck][verify][chain]") {
    bytecheck::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    CannedJsonRpcProvider provider;

    SECTION("eth_getCode") {
        provider.add_result("0x6080604052");
        CHECK(provider.code_at(0x43506849d7c04f9138d1a2050bbf3a0c054402dd_address) == test_util::hex_bytes("6080604052"));
        const auto& request{provider.requests().at(0)};
        CHECK(request["jsonrpc"] == "2.0");
        CHECK(request["method"] == "eth_getCode");
        CHECK(request["params"] == nlohmann::json::parse(R"(["0x43506849d7c04f9138d1a2050bbf3a0c054402dd", "latest"])"));
    }

    SECTION("eth_getCode without code") {
        provider.add_result("0x");
        CHECK(provider.code_at(0x43506849d7c04f9138d1a2050bbf3a0c054402dd_address).empty());
    }

    SECTION("eth_getCode invalid result") {
        provider.add_result(42);
        CHECK_THROWS_AS(provider.code_at(0x43506849d7c04f9138d1a2050bbf3a0c054402dd_address), RpcError);
    }

    SECTION("eth_getTransactionByHash") {
        provider.add_result({{"hash", "0x7f6268ff5bd05d1b61c19889a46eb9a38563accce441dcfcf0c7515b1733503e"},
                             {"from", "0x000000000000000000000000000000000000000f"},
                             {"to", nullptr},
                             {"input", "0x60806040"}});
        const auto transaction{provider.transaction(kTxHash)};
        REQUIRE(transaction);
        CHECK(!transaction->to);
        CHECK(transaction->input == test_util::hex_bytes("60806040"));
        CHECK(provider.requests().at(0)["params"][0] == "0x7f6268ff5bd05d1b61c19889a46eb9a38563accce441dcfcf0c7515b1733503e");
    }

    SECTION("unknown transaction") {
        provider.add_result(nullptr);
        CHECK(!provider.transaction(kTxHash));
    }

    SECTION("malformed transaction") {
        provider.add_result({{"hash", "0x1234"}});
        CHECK_THROWS_AS(provider.transaction(kTxHash), RpcError);
    }

    SECTION("eth_getTransactionReceipt") {
        provider.add_result({{"transactionHash", "0x7f6268ff5bd05d1b61c19889a46eb9a38563accce441dcfcf0c7515b1733503e"},
                             {"contractAddress", "0x4b2194b42ef7f4a41ba4ca3df6d1e140dc9972b2"},
                             {"status", "0x1"}});
        const auto receipt{provider.receipt(kTxHash)};
        REQUIRE(receipt);
        CHECK(receipt->contract_address == 0x4b2194b42ef7f4a41ba4ca3df6d1e140dc9972b2_address);
        CHECK(receipt->success);
    }

    SECTION("debug_traceTransaction with callTracer") {
        provider.add_result({{"type", "CALL"}, {"calls", nlohmann::json::array()}});
        CHECK(provider.debug_trace(kTxHash)["type"] == "CALL");
        const auto& params{provider.requests().at(0)["params"]};
        CHECK(provider.requests().at(0)["method"] == "debug_traceTransaction");
        CHECK(params[1] == nlohmann::json{{"tracer", "callTracer"}});
    }

    SECTION("request identifiers increase") {
        provider.add_result("0x01");
        provider.add_result("0x02");
        provider.code_at(0x43506849d7c04f9138d1a2050bbf3a0c054402dd_address);
        provider.code_at(0x43506849d7c04f9138d1a2050bbf3a0c054402dd_address);
        CHECK(provider.requests().at(0)["id"] != provider.requests().at(1)["id"]);
    }
}

}  // namespace bytecheck::verify
