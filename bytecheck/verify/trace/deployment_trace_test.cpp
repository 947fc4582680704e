// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "deployment_trace.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <bytecheck/core/types/address.hpp>
#include <bytecheck/infra/test_util/log.hpp>

namespace bytecheck::verify {

using namespace evmc::literals;

static nlohmann::json make_frame(std::string type, std::string to, nlohmann::json calls = nlohmann::json::array()) {
    return {
        {"type", std::move(type)},
        {"from", "0x0000000000000000000000000000000000000001"},
        {"to", std::move(to)},
        {"input", "0x"},
        {"calls", std::move(calls)},
    };
}

TEST_CASE("DeploymentTrace::from_json", "[bytecheck][verify][trace]") {
    bytecheck::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    SECTION("single frame") {
        const auto trace{DeploymentTrace::from_json(make_frame("CALL", "0x00000000000000000000000000000000000000aa"))};
        REQUIRE(trace);
        REQUIRE(trace->size() == 1);
        CHECK(trace->root().type == CallType::kCall);
        CHECK(trace->root().to == 0x00000000000000000000000000000000000000aa_address);
        CHECK(!trace->root().parent);
    }

    SECTION("children keep recorded order and parent links") {
        const nlohmann::json json = make_frame("CALL", "0x00000000000000000000000000000000000000aa",
                                             {make_frame("CREATE", "0x00000000000000000000000000000000000000b1"),
                                              make_frame("CREATE2", "0x00000000000000000000000000000000000000b2")});
        const auto trace{DeploymentTrace::from_json(json)};
        REQUIRE(trace);
        REQUIRE(trace->size() == 3);
        const auto& children{trace->root().children};
        REQUIRE(children.size() == 2);
        CHECK(trace->frame(children[0]).to == 0x00000000000000000000000000000000000000b1_address);
        CHECK(trace->frame(children[1]).to == 0x00000000000000000000000000000000000000b2_address);
        CHECK(trace->frame(children[0]).parent == 0u);
        CHECK(trace->frame(children[1]).type == CallType::kCreate2);
    }

    SECTION("JSON-RPC envelope is unwrapped") {
        const nlohmann::json json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", make_frame("CREATE", "0x00000000000000000000000000000000000000aa")}};
        const auto trace{DeploymentTrace::from_json(json)};
        REQUIRE(trace);
        CHECK(trace->root().type == CallType::kCreate);
    }

    SECTION("missing calls and null to are accepted") {
        const nlohmann::json json{{"type", "SELFDESTRUCT"}, {"to", nullptr}};
        const auto trace{DeploymentTrace::from_json(json)};
        REQUIRE(trace);
        CHECK(trace->root().type == CallType::kSelfDestruct);
        CHECK(!trace->root().to);
        CHECK(trace->root().input.empty());
    }

    SECTION("lowercase type names") {
        const auto trace{DeploymentTrace::from_json(make_frame("create2", "0x00000000000000000000000000000000000000aa"))};
        REQUIRE(trace);
        CHECK(trace->root().type == CallType::kCreate2);
        CHECK(trace->root().type_name == "create2");
    }

    SECTION("reverted frame keeps its error") {
        auto json = make_frame("CREATE", "0x00000000000000000000000000000000000000aa");
        json["error"] = "execution reverted";
        const auto trace{DeploymentTrace::from_json(json)};
        REQUIRE(trace);
        CHECK(trace->root().error == "execution reverted");
    }

    SECTION("deep nesting is built without recursion") {
        nlohmann::json json = make_frame("CREATE", "0x00000000000000000000000000000000000000aa");
        for (int i{0}; i < 5'000; ++i) {
            json = make_frame("CALL", "0x00000000000000000000000000000000000000bb", {std::move(json)});
        }
        const auto trace{DeploymentTrace::from_json(json)};
        REQUIRE(trace);
        CHECK(trace->size() == 5'001);
        CHECK(trace->frames().back().type == CallType::kCreate);
    }
}

TEST_CASE("DeploymentTrace::from_json malformed", "[bytecheck][verify][trace]") {
    bytecheck::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    SECTION("missing type") {
        const nlohmann::json json{{"to", "0x00000000000000000000000000000000000000aa"}};
        CHECK(DeploymentTrace::from_json(json).error() == VerificationError::kMalformedTrace);
    }
    SECTION("non-hex input") {
        auto json = make_frame("CREATE", "0x00000000000000000000000000000000000000aa");
        json["input"] = "0xzz";
        CHECK(DeploymentTrace::from_json(json).error() == VerificationError::kMalformedTrace);
    }
    SECTION("invalid to address") {
        const auto json = make_frame("CREATE", "0x1234");
        CHECK(DeploymentTrace::from_json(json).error() == VerificationError::kMalformedTrace);
    }
    SECTION("calls is not an array") {
        auto json = make_frame("CALL", "0x00000000000000000000000000000000000000aa");
        json["calls"] = "oops";
        CHECK(DeploymentTrace::from_json(json).error() == VerificationError::kMalformedTrace);
    }
    SECTION("malformed nested frame") {
        const auto json = make_frame("CALL", "0x00000000000000000000000000000000000000aa", {nlohmann::json::array({1, 2})});
        CHECK(DeploymentTrace::from_json(json).error() == VerificationError::kMalformedTrace);
    }
    SECTION("not an object") {
        CHECK(DeploymentTrace::from_json(nlohmann::json::array()).error() == VerificationError::kMalformedTrace);
    }
}

TEST_CASE("for_each_pre_order", "[bytecheck][verify][trace]") {
    // root(a0) -> [a1 -> [a2, a3], a4 -> [a5]]
    const nlohmann::json json = make_frame(
        "CALL", "0x00000000000000000000000000000000000000a0",
        {make_frame("CALL", "0x00000000000000000000000000000000000000a1",
                    {make_frame("CREATE", "0x00000000000000000000000000000000000000a2"),
                     make_frame("CREATE", "0x00000000000000000000000000000000000000a3")}),
         make_frame("CREATE2", "0x00000000000000000000000000000000000000a4",
                    {make_frame("CREATE", "0x00000000000000000000000000000000000000a5")})});
    const auto trace{DeploymentTrace::from_json(json)};
    REQUIRE(trace);

    SECTION("visits parent before children, children in recorded order") {
        std::vector<uint8_t> visited;
        for_each_pre_order(*trace, [&](size_t, const CallFrame& frame) {
            visited.push_back(frame.to->bytes[19]);
            return true;
        });
        CHECK(visited == std::vector<uint8_t>{0xa0, 0xa1, 0xa2, 0xa3, 0xa4, 0xa5});
    }

    SECTION("visitor can stop the walk") {
        size_t count{0};
        for_each_pre_order(*trace, [&](size_t, const CallFrame& frame) {
            ++count;
            return frame.to != 0x00000000000000000000000000000000000000a2_address;
        });
        CHECK(count == 3);
    }
}

}  // namespace bytecheck::verify
