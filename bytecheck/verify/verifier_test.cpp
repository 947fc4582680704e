// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "verifier.hpp"

#include <algorithm>
#include <memory>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <bytecheck/core/types/address.hpp>
#include <bytecheck/infra/test_util/log.hpp>
#include <bytecheck/infra/test_util/temporary_file.hpp>
#include <bytecheck/verify/build/compiler_invoker.hpp>
#include <bytecheck/verify/chain/json_rpc_provider.hpp>
#include <bytecheck/verify/test_util/mock_compiler_invoker.hpp>
#include <bytecheck/verify/test_util/mock_rpc_provider.hpp>
#include <bytecheck/verify/test_util/sample_artifacts.hpp>

namespace bytecheck::verify {

using namespace evmc::literals;
using testing::_;
using testing::Return;
using testing::Throw;
using test_util::hex_bytes;

static constexpr auto kProxyAddress{0x43506849d7c04f9138d1a2050bbf3a0c054402dd_address};
static constexpr auto kOtherAddress{0xa2327a938febf5fec13bacfb16ae10ecbc4cbdcf_address};
static constexpr auto kLibraryAddress{0x7d0c8a4b9fd1ad4f9f4f5e6a5e5d2a1e3c6b8f20_address};
static constexpr auto kFactoryAddress{0x4e59b44847b379578588920ca78fbf26c0b4956c_address};
static constexpr auto kCreationTxHash{0xe7e0fe390354509cd08c9a0168536938600ddc552b3f7cb96030ebef62e75895_bytes32};

//! ABI-encoded constructor argument (an address)
static constexpr std::string_view kConstructorArgument{
    "0000000000000000000000000bcd82c7b6a0b4d5a6ab8c0d9b2c6d31d3bc1c4e"};

static Bytes with_constructor_argument(Bytes creation_code) {
    creation_code.append(hex_bytes(kConstructorArgument));
    return creation_code;
}

static Transaction make_creation_transaction(const Bytes& input) {
    Transaction transaction;
    transaction.hash = kCreationTxHash;
    transaction.input = input;
    return transaction;
}

static TransactionReceipt make_creation_receipt(const evmc::address& created) {
    TransactionReceipt receipt;
    receipt.tx_hash = kCreationTxHash;
    receipt.contract_address = created;
    receipt.success = true;
    return receipt;
}

struct VerifierTest {
    VerifierTest() {
        test_util::write_json_file(artifact_path("FiatTokenProxy"), test_util::make_foundry_artifact(proxy));
        request.contract_name = "FiatTokenProxy";
        request.contract_address = kProxyAddress;
    }

    std::filesystem::path artifact_path(const std::string& contract_name) const {
        return project_dir.path() / "out" / (contract_name + ".sol") / (contract_name + ".json");
    }

    BuildSettings settings() const {
        BuildSettings build_settings;
        build_settings.project_dir = project_dir.path();
        return build_settings;
    }

    bytecheck::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    bytecheck::test_util::TemporaryDirectory project_dir;
    test_util::SampleContract proxy{test_util::make_sample_contract()};
    std::shared_ptr<test_util::MockCompilerInvoker> invoker{std::make_shared<test_util::MockCompilerInvoker>()};
    BuildOrchestrator orchestrator{settings(), invoker};
    test_util::MockRpcProvider provider;
    Verifier verifier{orchestrator, provider};
    VerificationRequest request;
};

TEST_CASE_METHOD(VerifierTest, "Verifier: deployment matching the project", "[bytecheck][verify]") {
    bytecheck::test_util::TemporaryFile metadata_file;
    metadata_file.write(proxy.raw_metadata);
    request.creation_tx_hash = kCreationTxHash;
    request.metadata_file = metadata_file.path();

    EXPECT_CALL(*invoker, run(_)).Times(0);
    EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Return(proxy.runtime_code));
    EXPECT_CALL(provider, transaction(kCreationTxHash))
        .WillOnce(Return(make_creation_transaction(with_constructor_argument(proxy.creation_code))));
    EXPECT_CALL(provider, receipt(kCreationTxHash)).WillRepeatedly(Return(make_creation_receipt(kProxyAddress)));

    CHECK(verifier.verify(request) ==
          ComparisonResults{ConstructorCodeCheck{true}, RuntimeBytecodePartialCheck{true}, MetadataHashCheck{true}});
    CHECK(testing::Mock::VerifyAndClearExpectations(&provider));
}

TEST_CASE_METHOD(VerifierTest, "Verifier: wrong contract address", "[bytecheck][verify]") {
    Bytes other_runtime{hex_bytes("6080604052348015600f57600080fd5b50")};
    other_runtime.append(test_util::make_metadata_trailer(test_util::kOtherRawMetadata));
    request.contract_address = kOtherAddress;

    EXPECT_CALL(provider, code_at(kOtherAddress)).WillOnce(Return(other_runtime));
    CHECK(verifier.verify(request) == ComparisonResults{RuntimeBytecodePartialCheck{false}});
}

TEST_CASE_METHOD(VerifierTest, "Verifier: wrong creation transaction", "[bytecheck][verify]") {
    Bytes other_creation{hex_bytes("608060405234801561001057600080fd5b5060f78061001f6000396000f3fe")};
    other_creation.append(hex_bytes("6080604052348015600f57600080fd5b50"));
    request.creation_tx_hash = kCreationTxHash;

    EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Return(proxy.runtime_code));
    EXPECT_CALL(provider, transaction(kCreationTxHash)).WillOnce(Return(make_creation_transaction(other_creation)));
    EXPECT_CALL(provider, receipt(kCreationTxHash)).WillRepeatedly(Return(make_creation_receipt(kOtherAddress)));

    CHECK(verifier.verify(request) == ComparisonResults{ConstructorCodeCheck{false}, RuntimeBytecodePartialCheck{true}});
}

TEST_CASE_METHOD(VerifierTest, "Verifier: alternative artifact deployed by a factory", "[bytecheck][verify]") {
    const auto alternative{test_util::make_sample_contract(test_util::kOtherRawMetadata)};
    test_util::write_json_file(project_dir.path() / "alternative-artifacts" / "op-mainnet" / "FiatTokenProxy.json",
                               test_util::make_foundry_artifact(alternative));
    request.verification_type = VerificationType::kFull;
    request.artifact_type = ArtifactType::kOpMainnet;
    request.creation_tx_hash = kCreationTxHash;

    Transaction factory_call{make_creation_transaction(hex_bytes("4af63f02"))};
    factory_call.to = kFactoryAddress;
    const nlohmann::json trace = {
        {"type", "CALL"},
        {"from", "0x0000000000000000000000000000000000000001"},
        {"to", address_to_hex(kFactoryAddress)},
        {"input", "0x4af63f02"},
        {"calls", nlohmann::json::array({nlohmann::json{
                      {"type", "CREATE2"},
                      {"from", address_to_hex(kFactoryAddress)},
                      {"to", address_to_hex(kProxyAddress)},
                      {"input", to_hex(with_constructor_argument(alternative.creation_code), true)},
                  }})},
    };

    EXPECT_CALL(*invoker, run(_)).Times(0);
    EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Return(alternative.runtime_code));
    EXPECT_CALL(provider, transaction(kCreationTxHash)).WillOnce(Return(factory_call));
    EXPECT_CALL(provider, debug_trace(kCreationTxHash)).WillOnce(Return(trace));

    CHECK(verifier.verify(request) == ComparisonResults{ConstructorCodeCheck{true}, RuntimeBytecodeFullCheck{true}});
    CHECK(testing::Mock::VerifyAndClearExpectations(invoker.get()));
}

TEST_CASE_METHOD(VerifierTest, "Verifier: invalid optimizer runs", "[bytecheck][verify]") {
    EXPECT_CALL(*invoker, run(_)).Times(0);
    EXPECT_CALL(provider, code_at(_)).Times(0);

    SECTION("zero") {
        request.optimizer_runs = 0;
        CHECK_THROWS_AS(verifier.verify(request), RequestValidationError);
    }

    SECTION("with alternative artifact") {
        request.optimizer_runs = 200;
        request.artifact_type = ArtifactType::kOpMainnet;
        CHECK_THROWS_AS(verifier.verify(request), RequestValidationError);
    }

    CHECK(testing::Mock::VerifyAndClearExpectations(invoker.get()));
    CHECK(testing::Mock::VerifyAndClearExpectations(&provider));
}

TEST_CASE_METHOD(VerifierTest, "Verifier: rebuild with optimizer runs", "[bytecheck][verify]") {
    request.optimizer_runs = 1000000;

    SECTION("build succeeds") {
        EXPECT_CALL(*invoker, run("forge build --optimizer-runs 1000000")).Times(1);
        EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Return(proxy.runtime_code));
        CHECK(verifier.verify(request) == ComparisonResults{RuntimeBytecodePartialCheck{true}});
    }

    SECTION("build fails") {
        EXPECT_CALL(*invoker, run(_)).WillOnce(Throw(CompilerInvocationError{"forge build --optimizer-runs 1000000", 1, "exit code 1"}));
        EXPECT_CALL(provider, code_at(_)).Times(0);
        CHECK_THROWS_AS(verifier.verify(request), CompilerInvocationError);
    }
}

TEST_CASE_METHOD(VerifierTest, "Verifier: mismatching metadata document", "[bytecheck][verify]") {
    bytecheck::test_util::TemporaryFile metadata_file;
    metadata_file.write(test_util::kOtherRawMetadata);
    request.metadata_file = metadata_file.path();

    EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Return(proxy.runtime_code));
    CHECK(verifier.verify(request) == ComparisonResults{RuntimeBytecodePartialCheck{true}, MetadataHashCheck{false}});
}

TEST_CASE_METHOD(VerifierTest, "Verifier: runtime bytecode file", "[bytecheck][verify]") {
    bytecheck::test_util::TemporaryFile bytecode_file;
    bytecode_file.write(to_hex(proxy.runtime_code, true) + "\n");
    request.onchain_bytecode_file = bytecode_file.path();

    EXPECT_CALL(provider, code_at(_)).Times(0);
    CHECK(verifier.verify(request) == ComparisonResults{RuntimeBytecodePartialCheck{true}});
    CHECK(testing::Mock::VerifyAndClearExpectations(&provider));
}

TEST_CASE_METHOD(VerifierTest, "Verifier: library", "[bytecheck][verify]") {
    const Bytes trailer{test_util::make_metadata_trailer(test_util::kSampleRawMetadata)};
    const std::string runtime_hex{"7300000000000000000000000000000000000000003014608060405260043610" + to_hex(trailer)};
    const std::string creation_hex{"60566050600b82828239805160001a6073146043577f" + runtime_hex};
    test_util::write_json_file(artifact_path("SignatureChecker"),
                               {{"bytecode", {{"object", "0x" + creation_hex}, {"linkReferences", nlohmann::json::object()}}},
                                {"deployedBytecode",
                                 {{"object", "0x" + runtime_hex},
                                  {"linkReferences", nlohmann::json::object()},
                                  {"immutableReferences", nlohmann::json::object()}}},
                                {"rawMetadata", std::string{test_util::kSampleRawMetadata}}});
    Bytes deployed{hex_bytes(runtime_hex)};
    std::copy_n(kLibraryAddress.bytes, kAddressLength, deployed.begin() + 1);

    bytecheck::test_util::TemporaryFile metadata_file;
    metadata_file.write(test_util::kSampleRawMetadata);
    request.contract_name = "SignatureChecker";
    request.contract_address = kLibraryAddress;
    request.is_library = true;
    request.creation_tx_hash = kCreationTxHash;
    request.metadata_file = metadata_file.path();

    EXPECT_CALL(provider, code_at(kLibraryAddress)).WillOnce(Return(deployed));
    EXPECT_CALL(provider, transaction(kCreationTxHash)).WillOnce(Return(make_creation_transaction(hex_bytes(creation_hex))));
    EXPECT_CALL(provider, receipt(kCreationTxHash)).WillRepeatedly(Return(make_creation_receipt(kLibraryAddress)));

    CHECK(verifier.verify(request) ==
          ComparisonResults{ConstructorCodeCheck{true}, RuntimeBytecodePartialCheck{true}, MetadataHashCheck{true}});
}

TEST_CASE_METHOD(VerifierTest, "Verifier: contract linked to a library", "[bytecheck][verify]") {
    const std::string library{"contracts/util/SignatureChecker.sol:SignatureChecker"};
    const Bytes trailer{test_util::make_metadata_trailer(test_util::kSampleRawMetadata)};
    const std::string runtime_hex{"6080604073" + library_placeholder(library) + "6004361061" + to_hex(trailer)};
    nlohmann::json link_references;
    link_references["contracts/util/SignatureChecker.sol"]["SignatureChecker"] =
        nlohmann::json::array({{{"start", 5}, {"length", 20}}});
    test_util::write_json_file(artifact_path("FiatTokenV2_2"),
                               {{"bytecode", {{"object", "0x608060405234801561001057600080fd5b50" + runtime_hex}, {"linkReferences", nlohmann::json::object()}}},
                                {"deployedBytecode",
                                 {{"object", "0x" + runtime_hex},
                                  {"linkReferences", link_references},
                                  {"immutableReferences", nlohmann::json::object()}}},
                                {"rawMetadata", std::string{test_util::kSampleRawMetadata}}});
    const auto compiled{decode_unlinked_hex(runtime_hex)};
    REQUIRE(compiled);
    Bytes deployed{compiled->code};
    std::copy_n(kLibraryAddress.bytes, kAddressLength, deployed.begin() + 5);

    request.contract_name = "FiatTokenV2_2";
    request.library_name = "SignatureChecker";
    request.library_address = kLibraryAddress;
    EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Return(deployed));

    CHECK(verifier.verify(request) == ComparisonResults{RuntimeBytecodePartialCheck{true}});
}

TEST_CASE_METHOD(VerifierTest, "Verifier: processing errors", "[bytecheck][verify]") {
    SECTION("nothing deployed") {
        EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Return(Bytes{}));
        CHECK_THROWS_AS(verifier.verify(request), VerificationException);
    }

    SECTION("provider failure") {
        EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Throw(RpcError{-32000, "header not found"}));
        CHECK_THROWS_AS(verifier.verify(request), RpcError);
    }

    SECTION("unknown contract") {
        request.contract_name = "FiatTokenV1";
        EXPECT_CALL(provider, code_at(_)).Times(0);
        CHECK_THROWS_AS(verifier.verify(request), VerificationException);
    }

    SECTION("unreadable metadata document") {
        request.metadata_file = project_dir.path() / "missing.json";
        EXPECT_CALL(provider, code_at(kProxyAddress)).WillOnce(Return(proxy.runtime_code));
        CHECK_THROWS_AS(verifier.verify(request), VerificationException);
    }
}

}  // namespace bytecheck::verify
