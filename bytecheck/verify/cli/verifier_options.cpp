// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "verifier_options.hpp"

#include <fstream>
#include <map>

#include <absl/strings/str_cat.h>

#include <bytecheck/infra/common/environment.hpp>
#include <bytecheck/verify/build/optimizer_runs.hpp>
#include <bytecheck/verify/chain/json_rpc_provider.hpp>
#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::cmd::common {

RpcUrlValidator::RpcUrlValidator() {
    description("http://host[:port][/path]");
    func_ = [](const std::string& value) -> std::string {
        if (!verify::parse_rpc_endpoint(value)) {
            return "Value " + value + " is not a valid HTTP endpoint";
        }
        return {};
    };
}

void add_verifier_options(CLI::App& cli, verify::VerifierSettings& settings) {
    settings.rpc_url = Environment::get_rpc_url().value_or(verify::kDefaultRpcUrl);
    if (const auto build_tool{Environment::get_build_tool()}) {
        settings.build_settings.build_tool = *build_tool;
    }

    auto& rpc_opts = *cli.add_option_group("RPC", "JSON-RPC provider options");
    rpc_opts.add_option("--rpc.url", settings.rpc_url, "JSON-RPC endpoint of a node exposing the debug namespace")
        ->capture_default_str()
        ->check(RpcUrlValidator{});
    rpc_opts.add_option("--rpc.timeout", settings.rpc_timeout_ms, "Timeout of each JSON-RPC call in milliseconds")
        ->capture_default_str()
        ->check(CLI::Range(1, 3'600'000));

    std::map<std::string, verify::ArtifactLayout> layout_mapping{
        {"foundry", verify::ArtifactLayout::kFoundry},
        {"hardhat", verify::ArtifactLayout::kHardhat},
    };
    auto& build_opts = *cli.add_option_group("Build", "Compiler project options");
    build_opts.add_option("--build.tool", settings.build_settings.build_tool,
                          "Build front-end invoked as '<tool> build --optimizer-runs <N>'")
        ->capture_default_str();
    build_opts.add_option("--project.dir", settings.build_settings.project_dir, "Compiler project directory")
        ->capture_default_str()
        ->check(CLI::ExistingDirectory);
    build_opts.add_option("--artifacts.dir", settings.build_settings.artifacts_dir,
                          "Compiler output directory, relative to the project directory")
        ->capture_default_str();
    build_opts.add_option("--artifacts.layout", settings.build_settings.artifact_layout, "Compiler output layout")
        ->transform(CLI::Transformer(layout_mapping, CLI::ignore_case))
        ->default_val(verify::ArtifactLayout::kFoundry);
    build_opts.add_option("--artifacts.alternative_dir", settings.build_settings.alternative_artifacts_dir,
                          "Registry of artifacts built by other toolchains, relative to the project directory")
        ->capture_default_str();
}

void add_request_options(CLI::App& cli, RequestOptions& options) {
    auto& request_opts = *cli.add_option_group("Request", "Verification request");
    request_opts.add_option("--request", options.request_file, "JSON request document, overridden by the options below")
        ->check(CLI::ExistingFile);
    request_opts.add_option("--contract", options.contract_name, "Contract name, optionally qualified as path:Contract");
    request_opts.add_option("--address", options.contract_address, "Address of the deployed contract");
    request_opts.add_option("--type", options.verification_type, "Verification type")
        ->check(CLI::IsMember({"partial", "full"}));
    request_opts.add_option("--creation-tx", options.creation_tx_hash, "Hash of the transaction creating the contract");
    request_opts.add_option("--bytecode-file", options.onchain_bytecode_file,
                            "Runtime bytecode hex file used instead of eth_getCode")
        ->check(CLI::ExistingFile);
    request_opts.add_option("--metadata-file", options.metadata_file, "Compiler metadata document to hash")
        ->check(CLI::ExistingFile);
    request_opts.add_option("--library-name", options.library_name, "Library linked into the contract");
    request_opts.add_option("--library-address", options.library_address, "Address of the linked library");
    request_opts.add_flag("--library", options.is_library, "The contract is a deployed library");
    request_opts.add_option("--artifact-type", options.artifact_type, "Alternative artifact to compare against")
        ->check(CLI::IsMember({"default", "opMainnet"}));
    request_opts.add_option("--optimizer-runs", options.optimizer_runs, "Rebuild with this optimizer runs value");
    request_opts.add_option("--deployment-path", options.deployment_path, "Source of the creation code")
        ->check(CLI::IsMember({"auto", "direct", "internal"}));
}

static nlohmann::json read_request_file(const std::filesystem::path& path) {
    std::ifstream file{path};
    if (!file) {
        throw verify::RequestValidationError{"request", absl::StrCat("cannot open ", path.string())};
    }
    const auto json = nlohmann::json::parse(file, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        throw verify::RequestValidationError{"request", absl::StrCat(path.string(), " is not a JSON object")};
    }
    return json;
}

nlohmann::json make_request_document(const RequestOptions& options) {
    nlohmann::json document = options.request_file ? read_request_file(*options.request_file) : nlohmann::json::object();

    const auto set_field = [&document](const char* key, const std::optional<std::string>& value) {
        if (value) {
            document[key] = *value;
        }
    };
    set_field("contractName", options.contract_name);
    set_field("contractAddress", options.contract_address);
    set_field("verificationType", options.verification_type);
    set_field("contractCreationTxHash", options.creation_tx_hash);
    set_field("onchainBytecodeFilePath", options.onchain_bytecode_file);
    set_field("metadataFilePath", options.metadata_file);
    set_field("libraryName", options.library_name);
    set_field("libraryAddress", options.library_address);
    set_field("artifactType", options.artifact_type);
    set_field("deploymentPath", options.deployment_path);
    if (options.is_library) {
        document["isLibrary"] = true;
    }
    if (options.optimizer_runs) {
        const auto runs{verify::parse_optimizer_runs(*options.optimizer_runs)};
        if (!runs) {
            throw verify::RequestValidationError{"optimizerRuns", *options.optimizer_runs, runs.error()};
        }
        document["optimizerRuns"] = *runs;
    }
    return document;
}

}  // namespace bytecheck::cmd::common
