// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <bytecheck/verify/settings.hpp>

namespace bytecheck::cmd::common {

//! CLI11 validator for plain HTTP JSON-RPC endpoints
struct RpcUrlValidator : public CLI::Validator {
    RpcUrlValidator();
};

//! Request fields given on the command line, each overriding the same field of the request file
struct RequestOptions {
    std::optional<std::filesystem::path> request_file;
    std::optional<std::string> contract_name;
    std::optional<std::string> contract_address;
    std::optional<std::string> verification_type;
    std::optional<std::string> creation_tx_hash;
    std::optional<std::string> onchain_bytecode_file;
    std::optional<std::string> metadata_file;
    std::optional<std::string> library_name;
    std::optional<std::string> library_address;
    bool is_library{false};
    std::optional<std::string> artifact_type;
    std::optional<std::string> optimizer_runs;
    std::optional<std::string> deployment_path;
};

//! \brief Set up options to populate verifier settings after cli.parse(), defaults honour the process environment
void add_verifier_options(CLI::App& cli, verify::VerifierSettings& settings);

//! \brief Set up options describing the verification request
void add_request_options(CLI::App& cli, RequestOptions& options);

//! \brief Assembles the request document from the request file and the command line fields
//! \throws verify::RequestValidationError for unreadable request files and malformed optimizer runs
nlohmann::json make_request_document(const RequestOptions& options);

}  // namespace bytecheck::cmd::common
