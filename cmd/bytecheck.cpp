// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <iostream>
#include <memory>

#include <boost/system/system_error.hpp>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <bytecheck/infra/cli/common.hpp>
#include <bytecheck/infra/common/log.hpp>
#include <bytecheck/verify/build/compiler_invoker.hpp>
#include <bytecheck/verify/chain/json_rpc_provider.hpp>
#include <bytecheck/verify/cli/verifier_options.hpp>
#include <bytecheck/verify/common/errors.hpp>
#include <bytecheck/verify/settings.hpp>
#include <bytecheck/verify/verifier.hpp>

using namespace bytecheck;
using namespace bytecheck::cmd::common;
using namespace bytecheck::verify;

//! Process exit codes
enum ExitCode : int {
    kAllEqual = 0,
    kMismatch = 1,
    kInvalidRequest = 2,
    kFailure = 3,
};

static void print_results(const ComparisonResults& results, bool json_output) {
    if (json_output) {
        const nlohmann::json json = results;
        std::cout << json.dump(2) << "\n";
        return;
    }
    for (const auto& result : results) {
        std::cout << result << "\n";
    }
}

int main(int argc, char* argv[]) {
    CLI::App cli{"bytecheck - verifies deployed EVM bytecode against the compiler output of its sources"};
    cli.get_formatter()->column_width(50);

    VerifierSettings settings;
    RequestOptions request_options;
    bool json_output{false};

    try {
        add_logging_options(cli, settings.log_settings);
        add_verifier_options(cli, settings);
        add_request_options(cli, request_options);
        cli.add_flag("--json", json_output, "Print the results as a JSON array");
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& ex) {
        // Let CLI11 handle any error occurred parsing command-line args
        const int exit_code{cli.exit(ex)};
        return exit_code == 0 ? kAllEqual : kInvalidRequest;
    }

    log::init(settings.log_settings);

    try {
        const auto request = make_request_document(request_options).get<VerificationRequest>();

        const auto endpoint{parse_rpc_endpoint(settings.rpc_url)};
        if (!endpoint) {
            BYTECHECK_CRIT << "Invalid JSON-RPC endpoint: " << settings.rpc_url;
            return kFailure;
        }
        JsonRpcProvider provider{*endpoint, std::chrono::milliseconds{settings.rpc_timeout_ms}};
        BuildOrchestrator orchestrator{settings.build_settings,
                                       std::make_shared<ProcessCompilerInvoker>(settings.build_settings.project_dir)};
        Verifier verifier{orchestrator, provider};

        const ComparisonResults results{verifier.verify(request)};
        print_results(results, json_output);
        return all_equal(results) ? kAllEqual : kMismatch;
    } catch (const RequestValidationError& ex) {
        BYTECHECK_ERROR << "Invalid request: " << ex.what();
        return kInvalidRequest;
    } catch (const VerificationException& ex) {
        BYTECHECK_ERROR << "Verification failed: " << ex.what();
        return kFailure;
    } catch (const CompilerInvocationError& ex) {
        BYTECHECK_ERROR << "Compiler failure: " << ex.what();
        return kFailure;
    } catch (const RpcError& ex) {
        BYTECHECK_ERROR << "JSON-RPC failure: " << ex.what() << " (code " << ex.code() << ")";
        return kFailure;
    } catch (const boost::system::system_error& ex) {
        BYTECHECK_ERROR << "Transport failure: " << ex.what();
        return kFailure;
    } catch (const std::exception& ex) {
        BYTECHECK_CRIT << "Unrecoverable failure: " << ex.what();
        return kFailure;
    }
}
