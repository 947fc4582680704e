// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <boost/process/environment.hpp>

namespace bytecheck {

static constexpr const char* kRpcUrlVariable{"BYTECHECK_RPC_URL"};
static constexpr const char* kBuildToolVariable{"BYTECHECK_BUILD_TOOL"};

static std::optional<std::string> get_non_empty(const char* var_name) {
    auto environment = boost::this_process::environment();
    const auto env_var = environment[var_name];
    if (env_var.empty()) {
        return std::nullopt;
    }
    return env_var.to_string();
}

std::optional<std::string> Environment::get_rpc_url() {
    return get_non_empty(kRpcUrlVariable);
}

void Environment::set_rpc_url(std::string_view url) {
    auto environment = boost::this_process::environment();
    environment[kRpcUrlVariable] = std::string{url};
}

std::optional<std::string> Environment::get_build_tool() {
    return get_non_empty(kBuildToolVariable);
}

void Environment::set_build_tool(std::string_view tool) {
    auto environment = boost::this_process::environment();
    environment[kBuildToolVariable] = std::string{tool};
}

std::string Environment::get(std::string_view var_name) {
    auto environment = boost::this_process::environment();
    const auto env_var = environment[std::string{var_name}];
    return env_var.to_string();
}

}  // namespace bytecheck
