// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bytecheck {

//! Process environment overrides of the verifier settings
class Environment {
  public:
    //! JSON-RPC endpoint taken from BYTECHECK_RPC_URL
    static std::optional<std::string> get_rpc_url();
    static void set_rpc_url(std::string_view url);

    //! Compiler front-end taken from BYTECHECK_BUILD_TOOL
    static std::optional<std::string> get_build_tool();
    static void set_build_tool(std::string_view tool);

    static std::string get(std::string_view var_name);
};

}  // namespace bytecheck
