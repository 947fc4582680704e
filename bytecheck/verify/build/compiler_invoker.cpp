// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "compiler_invoker.hpp"

#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <boost/process.hpp>

#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

namespace bp = boost::process;

CompilerInvocationError::CompilerInvocationError(std::string command, int exit_code, const std::string& reason)
    : std::runtime_error{absl::StrCat("build command '", command, "' failed: ", reason)},
      command_{std::move(command)},
      exit_code_{exit_code} {}

ProcessCompilerInvoker::ProcessCompilerInvoker(std::filesystem::path project_dir)
    : project_dir_{std::move(project_dir)} {}

void ProcessCompilerInvoker::run(const std::string& command) {
    const std::vector<std::string> tokens = absl::StrSplit(command, ' ', absl::SkipEmpty());
    if (tokens.empty()) {
        throw CompilerInvocationError{command, -1, "empty command"};
    }
    const auto executable{bp::search_path(tokens.front())};
    if (executable.empty()) {
        throw CompilerInvocationError{command, -1, absl::StrCat(tokens.front(), " not found in PATH")};
    }
    const std::vector<std::string> args{tokens.begin() + 1, tokens.end()};

    BYTECHECK_INFO << "Building: " << command << " in " << project_dir_.string();
    int exit_code{0};
    try {
        bp::ipstream output;
        bp::child child{executable, bp::args(args), bp::start_dir(project_dir_.string()),
                        (bp::std_out & bp::std_err) > output};
        std::string line;
        while (std::getline(output, line)) {
            BYTECHECK_DEBUG << "[build] " << line;
        }
        child.wait();
        exit_code = child.exit_code();
    } catch (const bp::process_error& pe) {
        throw CompilerInvocationError{command, -1, pe.what()};
    }
    if (exit_code != 0) {
        throw CompilerInvocationError{command, exit_code, absl::StrCat("exit code ", exit_code)};
    }
    BYTECHECK_INFO << "Build completed: " << command;
}

}  // namespace bytecheck::verify
