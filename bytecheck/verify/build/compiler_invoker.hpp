// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace bytecheck::verify {

//! Compiler run failure, propagated unrecovered
class CompilerInvocationError : public std::runtime_error {
  public:
    CompilerInvocationError(std::string command, int exit_code, const std::string& reason);

    const std::string& command() const noexcept { return command_; }
    int exit_code() const noexcept { return exit_code_; }

  private:
    std::string command_;
    int exit_code_;
};

//! Runs a project build command to completion
class CompilerInvoker {
  public:
    virtual ~CompilerInvoker() = default;

    //! \throws CompilerInvocationError if the command cannot be started or exits with non-zero status
    virtual void run(const std::string& command) = 0;
};

//! Spawns the build command as a child process of the project directory, without any shell
class ProcessCompilerInvoker : public CompilerInvoker {
  public:
    explicit ProcessCompilerInvoker(std::filesystem::path project_dir);

    void run(const std::string& command) override;

  private:
    std::filesystem::path project_dir_;
};

}  // namespace bytecheck::verify
