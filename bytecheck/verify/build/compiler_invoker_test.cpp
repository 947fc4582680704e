// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "compiler_invoker.hpp"

#include <catch2/catch_test_macros.hpp>

#include <bytecheck/infra/test_util/log.hpp>
#include <bytecheck/infra/test_util/temporary_file.hpp>

namespace bytecheck::verify {

TEST_CASE("ProcessCompilerInvoker", "[bytecheck][verify][build]") {
    bytecheck::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const bytecheck::test_util::TemporaryDirectory project_dir;
    ProcessCompilerInvoker invoker{project_dir.path()};

    SECTION("successful command") {
        CHECK_NOTHROW(invoker.run("true"));
    }

    SECTION("runs in the project directory") {
        CHECK_NOTHROW(invoker.run("touch built.txt"));
        CHECK(std::filesystem::exists(project_dir.path() / "built.txt"));
    }

    SECTION("no shell interpretation") {
        // With a shell the second command would fail the build
        CHECK_NOTHROW(invoker.run("echo build && false"));
    }

    SECTION("non-zero exit status") {
        try {
            invoker.run("false");
            FAIL("expected CompilerInvocationError");
        } catch (const CompilerInvocationError& e) {
            CHECK(e.command() == "false");
            CHECK(e.exit_code() == 1);
        }
    }

    SECTION("unknown executable") {
        CHECK_THROWS_AS(invoker.run("surely-not-a-build-tool build --optimizer-runs 1"), CompilerInvocationError);
    }

    SECTION("empty command") {
        CHECK_THROWS_AS(invoker.run("   "), CompilerInvocationError);
    }
}

}  // namespace bytecheck::verify
