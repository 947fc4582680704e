// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <gmock/gmock.h>

#include <bytecheck/verify/build/compiler_invoker.hpp>

namespace bytecheck::verify::test_util {

//! \brief gMock mock class for CompilerInvoker
class MockCompilerInvoker : public CompilerInvoker {
  public:
    ~MockCompilerInvoker() override = default;

    MOCK_METHOD((void), run, (const std::string&), (override));
};

}  // namespace bytecheck::verify::test_util
