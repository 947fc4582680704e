// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <bytecheck/verify/artifact/compiled_artifact.hpp>

namespace bytecheck::verify {

//! \brief Single-flight cache of rebuilt artifacts keyed by (contract name, optimizer runs)
//! \details The first caller for a key runs the builder, concurrent callers wait for the same result.
//! A failed build is evicted so that a later call retries it, waiting callers receive the same exception.
class ArtifactCache {
  public:
    using Key = std::pair<std::string, uint32_t>;
    using ArtifactPtr = std::shared_ptr<const CompiledArtifact>;
    using Builder = std::function<CompiledArtifact()>;

    ArtifactPtr get_or_build(const std::string& contract_name, uint32_t optimizer_runs, const Builder& builder);

    bool contains(const std::string& contract_name, uint32_t optimizer_runs) const;
    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::map<Key, std::shared_future<ArtifactPtr>> entries_;
};

}  // namespace bytecheck::verify
