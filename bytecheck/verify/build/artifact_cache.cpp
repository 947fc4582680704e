// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "artifact_cache.hpp"

#include <exception>

#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

ArtifactCache::ArtifactPtr ArtifactCache::get_or_build(const std::string& contract_name, uint32_t optimizer_runs,
                                                       const Builder& builder) {
    Key key{contract_name, optimizer_runs};
    std::promise<ArtifactPtr> promise;
    std::shared_future<ArtifactPtr> result;
    bool owner{false};
    {
        std::scoped_lock lock{mutex_};
        if (const auto it{entries_.find(key)}; it != entries_.end()) {
            result = it->second;
        } else {
            result = promise.get_future().share();
            entries_.emplace(key, result);
            owner = true;
        }
    }

    if (owner) {
        try {
            promise.set_value(std::make_shared<const CompiledArtifact>(builder()));
        } catch (...) {
            {
                std::scoped_lock lock{mutex_};
                entries_.erase(key);
            }
            BYTECHECK_WARN << "Build of " << contract_name << " with optimizer runs " << optimizer_runs
                           << " failed, evicted from cache";
            promise.set_exception(std::current_exception());
        }
    } else {
        BYTECHECK_DEBUG << "Awaiting build of " << contract_name << " with optimizer runs " << optimizer_runs;
    }
    return result.get();
}

bool ArtifactCache::contains(const std::string& contract_name, uint32_t optimizer_runs) const {
    std::scoped_lock lock{mutex_};
    return entries_.contains(Key{contract_name, optimizer_runs});
}

size_t ArtifactCache::size() const {
    std::scoped_lock lock{mutex_};
    return entries_.size();
}

}  // namespace bytecheck::verify
