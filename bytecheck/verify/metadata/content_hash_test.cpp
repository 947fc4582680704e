// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "content_hash.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

#include <bytecheck/core/common/util.hpp>
#include <bytecheck/verify/test_util/sample_bytecode.hpp>

namespace bytecheck::verify {

TEST_CASE("to_base58", "[bytecheck][verify][metadata]") {
    CHECK(to_base58(string_to_bytes("hello world")) == "StV1DL6CwTryKyV");
    CHECK(to_base58(Bytes{0x00, 0x01}) == "12");
    CHECK(to_base58(Bytes{}).empty());
}

TEST_CASE("ipfs_multihash", "[bytecheck][verify][metadata]") {
    SECTION("empty file") {
        const auto hash{ipfs_multihash("")};
        REQUIRE(hash);
        CHECK(to_base58(*hash) == "QmbFMke1KXqnYyBBWxB74N4c5SBnJMVAiMNRcGu6x1AwQH");
    }

    SECTION("small file") {
        const auto hash{ipfs_multihash("hello world")};
        REQUIRE(hash);
        CHECK(to_base58(*hash) == "Qmf412jQZiuVUtdgnB36FXFX7xg5V6KEbSJ4dpQuhkLyfD");
    }

    SECTION("sha2-256 multihash prefix") {
        const auto hash{ipfs_multihash(test_util::kSampleRawMetadata)};
        REQUIRE(hash);
        CHECK(hash->size() == 34);
        CHECK((*hash)[0] == 0x12);
        CHECK((*hash)[1] == 0x20);
        CHECK(to_base58(*hash).starts_with("Qm"));
    }

    SECTION("different documents give different hashes") {
        CHECK(*ipfs_multihash(test_util::kSampleRawMetadata) != *ipfs_multihash(test_util::kOtherRawMetadata));
    }

    SECTION("multi-chunk document") {
        const std::string large(kIpfsChunkSize + 1, 'a');
        const auto hash{ipfs_multihash(large)};
        REQUIRE(hash);
        CHECK(hash->size() == 34);
        CHECK(*hash != *ipfs_multihash(std::string(kIpfsChunkSize, 'a')));
    }

    SECTION("document requiring more than one DAG level") {
        const std::string huge(kIpfsChunkSize * kIpfsMaxLinksPerNode + 1, 'a');
        CHECK(ipfs_multihash(huge).error() == VerificationError::kUnsupportedMetadataHash);
    }
}

TEST_CASE("swarm hashes", "[bytecheck][verify][metadata]") {
    SECTION("bzzr0 of a single chunk is keccak of span and data") {
        Bytes preimage{Bytes{0x03, 0, 0, 0, 0, 0, 0, 0}};
        preimage.append(string_to_bytes("abc"));
        const auto expected{keccak256(preimage)};
        CHECK(swarm_bzzr0_hash("abc") == Bytes{expected.bytes, kHashLength});
    }

    SECTION("bzzr0 of multiple chunks") {
        const std::string content(kSwarmChunkSize * 2, 'x');
        const Bytes hash{swarm_bzzr0_hash(content)};
        CHECK(hash.size() == kHashLength);
        CHECK(hash != swarm_bzzr0_hash(std::string(kSwarmChunkSize * 2 - 1, 'x')));
    }

    SECTION("bzzr0 known hashes") {
        CHECK(to_hex(swarm_bzzr0_hash("")) == "011b4d03dd8c01f1049143cf9c4c817e4b167f1d1b83e5c6f0f10d89ba1e7bce");
        CHECK(to_hex(swarm_bzzr0_hash("hello world")) ==
              "38bf972e93a5443047f56e3b27b99b024d4673aa164de4d64070578e4ee06cb3");
        CHECK(to_hex(swarm_bzzr0_hash(std::string(5000, 'a'))) ==
              "bca490cd175e22df2f343b8d70e9cdba1ac234977d0d00c771cf4a2f2498d359");
    }

    SECTION("bzzr1 known hashes") {
        const auto empty{swarm_bzzr1_hash("")};
        REQUIRE(empty);
        CHECK(to_hex(*empty) == "b34ca8c22b9e982354f9c7f50b470d66db428d880c8a904d5fe4ec9713171526");
        const auto hello{swarm_bzzr1_hash("hello world")};
        REQUIRE(hello);
        CHECK(to_hex(*hello) == "92672a471f4419b255d7cb0cf313474a6f5856fb347c5ece85fb706d644b630f");
    }

    SECTION("bzzr1 single chunk") {
        const auto hash{swarm_bzzr1_hash(test_util::kSampleRawMetadata)};
        REQUIRE(hash);
        CHECK(hash->size() == kHashLength);
        CHECK(*hash != *swarm_bzzr1_hash(test_util::kOtherRawMetadata));
    }

    SECTION("bzzr1 beyond a single chunk") {
        CHECK(swarm_bzzr1_hash(std::string(kSwarmChunkSize + 1, 'x')).error() == VerificationError::kUnsupportedMetadataHash);
    }
}

TEST_CASE("content_hash dispatches on scheme", "[bytecheck][verify][metadata]") {
    CHECK(content_hash(ContentHashScheme::kIpfs, "abc") == ipfs_multihash("abc"));
    CHECK(*content_hash(ContentHashScheme::kBzzr0, "abc") == swarm_bzzr0_hash("abc"));
    CHECK(content_hash(ContentHashScheme::kBzzr1, "abc") == swarm_bzzr1_hash("abc"));
}

}  // namespace bytecheck::verify
