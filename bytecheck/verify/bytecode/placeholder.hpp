// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>

#include <bytecheck/core/common/base.hpp>
#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::verify {

//! Size in hex characters of a library placeholder, i.e. of a hex-encoded address
inline constexpr size_t kPlaceholderHexLength{2 * kAddressLength};

//! Position of a library address inside bytecode
struct LinkReference {
    std::string source;
    std::string library;
    size_t start{0};
    size_t length{kAddressLength};

    bool operator==(const LinkReference&) const = default;
};

//! Position of an immutable variable value inside runtime bytecode
struct ImmutableReference {
    size_t start{0};
    size_t length{0};

    bool operator==(const ImmutableReference&) const = default;
};

struct LibraryLink {
    LinkReference reference;
    std::optional<evmc::address> address;  // zeros are written when absent
};

//! Everything that must be overwritten to make compiled and deployed bytecode comparable
struct Linkages {
    std::vector<LibraryLink> libraries;
    std::vector<ImmutableReference> immutables;
    //! Deployed libraries start with PUSH20 <own address>
    bool library_self_reference{false};
};

struct Placeholder {
    size_t start{0};
    std::string text;
};

struct UnlinkedBytecode {
    Bytes code;
    std::vector<Placeholder> placeholders;
};

//! \brief Decodes compiler hex output which may still contain library placeholders
//! \details Placeholders are 40 characters starting and ending with "__", either "__$<34 hex>$__"
//! or the legacy "__<name>___" form. Their bytes are decoded as zeros.
VerificationResult<UnlinkedBytecode> decode_unlinked_hex(std::string_view hex);

//! Placeholder emitted by the compiler for the library with the given fully qualified name (source:Library)
std::string library_placeholder(std::string_view fully_qualified_name);

//! \brief Produces the canonical form of bytecode under the given linkages
//! \details Ranges not fitting in the bytecode are left untouched. The operation is idempotent.
Bytes normalize(ByteView bytecode, const Linkages& linkages);

//! Checks that every reference fits in the bytecode, failing with kInvalidArtifact otherwise
VerificationResult<void> validate_references(ByteView bytecode, const Linkages& linkages);

}  // namespace bytecheck::verify
