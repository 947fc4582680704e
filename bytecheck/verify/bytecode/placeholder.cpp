// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "placeholder.hpp"

#include <algorithm>

#include <bytecheck/core/common/util.hpp>
#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

static constexpr uint8_t kPush20Opcode{0x73};

static bool fits(size_t size, size_t start, size_t length) noexcept {
    return start <= size && length <= size - start;
}

static bool is_placeholder(std::string_view text) noexcept {
    return text.size() == kPlaceholderHexLength && text.starts_with("__") && text.ends_with("__");
}

VerificationResult<UnlinkedBytecode> decode_unlinked_hex(std::string_view hex) {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return tl::unexpected{VerificationError::kInvalidArtifact};
    }

    UnlinkedBytecode unlinked;
    unlinked.code.reserve(hex.size() / 2);
    size_t pos{0};
    while (pos < hex.size()) {
        if (hex[pos] == '_') {
            const std::string_view candidate{hex.substr(pos, kPlaceholderHexLength)};
            if (!is_placeholder(candidate)) {
                return tl::unexpected{VerificationError::kInvalidArtifact};
            }
            unlinked.placeholders.push_back({unlinked.code.size(), std::string{candidate}});
            unlinked.code.append(kAddressLength, uint8_t{0});
            pos += kPlaceholderHexLength;
            continue;
        }
        const auto high{decode_hex_digit(hex[pos])};
        const auto low{decode_hex_digit(hex[pos + 1])};
        if (!high || !low) {
            return tl::unexpected{VerificationError::kInvalidArtifact};
        }
        unlinked.code.push_back(static_cast<uint8_t>((*high << 4) | *low));
        pos += 2;
    }
    return unlinked;
}

std::string library_placeholder(std::string_view fully_qualified_name) {
    const auto hash{keccak256(string_view_to_byte_view(fully_qualified_name))};
    return "__$" + to_hex(ByteView{hash.bytes}).substr(0, 34) + "$__";
}

Bytes normalize(ByteView bytecode, const Linkages& linkages) {
    Bytes normalized{bytecode};
    size_t skipped{0};

    for (const auto& [reference, address] : linkages.libraries) {
        if (!fits(normalized.size(), reference.start, reference.length)) {
            ++skipped;
            continue;
        }
        const auto dest{normalized.begin() + static_cast<std::ptrdiff_t>(reference.start)};
        if (address && reference.length == kAddressLength) {
            std::copy_n(address->bytes, kAddressLength, dest);
        } else {
            std::fill_n(dest, reference.length, uint8_t{0});
        }
    }
    for (const auto& [start, length] : linkages.immutables) {
        if (!fits(normalized.size(), start, length)) {
            ++skipped;
            continue;
        }
        std::fill_n(normalized.begin() + static_cast<std::ptrdiff_t>(start), length, uint8_t{0});
    }
    if (linkages.library_self_reference && normalized.size() > kAddressLength && normalized[0] == kPush20Opcode) {
        std::fill_n(normalized.begin() + 1, kAddressLength, uint8_t{0});
    }

    if (skipped > 0) {
        BYTECHECK_DEBUG << "normalize: " << skipped << " references out of range for bytecode size " << bytecode.size();
    }
    return normalized;
}

VerificationResult<void> validate_references(ByteView bytecode, const Linkages& linkages) {
    for (const auto& link : linkages.libraries) {
        const auto& reference{link.reference};
        if (!fits(bytecode.size(), reference.start, reference.length)) {
            BYTECHECK_ERROR << "Link reference " << reference.source << ":" << reference.library << " at "
                            << reference.start << " exceeds bytecode size " << bytecode.size();
            return tl::unexpected{VerificationError::kInvalidArtifact};
        }
    }
    for (const auto& [start, length] : linkages.immutables) {
        if (!fits(bytecode.size(), start, length)) {
            BYTECHECK_ERROR << "Immutable reference at " << start << " exceeds bytecode size " << bytecode.size();
            return tl::unexpected{VerificationError::kInvalidArtifact};
        }
    }
    return {};
}

}  // namespace bytecheck::verify
