// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file identity.h
/// @brief Identity comparison and identity hashing for Value.
///
/// Two Values are identical when they hold the same alternative and
/// - atoms (null, bool, numbers, strings): payloads are equal
/// - containers: they share the same immer storage (root/tail for vectors
///   and maps, the data buffer for arrays)
///
/// A container that was rebuilt with equal contents is NOT identical to
/// the original. Containers derived with set()/push_back() are not identical
/// to their source either, but their untouched children are.

#pragma once

#include <change_detect/api.h>
#include <change_detect/value.h>

#include <cstddef>
#include <functional>

namespace change_detect {

/// O(1) identity comparison (no recursion into containers)
[[nodiscard]] CHANGE_DETECT_API bool identical(const Value& a, const Value& b) noexcept;

/// Hash consistent with identical(): identical values hash equally
[[nodiscard]] CHANGE_DETECT_API std::size_t identity_hash(const Value& val) noexcept;

/// A Value captured together with its identity hash, usable as a key of
/// hashed containers that bucket values by identity.
class IdentityKey {
public:
    explicit IdentityKey(const Value& val)
        : value_(&val), hash_(identity_hash(val)) {}

    [[nodiscard]] const Value& value() const noexcept { return *value_; }
    [[nodiscard]] std::size_t hash() const noexcept { return hash_; }

    friend bool operator==(const IdentityKey& a, const IdentityKey& b) noexcept {
        return a.hash_ == b.hash_ && identical(*a.value_, *b.value_);
    }

private:
    const Value* value_;
    std::size_t hash_;
};

struct IdentityKeyHash {
    std::size_t operator()(const IdentityKey& key) const noexcept { return key.hash(); }
};

} // namespace change_detect
