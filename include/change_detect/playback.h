// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file playback.h
/// @brief Record key/data observations and export them for offline replay.
///
/// generate() produces a Dart source file:
/// @code
///   library playback_data;
///
///   import "dart:json" as json;
///
///   // Auto-generated by record-playback
///
///   Map<String, String> playbackData = {
///     "GET /users": json.parse("[{\"name\":\"Alice\"}]"),
///   };
/// @endcode
/// Keys and data are emitted as JSON string literals with every `$`
/// escaped, so Dart string interpolation never applies to them.

#pragma once

#include <change_detect/api.h>
#include <change_detect/value.h>

#include <cstddef>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace change_detect {

class CHANGE_DETECT_API PlaybackRecorder {
public:
    /// @param library Name of the generated Dart library
    explicit PlaybackRecorder(std::string library = "playback_data");

    /// Store `data` under `key` unless `key` was recorded before
    /// @return true if stored, false if the key was already present
    bool record(std::string key, std::string data);

    /// Store the compact JSON form of `data` under `key`
    bool record_value(std::string key, const Value& data);

    /// Render all recorded pairs in first-seen order
    [[nodiscard]] std::string generate() const;

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }
    [[nodiscard]] bool contains(const std::string& key) const { return seen_.count(key) != 0; }

    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& records() const noexcept {
        return records_;
    }

    void clear();

private:
    std::string library_;
    std::vector<std::pair<std::string, std::string>> records_;
    std::unordered_set<std::string> seen_;
};

} // namespace change_detect
