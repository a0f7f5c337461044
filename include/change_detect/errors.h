// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types thrown by the change detector.

#pragma once

#include <change_detect/api.h>

#include <stdexcept>
#include <string>

namespace change_detect {

/// Common base of every change_detect exception
class CHANGE_DETECT_API ChangeDetectError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The field selector does not fit the watched object's shape.
/// Thrown by watch() and WatchRecord::set_object(), never at check time.
class CHANGE_DETECT_API InvalidFieldSelector : public ChangeDetectError {
public:
    using ChangeDetectError::ChangeDetectError;
};

/// A watched object lost the shape its selector was validated against
/// (thrown by WatchRecord::check()).
class CHANGE_DETECT_API EvaluationError : public ChangeDetectError {
public:
    using ChangeDetectError::ChangeDetectError;
};

/// The watch tree was mutated, or a digest was started, while a digest
/// pass is running.
class CHANGE_DETECT_API DigestInProgress : public ChangeDetectError {
public:
    using ChangeDetectError::ChangeDetectError;
};

/// The handle refers to a group or record that has been removed.
class CHANGE_DETECT_API StaleHandle : public ChangeDetectError {
public:
    using ChangeDetectError::ChangeDetectError;
};

} // namespace change_detect
