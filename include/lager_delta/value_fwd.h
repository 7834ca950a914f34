// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for the document, patch and condition types.
///
/// Headers that only pass these types around by reference or pointer can
/// include this file instead of the full definitions.

#pragma once

#include "config.h"

#include <immer/memory_policy.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace lager_delta {

using unsafe_memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                                  immer::unsafe_refcount_policy, immer::no_lock_policy>;

template <typename MemoryPolicy>
struct BasicValue;

using Value = BasicValue<unsafe_memory_policy>;

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

struct Condition;
using ConditionPtr = std::shared_ptr<const Condition>;

struct Operation;
using OperationPtr = std::shared_ptr<const Operation>;

class Patch;
class TypeRegistry;
class ConflictResolver;

} // namespace lager_delta
