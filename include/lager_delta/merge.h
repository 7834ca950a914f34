// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file merge.h
/// @brief Structural merge of two patches computed from the same base.
///
/// @code
///   Patch ours = diff(base, edited_here);
///   Patch theirs = diff(base, edited_there);
///
///   MergeResult merged = merge(ours, theirs);
///   for (const auto& c : merged.conflicts) std::cerr << c.message << "\n";
///   Value result = merged.patch.apply(base);
/// @endcode
///
/// Locations touched by one side are kept as they are; locations touched by
/// both with the same change are kept once. Containers changed on both sides
/// are merged member by member. Anything else is a conflict, decided by the
/// resolver when one is given, otherwise by the later timestamp (ours on a
/// tie). Inserts from both sides at one sequence position are kept in an
/// order that does not depend on which side is "ours".

#pragma once

#include "api.h"
#include "operation.h"
#include "patch.h"
#include "path.h"
#include "value.h"

#include <optional>
#include <string>
#include <vector>

namespace lager_delta {

class ConflictResolver;

enum class MergeSide : uint8_t {
    Ours,
    Theirs,
};

struct MergeConflict {
    Path path;
    OpKind ours_kind = OpKind::Replace;
    OpKind theirs_kind = OpKind::Replace;
    std::optional<Value> ours;      ///< value written by ours, if it writes one
    std::optional<Value> theirs;
    MergeSide chosen = MergeSide::Ours;
    std::string message;
};

struct MergeResult {
    Patch patch;
    std::vector<MergeConflict> conflicts;

    [[nodiscard]] bool has_conflicts() const noexcept { return !conflicts.empty(); }
};

/// @param resolver consulted once per conflict with the request of the
///        "theirs" change (current = what ours writes); an accepted value
///        makes theirs win with that value.
[[nodiscard]] LAGER_DELTA_API MergeResult merge(const Patch& ours, const Patch& theirs,
                                                ConflictResolver* resolver = nullptr);

[[nodiscard]] LAGER_DELTA_API std::string to_string(const MergeConflict& conflict);

} // namespace lager_delta
