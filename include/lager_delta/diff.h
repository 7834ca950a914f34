// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Differ: computes the operation tree that turns one Value into another.
///
/// @code
///   TypeRegistry registry;
///   registry.register_type("Item", {{"ID", FieldFlags::Key}, {"Label", FieldFlags::None}});
///
///   Differ differ(DiffOptions{&registry});
///   Patch p = differ.diff(before, after);
///   assert(p.apply(before) == after);
/// @endcode
///
/// Unchanged subtrees are skipped in O(1) when both sides share their immer
/// node, which is the common case for values derived from one another.
///
/// Sequences are diffed in two stages: the common prefix and suffix are
/// trimmed, then the remaining middle runs are aligned either by entity key
/// (records whose type declares a Key field, keys unique on both sides) or
/// by an edit-distance table.

#pragma once

#include "api.h"
#include "operation.h"
#include "patch.h"
#include "type_registry.h"
#include "value.h"

#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lager_delta {

/// A registered custom differ failed; no patch is produced.
class LAGER_DELTA_API DiffError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DiffOptions {
    const TypeRegistry* registry = nullptr;
    std::vector<Path> ignore_paths;   ///< locations excluded from comparison
    bool detect_moves = false;        ///< report relocated records as copy/move
};

class LAGER_DELTA_API Differ {
public:
    Differ() = default;
    explicit Differ(DiffOptions options);

    /// Patch from @p a to @p b (empty when they are equal).
    /// @throws DiffError
    [[nodiscard]] Patch diff(const Value& a, const Value& b) const;

    /// Operation tree from @p a to @p b, nullptr when they are equal.
    /// @throws DiffError
    [[nodiscard]] OperationPtr diff_values(const Value& a, const Value& b) const;

    [[nodiscard]] const DiffOptions& options() const noexcept { return options_; }

private:
    struct MoveCandidate {
        Path path;
        Value value;
        bool map_entry = false;
    };

    // Scratch state of one diff call.
    struct State {
        std::set<std::pair<const void*, const void*>> in_progress;
        std::vector<MoveCandidate> candidates;
        std::vector<Path> claimed_sources;
        const Value* target_root = nullptr;
    };

    OperationPtr run(State& state, const Value& a, const Value& b) const;
    OperationPtr diff_node(State& state, const Value& a, const Value& b, const Path& path,
                           FieldFlags flags = FieldFlags::None) const;
    OperationPtr diff_record(State& state, const Record& a, const Record& b, const Path& path) const;
    OperationPtr diff_fixed_array(State& state, const Value& a, const Value& b, const Path& path) const;
    OperationPtr diff_map(State& state, const ValueMap& a, const ValueMap& b, const Path& path) const;
    OperationPtr diff_ref(State& state, const ValueRef& a, const ValueRef& b, const Path& path) const;
    OperationPtr relocation(State& state, const Value& added, const Path& path) const;

    OperationPtr diff_sequence(State& state, const ValueVector& a, const ValueVector& b,
                               const Path& path) const;
    OperationPtr diff_positional(State& state, const ValueVector& a, const ValueVector& b,
                                 const Path& path) const;
    OperationPtr diff_keyed(State& state, const ValueVector& a, const ValueVector& b,
                            const std::string& key_field, const Path& path) const;

    [[nodiscard]] bool ignored(const Path& path) const;
    [[nodiscard]] bool equal(const Value& a, const Value& b) const;

    DiffOptions options_;
};

/// Shorthand for Differ(options).diff(a, b).
[[nodiscard]] LAGER_DELTA_API Patch diff(const Value& a, const Value& b, const DiffOptions& options = {});

} // namespace lager_delta
