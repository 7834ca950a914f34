// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Patch: an operation tree plus its global condition, and the three
///        ways of applying it.
///
/// A Patch never changes once built; applying it returns a new root and
/// leaves both the patch and the input root untouched:
///
/// @code
///   Differ differ;
///   Patch p = differ.diff(before, after);
///
///   Value v1 = p.apply(before);              // best effort
///   Value v2 = p.apply_checked(before);      // throws ApplyError on conflict
///   Value v3 = p.reverse().apply(after);     // == before
/// @endcode
///
/// Apply disciplines:
/// - apply():          if/unless guards skip nodes; everything else is applied.
///                     Node failures are collected and the walk continues.
/// - apply_checked():  also verifies local conditions, the global condition,
///                     recorded old values (strict patches) and test nodes.
///                     All failures are reported together in one ApplyError.
/// - apply_resolved(): guards as apply_checked(); every mutating node is
///                     submitted to a ConflictResolver first. Keyed sequences
///                     are reconciled by entity key instead of by position.

#pragma once

#include "api.h"
#include "clock.h"
#include "condition.h"
#include "operation.h"
#include "value.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lager_delta {

class ConflictResolver;

/// Aggregate failure of apply_checked()/apply_resolved().
class LAGER_DELTA_API ApplyError : public std::runtime_error {
public:
    explicit ApplyError(std::vector<std::string> errors);

    [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return errors_; }

private:
    std::vector<std::string> errors_;
};

/// One flattened change reported by Patch::walk().
struct WalkEntry {
    Path path;
    OpKind kind = OpKind::Replace;
    Value old_value;
    Value new_value;
    std::optional<Path> from;    ///< Copy/Move source
};

class LAGER_DELTA_API Patch {
public:
    using WalkFn = std::function<void(const WalkEntry&)>;
    using WalkUntilFn = std::function<bool(const WalkEntry&)>;

    Patch() = default;
    explicit Patch(OperationPtr root, ConditionPtr condition = nullptr, bool strict = true,
                   std::optional<Timestamp> timestamp = std::nullopt);

    [[nodiscard]] const OperationPtr& root() const noexcept { return root_; }
    [[nodiscard]] const ConditionPtr& condition() const noexcept { return condition_; }
    [[nodiscard]] bool strict() const noexcept { return strict_; }
    [[nodiscard]] const std::optional<Timestamp>& timestamp() const noexcept { return timestamp_; }

    /// True when the patch changes nothing: no root and no global condition.
    [[nodiscard]] bool is_empty() const noexcept { return !root_ && !condition_; }

    [[nodiscard]] Patch with_condition(ConditionPtr condition) const;
    [[nodiscard]] Patch with_strict(bool strict) const;
    [[nodiscard]] Patch with_timestamp(Timestamp ts) const;

    /// Best-effort application. Node failures are logged and, when
    /// @p errors_out is given, appended to it.
    [[nodiscard]] Value apply(const Value& root, std::vector<std::string>* errors_out = nullptr) const;

    /// @throws ApplyError listing every violation found
    [[nodiscard]] Value apply_checked(const Value& root) const;

    /// @throws ApplyError for guard failures and structural errors
    [[nodiscard]] Value apply_resolved(const Value& root, ConflictResolver& resolver) const;

    /// The patch that undoes this one.
    [[nodiscard]] Patch reverse() const;

    /// Depth-first, in tree order. An exception thrown by @p fn stops the
    /// walk and propagates.
    void walk(const WalkFn& fn) const;

    /// Like walk(); returning false stops immediately.
    /// @return false if the walk was stopped
    bool walk_until(const WalkUntilFn& fn) const;

    /// Indented tree rendering.
    [[nodiscard]] std::string to_string() const;

    /// One line per flattened change, e.g. "replace /Name: \"v1\" -> \"v2\"".
    [[nodiscard]] std::string summary() const;

private:
    OperationPtr root_;
    ConditionPtr condition_;
    bool strict_ = true;
    std::optional<Timestamp> timestamp_;
};

/// Reverse of one operation tree located at @p at. Moves whose reverse
/// belongs at another location are appended to @p relocated.
[[nodiscard]] LAGER_DELTA_API OperationPtr
reverse_operation(const OperationPtr& op, const Path& at,
                  std::vector<std::pair<Path, OperationPtr>>& relocated);

/// Inserts @p op at @p path below @p root, creating map nodes on the way.
[[nodiscard]] LAGER_DELTA_API OperationPtr graft_operation(const OperationPtr& root, const Path& path,
                                                           OperationPtr op);

} // namespace lager_delta
