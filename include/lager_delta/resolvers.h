// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file resolvers.h
/// @brief Conflict resolvers consulted by Patch::apply_resolved() and merge().
///
/// A resolver sees every mutating node before it is applied and either
/// returns the value to write (usually the proposed one) or rejects it:
///
/// @code
///   ReplicaMetadata meta;
///   LastWriterWinsResolver lww(meta, delta.timestamp);
///   Value next = delta.patch.apply_resolved(state, lww);
/// @endcode

#pragma once

#include "api.h"
#include "clock.h"
#include "operation.h"
#include "path.h"
#include "value.h"

#include <map>
#include <optional>
#include <string>

namespace lager_delta {

/// What a mutating node is about to do.
struct ResolveRequest {
    Path path;                        ///< keyed sequence elements are addressed by key
    OpKind kind = OpKind::Replace;
    std::optional<Value> key;         ///< entity key inside keyed sequences
    std::optional<Value> prev_key;    ///< predecessor key for keyed inserts and moves
    std::optional<Value> current;     ///< value at the location, nullopt when absent
    std::optional<Value> proposed;    ///< value to write, nullopt for removals
};

class LAGER_DELTA_API ConflictResolver {
public:
    virtual ~ConflictResolver() = default;

    /// Value to apply, or nullopt to reject the change. For removals any
    /// returned value means "accepted".
    [[nodiscard]] virtual std::optional<Value> resolve(const ResolveRequest& request) = 0;
};

/// Per-location clocks of one replica. Keys are JSON pointers.
struct ReplicaMetadata {
    std::map<std::string, Timestamp> clocks;
    std::map<std::string, Timestamp> tombstones;

    /// Latest time recorded for @p path or any of its ancestors, counting
    /// both writes and removals.
    [[nodiscard]] LAGER_DELTA_API std::optional<Timestamp> time_of(const Path& path) const;

    /// Records a write (or a removal) unless a later one is already known.
    LAGER_DELTA_API void record(const Path& path, const Timestamp& ts, bool removal);

    /// Per-location maximum of both sides.
    LAGER_DELTA_API void merge_from(const ReplicaMetadata& other);
};

/// Accepts a change iff @p op_time is strictly after everything recorded for
/// its location, then records @p op_time there.
class LAGER_DELTA_API LastWriterWinsResolver : public ConflictResolver {
public:
    LastWriterWinsResolver(ReplicaMetadata& metadata, Timestamp op_time);

    [[nodiscard]] std::optional<Value> resolve(const ResolveRequest& request) override;

    [[nodiscard]] std::size_t accepted() const noexcept { return accepted_; }
    [[nodiscard]] std::size_t rejected() const noexcept { return rejected_; }

private:
    ReplicaMetadata& metadata_;
    Timestamp op_time_;
    std::size_t accepted_ = 0;
    std::size_t rejected_ = 0;
};

/// Accepts a change iff the remote side has a time for its location that is
/// newer than the local one. Used when merging whole replica states.
class LAGER_DELTA_API StateResolver : public ConflictResolver {
public:
    StateResolver(const ReplicaMetadata& local, const ReplicaMetadata& remote);

    [[nodiscard]] std::optional<Value> resolve(const ResolveRequest& request) override;

private:
    const ReplicaMetadata& local_;
    const ReplicaMetadata& remote_;
};

} // namespace lager_delta
