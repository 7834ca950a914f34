// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file replica.h
/// @brief Replica: a value replicated across nodes, kept convergent with
///        per-location timestamps.
///
/// Usage:
/// @code
///   Replica a("node-a", initial);
///   Replica b("node-b", initial);
///
///   Delta d = a.edit([](const Value& v) { return v.set("title", "draft 2"); });
///   b.apply_delta(d);          // last writer wins per location
///
///   a.merge(b);                // whole-state merge, newer location wins
/// @endcode
///
/// Every method locks the replica; merge() locks both replicas. edit()
/// releases the lock while its callback runs.

#pragma once

#include "api.h"
#include "clock.h"
#include "patch.h"
#include "resolvers.h"
#include "type_registry.h"
#include "value.h"

#include <functional>
#include <mutex>
#include <string>

namespace lager_delta {

/// A change produced by one replica, to be applied by the others.
struct Delta {
    Patch patch;
    Timestamp timestamp;

    [[nodiscard]] bool empty() const noexcept { return patch.is_empty(); }
};

class LAGER_DELTA_API Replica {
public:
    using EditFn = std::function<Value(const Value&)>;

    Replica(std::string node, Value initial, const TypeRegistry* registry = nullptr,
            LogicalClock::WallSource wall_source = {});

    Replica(const Replica&) = delete;
    Replica& operator=(const Replica&) = delete;

    [[nodiscard]] const std::string& node() const noexcept { return node_; }

    /// Snapshot of the current value.
    [[nodiscard]] Value view() const;

    [[nodiscard]] ReplicaMetadata metadata() const;

    /// Replace the value with fn(current) and return the change as a delta.
    /// An unchanged value yields an empty delta and no new timestamp.
    /// fn runs without the lock held and may call back into this replica;
    /// if the value changes meanwhile, the edit is replayed on the newer value.
    /// @throws DiffError
    Delta edit(const EditFn& fn);

    /// Apply an already built patch locally and return it as a delta.
    Delta commit(const Patch& patch);

    /// Apply a remote delta; locations written later here win.
    /// @return false when the delta is empty or could not be applied
    bool apply_delta(const Delta& delta);

    /// Fold the state of @p other in; per location, the side with the newer
    /// timestamp wins.
    /// @return false when nothing changed or the merge failed
    bool merge(const Replica& other);

private:
    void record_locked(const Patch& patch, const Timestamp& ts);

    std::string node_;
    const TypeRegistry* registry_;
    LogicalClock clock_;
    mutable std::mutex mutex_;
    Value value_;
    ReplicaMetadata metadata_;
};

} // namespace lager_delta
