// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file clock.h
/// @brief Hybrid logical clock used to order operations across replicas.

#pragma once

#include "api.h"

#include <compare>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace lager_delta {

/// (wall, logical, node), totally ordered in that order.
struct Timestamp {
    int64_t wall = 0;       ///< milliseconds since the epoch
    uint32_t logical = 0;   ///< tie-breaker within one wall tick
    std::string node;       ///< origin replica

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    [[nodiscard]] bool is_zero() const noexcept { return wall == 0 && logical == 0 && node.empty(); }
};

[[nodiscard]] LAGER_DELTA_API std::string to_string(const Timestamp& ts);

/// Hybrid logical clock.
///
/// now() never returns the same timestamp twice and never goes backwards,
/// even when the wall source does. update() folds a remote timestamp in so
/// that every later now() is after it.
class LAGER_DELTA_API LogicalClock {
public:
    using WallSource = std::function<int64_t()>;

    /// @param wall_source defaults to the system clock in milliseconds
    explicit LogicalClock(std::string node, WallSource wall_source = {});

    [[nodiscard]] Timestamp now();

    /// Timestamp for the first of @p count consecutive ids (logical,
    /// logical + 1, ...); the next now() is after all of them.
    [[nodiscard]] Timestamp reserve(uint32_t count);
    Timestamp update(const Timestamp& remote);

    [[nodiscard]] Timestamp last() const;
    [[nodiscard]] const std::string& node() const noexcept { return node_; }

private:
    std::string node_;
    WallSource wall_source_;
    mutable std::mutex mutex_;
    int64_t wall_ = 0;
    uint32_t logical_ = 0;
};

} // namespace lager_delta
