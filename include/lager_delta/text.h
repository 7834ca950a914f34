// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file text.h
/// @brief Collaborative text: runs of characters, each character placed
///        after the one it was typed behind.
///
/// Every character has its own id: the run id with its offset added to the
/// logical counter. A character follows its predecessor; characters typed
/// after the same predecessor are ordered newest first. Removed characters
/// stay as tombstones so later inserts can still find their predecessor.
/// merge() is a union of characters (removal wins), so two replicas that
/// exchanged their states read the same string.
///
/// @code
///   LogicalClock clock_a("a"), clock_b("b");
///   Text a = Text{}.insert(0, "Hello", clock_a);
///   Text b = a;
///
///   a = a.insert(5, " World", clock_a);
///   b = b.insert(2, "!", clock_b);
///
///   Text both = a.merge(b);      // "He!llo World", same as b.merge(a)
/// @endcode
///
/// Positions and lengths count bytes of the visible text.

#pragma once

#include "api.h"
#include "clock.h"
#include "type_registry.h"
#include "value.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lager_delta {

/// Out of range position, or a value that is not an encoded text.
class LAGER_DELTA_API TextError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TextRun {
    Timestamp id;          ///< id of the first character
    std::string value;
    Timestamp prev;        ///< character this run follows; zero at the start
    bool deleted = false;

    bool operator==(const TextRun&) const = default;
};

class LAGER_DELTA_API Text {
public:
    Text() = default;

    /// Orders @p runs, folds duplicated ids and joins runs that continue
    /// each other.
    explicit Text(const std::vector<TextRun>& runs);

    /// @throws TextError when @p pos is past the end
    [[nodiscard]] Text insert(std::size_t pos, std::string_view value, LogicalClock& clock) const;

    /// Tombstones @p length characters starting at @p pos.
    /// @throws TextError when the range is past the end
    [[nodiscard]] Text erase(std::size_t pos, std::size_t length) const;

    [[nodiscard]] Text merge(const Text& other) const;

    /// Visible text.
    [[nodiscard]] std::string str() const;
    [[nodiscard]] std::size_t size() const;

    /// Runs in text order, tombstones included.
    [[nodiscard]] const std::vector<TextRun>& runs() const noexcept { return runs_; }

    /// Id of the newest character, zero for an empty text.
    [[nodiscard]] Timestamp latest() const;

    /// Record "Text" holding a sequence of "TextRun" records keyed by "id".
    [[nodiscard]] Value to_value() const;

    /// @throws TextError
    [[nodiscard]] static Text from_value(const Value& v);

    bool operator==(const Text&) const = default;

private:
    std::vector<TextRun> runs_;
};

/// Declares "Text" and "TextRun" (keyed by "id") so texts inside documents
/// diff as keyed sequences.
LAGER_DELTA_API void register_text_types(TypeRegistry& registry);

} // namespace lager_delta
