// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builder.h
/// @brief PatchBuilder: fluent construction of operation trees, checked
///        against the shape of the value they will be applied to.
///
/// Usage:
/// @code
///   PatchBuilder b(config, &registry);
///   b.root().field("Name").put("v2");
///   b.root().field("Options").insert(1, "c").remove(1);
///   b.at("/Limits/max").set(10, 20).only_if(cond::eq("/Mode", "edit"));
///   b.add_condition("Value > 5");
///   Patch p = b.build();
/// @endcode
///
/// Every step looks at the shape value given to the constructor and throws
/// PathError when it does not fit (a field step on a map, an index past the
/// end, a field the registry does not declare). Old values recorded in the
/// operations come from the shape, so a built patch applies checked
/// against that shape.
///
/// Sequence positions passed to index(), insert(), remove() and
/// move_element() are positions in the sequence as already edited by this
/// builder, i.e. the same positions a JSON Patch would use. build()
/// converts them back to source coordinates.

#pragma once

#include "api.h"
#include "clock.h"
#include "condition.h"
#include "operation.h"
#include "patch.h"
#include "path.h"
#include "type_registry.h"
#include "value.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace lager_delta {

class LAGER_DELTA_API PatchBuilder {
    struct Draft;

public:
    /// A position in the shape. Cheap to copy; valid while the builder lives.
    class LAGER_DELTA_API Node {
    public:
        // ----- navigation -----

        /// Field of a record. @throws PathError
        [[nodiscard]] Node field(const std::string& name) const;

        /// Entry of a map; the key need not exist yet. @throws PathError
        [[nodiscard]] Node key(const std::string& key) const;

        /// Element of a sequence or slot of a fixed array. @throws PathError
        [[nodiscard]] Node index(std::size_t i) const;

        /// Target of an owned reference or polymorphic container. @throws PathError
        [[nodiscard]] Node elem() const;

        /// One step chosen from the shape: references are entered first,
        /// then the part selects a field, key or index. @throws PathError
        [[nodiscard]] Node step(const PathElement& part) const;

        [[nodiscard]] const Path& path() const noexcept { return path_; }
        [[nodiscard]] const Value& shape() const noexcept;

        /// Element count, counting this builder's edits for sequences.
        [[nodiscard]] std::size_t size() const;

        // ----- whole-value actions -----

        Node& set(Value old_value, Value new_value);

        /// set() with the old value taken from the shape.
        Node& put(Value new_value);

        Node& test(Value expected);

        /// Store the value found at @p from (absolute, in the shape).
        Node& copy(std::string_view from);

        /// Like copy(), then remove @p from.
        Node& move(std::string_view from);

        Node& log(std::string message);

        // ----- sequence actions -----

        Node& insert(std::size_t position, Value value);
        Node& insert_copy(std::size_t position, std::string_view from);
        Node& remove(std::size_t position);
        Node& move_element(std::size_t from, std::size_t to);

        // ----- map actions -----

        Node& add_entry(const std::string& key, Value value);
        Node& remove_entry(const std::string& key);

        // ----- guards -----

        /// Local condition, evaluated against this node's current value.
        Node& when(ConditionPtr condition);

        /// Skip this node unless @p condition holds for the root.
        Node& only_if(ConditionPtr condition);

        /// Skip this node when @p condition holds for the root.
        Node& unless(ConditionPtr condition);

    private:
        friend class PatchBuilder;
        Node(PatchBuilder* owner, Draft* draft, Path path)
            : owner_(owner), draft_(draft), path_(std::move(path)) {}

        PatchBuilder* owner_;
        Draft* draft_;
        Path path_;
    };

    explicit PatchBuilder(Value shape, const TypeRegistry* registry = nullptr);
    ~PatchBuilder();

    PatchBuilder(PatchBuilder&&) noexcept;
    PatchBuilder& operator=(PatchBuilder&&) noexcept;
    PatchBuilder(const PatchBuilder&) = delete;
    PatchBuilder& operator=(const PatchBuilder&) = delete;

    [[nodiscard]] Node root();

    /// Node reached by step()ing through @p path. @throws PathError
    [[nodiscard]] Node at(const Path& path);
    [[nodiscard]] Node at(std::string_view path) { return at(parse_path(path)); }

    /// Attach @p condition as the local condition of the deepest node that
    /// lies on the longest common prefix of every path it references; the
    /// prefix is stripped from its paths.
    PatchBuilder& add_condition(ConditionPtr condition);

    /// @throws ConditionParseError
    PatchBuilder& add_condition(std::string_view expression);

    /// Global condition of the built patch (evaluated against the root).
    PatchBuilder& condition(ConditionPtr condition);
    PatchBuilder& strict(bool strict);
    PatchBuilder& timestamp(Timestamp ts);

    [[nodiscard]] const Value& shape() const noexcept { return shape_; }
    [[nodiscard]] const TypeRegistry* registry() const noexcept { return registry_; }

    /// The patch built so far; empty containers are pruned. The builder
    /// stays usable.
    [[nodiscard]] Patch build() const;

private:
    OperationPtr build_draft(const Draft& draft) const;
    OperationPtr build_sequence(const Draft& draft) const;

    Value shape_;
    const TypeRegistry* registry_ = nullptr;
    std::unique_ptr<Draft> root_;
    ConditionPtr condition_;
    bool strict_ = true;
    std::optional<Timestamp> timestamp_;
};

} // namespace lager_delta
