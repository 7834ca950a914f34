// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file codec.h
/// @brief PatchCodec: self-describing encoding of patches for storage and
///        transport, in binary (serialize()) or JSON (to_json()) form.
///
/// Operation nodes and conditions are written as {kind, data} surrogates.
/// The codec only knows the kinds registered with it, so a process can keep
/// several codecs with different vocabularies side by side:
///
/// @code
///   PatchCodec codec;
///   register_builtin_kinds(codec);
///
///   ByteBuffer bytes = codec.to_binary(patch);
///   Patch copy = codec.from_binary(bytes);
/// @endcode
///
/// Values inside the encoding are tagged wherever JSON would lose their
/// kind (64-bit and floating point numbers, maps, fixed arrays, records,
/// references), so the JSON form round-trips as exactly as the binary one.

#pragma once

#include "api.h"
#include "condition.h"
#include "operation.h"
#include "patch.h"
#include "serialization.h"
#include "value.h"

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lager_delta {

/// Unregistered kind, or a document that is not a valid encoding.
class LAGER_DELTA_API CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Kind name of a condition node ("compare", "and", ...).
[[nodiscard]] LAGER_DELTA_API std::string_view condition_kind(const Condition& cond) noexcept;

class LAGER_DELTA_API PatchCodec {
public:
    /// Encoders produce the data part of the surrogate; guards are written
    /// by the codec itself.
    using OperationEncoder = std::function<Value(const Operation&, const PatchCodec&)>;
    using OperationDecoder = std::function<OperationPtr(const Value& data, const PatchCodec&)>;
    using ConditionEncoder = std::function<Value(const Condition&, const PatchCodec&)>;
    using ConditionDecoder = std::function<ConditionPtr(const Value& data, const PatchCodec&)>;

    /// @p kind must match variant_name() of the nodes it encodes.
    PatchCodec& register_operation(std::string kind, OperationEncoder encoder, OperationDecoder decoder);

    /// @p kind must match condition_kind() of the nodes it encodes.
    PatchCodec& register_condition(std::string kind, ConditionEncoder encoder, ConditionDecoder decoder);

    [[nodiscard]] bool has_operation(std::string_view kind) const;
    [[nodiscard]] bool has_condition(std::string_view kind) const;

    // ----- whole patches -----

    /// @throws CodecError
    [[nodiscard]] Value encode(const Patch& patch) const;
    /// @throws CodecError
    [[nodiscard]] Patch decode(const Value& encoded) const;

    [[nodiscard]] ByteBuffer to_binary(const Patch& patch) const;
    [[nodiscard]] Patch from_binary(const ByteBuffer& bytes) const;

    [[nodiscard]] std::string to_json(const Patch& patch, bool compact = true) const;
    [[nodiscard]] Patch from_json(std::string_view text) const;

    // ----- building blocks for encoders -----

    [[nodiscard]] Value encode_operation(const OperationPtr& op) const;
    [[nodiscard]] OperationPtr decode_operation(const Value& encoded) const;

    [[nodiscard]] Value encode_condition(const ConditionPtr& cond) const;
    [[nodiscard]] ConditionPtr decode_condition(const Value& encoded) const;

    /// Kind-preserving, JSON-safe form of a document value.
    [[nodiscard]] static Value encode_value(const Value& v);
    [[nodiscard]] static Value decode_value(const Value& encoded);

private:
    struct OperationEntry {
        OperationEncoder encode;
        OperationDecoder decode;
    };
    struct ConditionEntry {
        ConditionEncoder encode;
        ConditionDecoder decode;
    };

    std::map<std::string, OperationEntry, std::less<>> operations_;
    std::map<std::string, ConditionEntry, std::less<>> conditions_;
};

/// Registers encoders for every built-in operation and condition kind.
LAGER_DELTA_API void register_builtin_kinds(PatchCodec& codec);

} // namespace lager_delta
