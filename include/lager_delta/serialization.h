// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief Binary and JSON encodings of Value.
///
/// @code
///   Value data = Value::map({{"key", "value"}});
///   ByteBuffer buffer = serialize(data);
///   Value restored = deserialize(buffer);
///
///   std::string json = to_json(data, false);  // pretty-printed
///   Value parsed = from_json(json);
/// @endcode
///
/// Binary Format Type Tags (1 byte):
///   0x00 = null (monostate)
///   0x01 = int32 (4 bytes, little-endian)
///   0x02 = float (4 bytes, IEEE 754)
///   0x03 = double (8 bytes, IEEE 754)
///   0x04 = bool (1 byte: 0x00=false, 0x01=true)
///   0x05 = string (4-byte length + UTF-8 data)
///   0x06 = map (4-byte count + entries, keys ascending)
///   0x07 = vector (4-byte count + elements)
///   0x08 = array (4-byte count + elements)
///   0x0A = int64 (8 bytes, little-endian)
///   0x16 = uint64 (8 bytes, little-endian)
///   0x20 = record (type string + 4-byte count + entries, keys ascending)
///   0x21 = ref (1 byte kind + 1 byte present flag + target if present)
///
/// Map and record keys are written in ascending order, so equal values
/// always produce identical bytes.

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <string>
#include <vector>

namespace lager_delta {

// ============================================================
// Binary Serialization
// ============================================================

/// Serialize Value to binary buffer
LAGER_DELTA_API ByteBuffer serialize(const Value& val);

/// Deserialize Value from binary buffer
/// @throws std::runtime_error on invalid data format
LAGER_DELTA_API Value deserialize(const ByteBuffer& buffer);

/// Deserialize from raw pointer and size
LAGER_DELTA_API Value deserialize(const uint8_t* data, std::size_t size);

/// Number of bytes serialize() would produce
LAGER_DELTA_API std::size_t serialized_size(const Value& val);

// ============================================================
// JSON Serialization
// ============================================================

/// Convert Value to JSON string
/// @param compact If true, produce minimal output; if false, pretty-print
///
/// Records are written as objects of their fields, references as their
/// target (or null), fixed arrays as arrays. The record type name and the
/// reference kind are not represented; PatchCodec carries them when needed.
LAGER_DELTA_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
LAGER_DELTA_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace lager_delta
