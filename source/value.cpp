// value.cpp - Value utilities, binary and JSON serialization

#include <lager_delta/value.h>
#include <lager_delta/serialization.h>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <climits>
#include <cstdio>
#include <cstring>    // for std::memcpy
#include <iomanip>    // for std::setprecision
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace lager_delta {

std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [k, v] : map) {
        keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, uint64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            std::string out = "{";
            bool first = true;
            for (const auto& key : sorted_keys(arg)) {
                if (!first) out += ", ";
                first = false;
                out += key + ": " + value_to_string(arg.find(key)->get());
            }
            return out + "}";
        } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueArray>) {
            std::string out = "[";
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) out += ", ";
                out += value_to_string(arg[i].get());
            }
            return out + "]";
        } else if constexpr (std::is_same_v<T, RecordBox>) {
            std::string out = arg->type + "{";
            bool first = true;
            for (const auto& key : sorted_keys(arg->fields)) {
                if (!first) out += ", ";
                first = false;
                out += key + ": " + value_to_string(arg->fields.find(key)->get());
            }
            return out + "}";
        } else if constexpr (std::is_same_v<T, ValueRef>) {
            if (!arg.target) return "nil";
            return "&" + value_to_string(arg.target->get());
        } else {
            return "null";
        }
    }, val.data);
}

std::string kind_name(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, int32_t>) return "int";
        else if constexpr (std::is_same_v<T, int64_t>) return "int64";
        else if constexpr (std::is_same_v<T, uint64_t>) return "uint64";
        else if constexpr (std::is_same_v<T, float>) return "float";
        else if constexpr (std::is_same_v<T, double>) return "double";
        else if constexpr (std::is_same_v<T, bool>) return "bool";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, ValueMap>) return "map";
        else if constexpr (std::is_same_v<T, ValueVector>) return "vector";
        else if constexpr (std::is_same_v<T, ValueArray>) return "array";
        else if constexpr (std::is_same_v<T, RecordBox>) return "record " + arg->type;
        else if constexpr (std::is_same_v<T, ValueRef>) {
            return arg.kind == RefKind::Owned ? "ref" : "poly";
        } else return "null";
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string pad(depth * 2, ' ');
    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueMap>) {
                for (const auto& key : sorted_keys(arg)) {
                    std::cout << pad << prefix << key << ":\n";
                    print_value(arg.find(key)->get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, RecordBox>) {
                std::cout << pad << prefix << "<" << arg->type << ">\n";
                for (const auto& key : sorted_keys(arg->fields)) {
                    std::cout << pad << "  " << key << ":\n";
                    print_value(arg->fields.find(key)->get(), "", depth + 2);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << pad << prefix << "[" << i << "]:\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueArray>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << pad << prefix << "(" << i << "):\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueRef>) {
                if (arg.target) {
                    std::cout << pad << prefix << "&\n";
                    print_value(arg.target->get(), "", depth + 1);
                } else {
                    std::cout << pad << prefix << "nil\n";
                }
            } else {
                std::cout << pad << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

// ============================================================
// Binary Serialization
// ============================================================

namespace {

// Type tags for binary format
enum class TypeTag : uint8_t {
    Null   = 0x00,
    Int32  = 0x01,
    Float  = 0x02,
    Double = 0x03,
    Bool   = 0x04,
    String = 0x05,
    Map    = 0x06,
    Vector = 0x07,
    Array  = 0x08,
    Int64  = 0x0A,
    UInt64 = 0x16,
    Record = 0x20,
    Ref    = 0x21,
};

// Fixed-width values are copied in native (little-endian) byte order.
class ByteWriter {
public:
    ByteBuffer buffer;

    void write_u8(uint8_t v) {
        buffer.push_back(v);
    }

    template <typename T>
    void write_raw(T v) {
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + sizeof(v));
        std::memcpy(buffer.data() + old_size, &v, sizeof(v));
    }

    void write_u32(uint32_t v) { write_raw(v); }

    void write_string(const std::string& s) {
        write_u32(static_cast<uint32_t>(s.size()));
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + s.size());
        std::memcpy(buffer.data() + old_size, s.data(), s.size());
    }
};

class ByteReader {
public:
    const uint8_t* data;
    std::size_t size;
    std::size_t pos = 0;

    ByteReader(const uint8_t* d, std::size_t s) : data(d), size(s) {}

    bool has_bytes(std::size_t n) const {
        return pos + n <= size;
    }

    uint8_t read_u8() {
        if (!has_bytes(1)) throw std::runtime_error("Unexpected end of buffer");
        return data[pos++];
    }

    template <typename T>
    T read_raw() {
        if (!has_bytes(sizeof(T))) throw std::runtime_error("Unexpected end of buffer");
        T v;
        std::memcpy(&v, data + pos, sizeof(v));
        pos += sizeof(v);
        return v;
    }

    uint32_t read_u32() { return read_raw<uint32_t>(); }

    std::string read_string() {
        uint32_t len = read_u32();
        if (!has_bytes(len)) throw std::runtime_error("Unexpected end of buffer");
        std::string s(reinterpret_cast<const char*>(data + pos), len);
        pos += len;
        return s;
    }
};

void serialize_value(ByteWriter& w, const Value& val);
Value deserialize_value(ByteReader& r);

void serialize_entries(ByteWriter& w, const ValueMap& map) {
    w.write_u32(static_cast<uint32_t>(map.size()));
    for (const auto& key : sorted_keys(map)) {
        w.write_string(key);
        serialize_value(w, map.find(key)->get());
    }
}

ValueMap deserialize_entries(ByteReader& r) {
    uint32_t count = r.read_u32();
    auto transient = ValueMap{}.transient();
    for (uint32_t i = 0; i < count; ++i) {
        std::string key = r.read_string();
        Value val = deserialize_value(r);
        transient.set(std::move(key), ValueBox{std::move(val)});
    }
    return transient.persistent();
}

void serialize_value(ByteWriter& w, const Value& val) {
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Null));
        } else if constexpr (std::is_same_v<T, int32_t>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Int32));
            w.write_raw(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Int64));
            w.write_raw(arg);
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::UInt64));
            w.write_raw(arg);
        } else if constexpr (std::is_same_v<T, float>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Float));
            w.write_raw(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Double));
            w.write_raw(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Bool));
            w.write_u8(arg ? 0x01 : 0x00);
        } else if constexpr (std::is_same_v<T, std::string>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::String));
            w.write_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Map));
            serialize_entries(w, arg);
        } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueArray>) {
            w.write_u8(static_cast<uint8_t>(std::is_same_v<T, ValueVector> ? TypeTag::Vector
                                                                            : TypeTag::Array));
            w.write_u32(static_cast<uint32_t>(arg.size()));
            for (std::size_t i = 0; i < arg.size(); ++i) {
                serialize_value(w, *arg[i]);
            }
        } else if constexpr (std::is_same_v<T, RecordBox>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Record));
            w.write_string(arg->type);
            serialize_entries(w, arg->fields);
        } else if constexpr (std::is_same_v<T, ValueRef>) {
            w.write_u8(static_cast<uint8_t>(TypeTag::Ref));
            w.write_u8(static_cast<uint8_t>(arg.kind));
            w.write_u8(arg.target ? 0x01 : 0x00);
            if (arg.target) {
                serialize_value(w, arg.target->get());
            }
        }
    }, val.data);
}

Value deserialize_value(ByteReader& r) {
    TypeTag tag = static_cast<TypeTag>(r.read_u8());

    switch (tag) {
        case TypeTag::Null:
            return Value{};

        case TypeTag::Int32:
            return Value{r.read_raw<int32_t>()};

        case TypeTag::Int64:
            return Value{r.read_raw<int64_t>()};

        case TypeTag::UInt64:
            return Value{r.read_raw<uint64_t>()};

        case TypeTag::Float:
            return Value{r.read_raw<float>()};

        case TypeTag::Double:
            return Value{r.read_raw<double>()};

        case TypeTag::Bool:
            return Value{r.read_u8() != 0};

        case TypeTag::String:
            return Value{r.read_string()};

        case TypeTag::Map:
            return Value{deserialize_entries(r)};

        case TypeTag::Vector: {
            uint32_t count = r.read_u32();
            auto transient = ValueVector{}.transient();
            for (uint32_t i = 0; i < count; ++i) {
                transient.push_back(ValueBox{deserialize_value(r)});
            }
            return Value{transient.persistent()};
        }

        case TypeTag::Array: {
            uint32_t count = r.read_u32();
            std::vector<ValueBox> temp;
            temp.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                temp.emplace_back(deserialize_value(r));
            }
            return Value{ValueArray(std::make_move_iterator(temp.begin()),
                                    std::make_move_iterator(temp.end()))};
        }

        case TypeTag::Record: {
            std::string type = r.read_string();
            return Value::make_record(std::move(type), deserialize_entries(r));
        }

        case TypeTag::Ref: {
            auto kind = static_cast<RefKind>(r.read_u8());
            if (kind != RefKind::Owned && kind != RefKind::Polymorphic) {
                throw std::runtime_error("Unknown reference kind: " +
                                         std::to_string(static_cast<int>(kind)));
            }
            ValueRef ref{kind, std::nullopt};
            if (r.read_u8() != 0) {
                ref.target = ValueBox{deserialize_value(r)};
            }
            return Value{std::move(ref)};
        }

        default:
            throw std::runtime_error("Unknown type tag: " + std::to_string(static_cast<int>(tag)));
    }
}

} // anonymous namespace

ByteBuffer serialize(const Value& val) {
    ByteWriter w;
    w.buffer.reserve(64);
    serialize_value(w, val);
    return std::move(w.buffer);
}

Value deserialize(const ByteBuffer& buffer) {
    return deserialize(buffer.data(), buffer.size());
}

Value deserialize(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        return Value{};
    }
    ByteReader r(data, size);
    Value result = deserialize_value(r);
    if (r.pos != size) {
        throw std::runtime_error("Trailing bytes after value: " + std::to_string(size - r.pos));
    }
    return result;
}

std::size_t serialized_size(const Value& val) {
    return serialize(val).size();
}

// ============================================================
// JSON Serialization / Deserialization Implementation
// ============================================================

namespace {

std::string json_escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level);

void object_to_json(const ValueMap& map, std::ostringstream& oss, bool compact, int indent_level) {
    if (map.size() == 0) {
        oss << "{}";
        return;
    }
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    oss << "{" << newline;
    bool first = true;
    for (const auto& key : sorted_keys(map)) {
        if (!first) oss << "," << newline;
        first = false;
        oss << child_indent << "\"" << json_escape_string(key) << "\":" << space_after_colon;
        to_json_impl(map.find(key)->get(), oss, compact, indent_level + 1);
    }
    oss << newline << indent << "}";
}

template <typename Seq>
void sequence_to_json(const Seq& seq, std::ostringstream& oss, bool compact, int indent_level) {
    if (seq.size() == 0) {
        oss << "[]";
        return;
    }
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";

    oss << "[" << newline;
    for (std::size_t i = 0; i < seq.size(); ++i) {
        if (i > 0) oss << "," << newline;
        oss << child_indent;
        to_json_impl(*seq[i], oss, compact, indent_level + 1);
    }
    oss << newline << indent << "]";
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int32_t> ||
                             std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, uint64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, float>) {
            oss << std::setprecision(7) << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << std::setprecision(15) << arg;
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            object_to_json(arg, oss, compact, indent_level);
        } else if constexpr (std::is_same_v<T, RecordBox>) {
            object_to_json(arg->fields, oss, compact, indent_level);
        } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueArray>) {
            sequence_to_json(arg, oss, compact, indent_level);
        } else if constexpr (std::is_same_v<T, ValueRef>) {
            if (arg.target) {
                to_json_impl(arg.target->get(), oss, compact, indent_level);
            } else {
                oss << "null";
            }
        }
    }, val.data);
}

// ============================================================
// JSON Reader
// ============================================================

/// Recursive-descent reader over a string_view. Integers that fit in 32
/// bits become int32, larger ones int64, anything with a fraction or an
/// exponent (or out of int64 range) double.
class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value read_document() {
        skip_space();
        if (at_end()) fail("empty input");
        Value root = read_value(0);
        skip_space();
        if (!at_end()) fail("trailing data");
        return root;
    }

private:
    static constexpr int max_depth = 512;

    std::string_view text_;
    std::size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON: " + what + " at offset " + std::to_string(pos_));
    }

    bool at_end() const { return pos_ >= text_.size(); }
    char current() const { return at_end() ? '\0' : text_[pos_]; }

    void skip_space() {
        while (!at_end()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    bool take(char c) {
        skip_space();
        if (current() != c) return false;
        ++pos_;
        return true;
    }

    void require(char c) {
        if (!take(c)) fail(std::string("expected '") + c + "'");
    }

    bool take_word(std::string_view word) {
        if (text_.substr(pos_, word.size()) != word) return false;
        pos_ += word.size();
        return true;
    }

    Value read_value(int depth) {
        if (depth > max_depth) fail("nesting too deep");
        skip_space();
        switch (current()) {
        case '{': return read_object(depth);
        case '[': return read_array(depth);
        case '"': return Value{read_string()};
        case 't': if (take_word("true")) return Value{true}; break;
        case 'f': if (take_word("false")) return Value{false}; break;
        case 'n': if (take_word("null")) return Value{}; break;
        default:
            if (current() == '-' || std::isdigit(static_cast<unsigned char>(current()))) {
                return read_number();
            }
        }
        fail("unexpected character");
    }

    Value read_object(int depth) {
        require('{');
        auto entries = ValueMap{}.transient();
        if (take('}')) return Value{entries.persistent()};
        do {
            skip_space();
            if (current() != '"') fail("expected a string key");
            std::string key = read_string();
            require(':');
            entries.set(std::move(key), ValueBox{read_value(depth + 1)});
        } while (take(','));
        require('}');
        return Value{entries.persistent()};
    }

    Value read_array(int depth) {
        require('[');
        auto items = ValueVector{}.transient();
        if (take(']')) return Value{items.persistent()};
        do {
            items.push_back(ValueBox{read_value(depth + 1)});
        } while (take(','));
        require(']');
        return Value{items.persistent()};
    }

    uint32_t read_hex4() {
        if (pos_ + 4 > text_.size()) fail("truncated \\u escape");
        uint32_t code = 0;
        auto [end, ec] = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, code, 16);
        if (ec != std::errc{} || end != text_.data() + pos_ + 4) fail("invalid \\u escape");
        pos_ += 4;
        return code;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string read_string() {
        ++pos_; // opening quote
        std::string out;
        while (!at_end()) {
            char c = text_[pos_++];
            if (c == '"') return out;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) break;
            char esc = text_[pos_++];
            switch (esc) {
            case '"': case '\\': case '/': out += esc; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                uint32_t cp = read_hex4();
                // surrogate pair
                if (cp >= 0xD800 && cp < 0xDC00 && take_word("\\u")) {
                    uint32_t low = read_hex4();
                    if (low < 0xDC00 || low >= 0xE000) fail("unpaired surrogate");
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                }
                append_utf8(out, cp);
                break;
            }
            default:
                fail(std::string("invalid escape \\") + esc);
            }
        }
        fail("unterminated string");
    }

    Value read_number() {
        const std::size_t start = pos_;
        bool integral = true;
        if (current() == '-') ++pos_;
        while (!at_end()) {
            char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' || ((c == '+' || c == '-') && !integral)) {
                integral = false;
                ++pos_;
            } else {
                break;
            }
        }
        const char* first = text_.data() + start;
        const char* last = text_.data() + pos_;

        if (integral) {
            int64_t n = 0;
            auto [end, ec] = std::from_chars(first, last, n);
            if (ec == std::errc{} && end == last) {
                if (n >= INT32_MIN && n <= INT32_MAX) return Value{static_cast<int32_t>(n)};
                return Value{n};
            }
            if (ec != std::errc::result_out_of_range) fail("malformed number");
        }
        double d = 0;
        auto [end, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || end != last) fail("malformed number");
        return Value{d};
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(const std::string& json_str, std::string* error_out) {
    try {
        return JsonReader(json_str).read_document();
    } catch (const std::runtime_error& e) {
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

// ============================================================
// Explicit Template Instantiations
//
// Matches the extern template declarations in value.h.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;

} // namespace lager_delta
