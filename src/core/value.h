#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gridfill
{
// Dynamically shaped fill data: mappings of mappings of sequences of scalars.
//
// Composite payloads (Sequence, Mapping, Binary) are immutable once built and shared
// between copies, so binding the same collection into many loop scopes never copies it.
class Value
{
public:
    enum class Type : std::uint8_t
    {
        Null = 0,
        Bool,
        Number,
        String,
        Sequence,
        Mapping,
        Binary,
        Hyperlink,
    };

    using Sequence = std::vector<Value>;
    using Mapping = std::map<std::string, Value, std::less<>>;
    using Bytes = std::vector<std::uint8_t>;

    struct Link
    {
        std::string url;
        std::string label;
    };

    Value() = default;

    static Value Null() { return Value(); }
    static Value FromBool(bool b);
    static Value FromNumber(double d);
    static Value FromString(std::string s);
    static Value FromSequence(Sequence items);
    static Value FromMapping(Mapping members);
    static Value FromBinary(Bytes bytes);
    static Value FromHyperlink(std::string url, std::string label);

    Type GetType() const { return (Type)m_data.index(); }
    bool IsNull() const { return GetType() == Type::Null; }
    bool IsBool() const { return GetType() == Type::Bool; }
    bool IsNumber() const { return GetType() == Type::Number; }
    bool IsString() const { return GetType() == Type::String; }
    bool IsSequence() const { return GetType() == Type::Sequence; }
    bool IsMapping() const { return GetType() == Type::Mapping; }
    bool IsBinary() const { return GetType() == Type::Binary; }
    bool IsHyperlink() const { return GetType() == Type::Hyperlink; }

    // Typed accessors; calling one on the wrong type throws std::bad_variant_access.
    bool AsBool() const { return std::get<bool>(m_data); }
    double AsNumber() const { return std::get<double>(m_data); }
    const std::string& AsString() const { return std::get<std::string>(m_data); }
    const Sequence& AsSequence() const { return *std::get<std::shared_ptr<const Sequence>>(m_data); }
    const Mapping& AsMapping() const { return *std::get<std::shared_ptr<const Mapping>>(m_data); }
    const Bytes& AsBinary() const { return *std::get<std::shared_ptr<const Bytes>>(m_data); }
    const Link& AsHyperlink() const { return std::get<Link>(m_data); }

    // Member lookup on a Mapping. Returns nullptr for a missing key or a non-mapping value.
    const Value* Member(std::string_view name) const;

    // Text rendering used for concatenation, sort keys and cell output.
    std::string ToDisplayString() const;

private:
    std::variant<std::monostate,
                 bool,
                 double,
                 std::string,
                 std::shared_ptr<const Sequence>,
                 std::shared_ptr<const Mapping>,
                 std::shared_ptr<const Bytes>,
                 Link>
        m_data;
};

const char* TypeName(Value::Type t);

// Number formatting shared by display strings and formula parameter substitution:
// integral values print without a decimal point, others with up to 15 significant digits.
std::string FormatNumber(double d);

// Structural equality; numbers compare numerically, Null only equals Null.
bool ValuesEqual(const Value& a, const Value& b);

// Total order used by orderBy / groupOrder:
// Null first, then numbers numerically, then everything else by display string.
int CompareForSort(const Value& a, const Value& b, bool ignore_case = false);
} // namespace gridfill
