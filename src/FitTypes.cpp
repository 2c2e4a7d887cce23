#include "FitTypes.h"
#include "FitErrors.h"

#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace {
using namespace fit;

// Indexed by base type number (code & BASE_TYPE_NUMBER_MASK)
const BaseTypeInfo base_types[] = {
    { 0x00, "enum",    1, BK_UNSIGNED, 0xFF,                  false },
    { 0x01, "sint8",   1, BK_SIGNED,   0x7F,                  false },
    { 0x02, "uint8",   1, BK_UNSIGNED, 0xFF,                  false },
    { 0x83, "sint16",  2, BK_SIGNED,   0x7FFF,                true },
    { 0x84, "uint16",  2, BK_UNSIGNED, 0xFFFF,                true },
    { 0x85, "sint32",  4, BK_SIGNED,   0x7FFFFFFF,            true },
    { 0x86, "uint32",  4, BK_UNSIGNED, 0xFFFFFFFF,            true },
    { 0x07, "string",  1, BK_STRING,   0x00,                  false },
    { 0x88, "float32", 4, BK_FLOAT,    0xFFFFFFFF,            true },
    { 0x89, "float64", 8, BK_FLOAT,    0xFFFFFFFFFFFFFFFF,    true },
    { 0x0A, "uint8z",  1, BK_UNSIGNED, 0x00,                  false },
    { 0x8B, "uint16z", 2, BK_UNSIGNED, 0x0000,                true },
    { 0x8C, "uint32z", 4, BK_UNSIGNED, 0x00000000,            true },
    { 0x0D, "byte",    1, BK_UNSIGNED, 0xFF,                  false },
    { 0x8E, "sint64",  8, BK_SIGNED,   0x7FFFFFFFFFFFFFFF,    true },
    { 0x8F, "uint64",  8, BK_UNSIGNED, 0xFFFFFFFFFFFFFFFF,    true },
    { 0x90, "uint64z", 8, BK_UNSIGNED, 0x0000000000000000,    true }
};

const int num_base_types = sizeof(base_types) / sizeof(base_types[0]);

void CheckKind (ValueKind actual, ValueKind expected, const char *who)
{
    if (actual != expected) {
        std::string msg(who);
        msg += ": value has a different kind";
        throw std::logic_error(msg);
    }
}

};                                      // end anonymous namespace

namespace fit {

const BaseTypeInfo* LookupBaseType(uint8_t code)
{
    int num = code & BASE_TYPE_NUMBER_MASK;
    if (num >= num_base_types)
        return nullptr;
    // Only the endian flag may be missing, any other bits make the code
    // unknown
    const BaseTypeInfo &bt = base_types[num];
    if (code == bt.Code || code == (bt.Code & BASE_TYPE_NUMBER_MASK))
        return &bt;
    return nullptr;
}

int TypeSize(uint8_t code)
{
    const BaseTypeInfo *bt = LookupBaseType(code);
    if (! bt)
        throw BadTypeId ("TypeSize()", code);
    return bt->Size;
}


// .......................................................... FitScalar ....

FitScalar FitScalar::Sint(int64_t v)
{
    FitScalar s;
    s.m_Kind = VK_SINT;
    s.m_Sint = v;
    return s;
}

FitScalar FitScalar::Uint(uint64_t v)
{
    FitScalar s;
    s.m_Kind = VK_UINT;
    s.m_Uint = v;
    return s;
}

FitScalar FitScalar::Float(double v)
{
    FitScalar s;
    s.m_Kind = VK_FLOAT;
    s.m_Float = v;
    return s;
}

int64_t FitScalar::AsSint() const
{
    switch (m_Kind) {
    case VK_SINT: return m_Sint;
    case VK_UINT: return static_cast<int64_t>(m_Uint);
    case VK_FLOAT: return static_cast<int64_t>(m_Float);
    default:
        throw std::logic_error("FitScalar::AsSint: value is absent");
    }
}

uint64_t FitScalar::AsUint() const
{
    switch (m_Kind) {
    case VK_SINT: return static_cast<uint64_t>(m_Sint);
    case VK_UINT: return m_Uint;
    case VK_FLOAT: return static_cast<uint64_t>(m_Float);
    default:
        throw std::logic_error("FitScalar::AsUint: value is absent");
    }
}

double FitScalar::AsFloat() const
{
    switch (m_Kind) {
    case VK_SINT: return static_cast<double>(m_Sint);
    case VK_UINT: return static_cast<double>(m_Uint);
    case VK_FLOAT: return m_Float;
    default:
        throw std::logic_error("FitScalar::AsFloat: value is absent");
    }
}

bool FitScalar::operator==(const FitScalar &other) const
{
    if (m_Kind != other.m_Kind)
        return false;
    switch (m_Kind) {
    case VK_SINT: return m_Sint == other.m_Sint;
    case VK_UINT: return m_Uint == other.m_Uint;
    case VK_FLOAT: return m_Float == other.m_Float;
    default: return true;
    }
}

std::ostream& operator<<(std::ostream &o, const FitScalar &s)
{
    switch (s.Kind()) {
    case VK_SINT: o << s.AsSint(); break;
    case VK_UINT: o << s.AsUint(); break;
    case VK_FLOAT: o << s.AsFloat(); break;
    default: o << "NA"; break;
    }
    return o;
}


// ......................................................... FieldValue ....

FieldValue::FieldValue()
    : m_Kind (VK_ABSENT),
      m_FieldNumber (0),
      m_BaseType (0),
      m_IsDevField (false),
      m_DevIndex (0),
      m_Unresolved (false)
{
    // empty
}

FieldValue FieldValue::FromScalar(const FitScalar &s)
{
    FieldValue v;
    v.m_Kind = s.Kind();
    v.m_Scalar = s;
    return v;
}

FieldValue FieldValue::FromString(const std::string &s)
{
    FieldValue v;
    if (! s.empty()) {
        v.m_Kind = VK_STRING;
        v.m_String = s;
    }
    return v;
}

FieldValue FieldValue::FromBytes(const Buffer &b)
{
    FieldValue v;
    v.m_Kind = VK_BYTES;
    v.m_Bytes = b;
    return v;
}

FieldValue FieldValue::FromArray(const std::vector<FitScalar> &a)
{
    FieldValue v;
    v.m_Kind = VK_ARRAY;
    v.m_Array = a;
    return v;
}

const FitScalar& FieldValue::Scalar() const
{
    if (! IsScalar())
        throw std::logic_error("FieldValue::Scalar: value is not a scalar");
    return m_Scalar;
}

const std::string& FieldValue::String() const
{
    CheckKind(m_Kind, VK_STRING, "FieldValue::String");
    return m_String;
}

const Buffer& FieldValue::Bytes() const
{
    CheckKind(m_Kind, VK_BYTES, "FieldValue::Bytes");
    return m_Bytes;
}

const std::vector<FitScalar>& FieldValue::Array() const
{
    CheckKind(m_Kind, VK_ARRAY, "FieldValue::Array");
    return m_Array;
}

void FieldValue::SetOrigin(uint8_t field_number, uint8_t base_type)
{
    m_FieldNumber = field_number;
    m_BaseType = base_type;
    m_IsDevField = false;
    m_DevIndex = 0;
}

void FieldValue::SetDeveloperOrigin(uint8_t dev_index, uint8_t field_number, uint8_t base_type)
{
    m_FieldNumber = field_number;
    m_BaseType = base_type;
    m_IsDevField = true;
    m_DevIndex = dev_index;
}

std::ostream& operator<<(std::ostream &o, const FieldValue &v)
{
    switch (v.Kind()) {
    case VK_ABSENT:
        o << "NA";
        break;
    case VK_SINT:
    case VK_UINT:
    case VK_FLOAT:
        o << v.Scalar();
        break;
    case VK_STRING:
        o << '"' << v.String() << '"';
        break;
    case VK_BYTES: {
        std::ios::fmtflags saved = o.flags();
        char fill = o.fill();
        o << "#x" << std::hex << std::setfill('0');
        for (auto b : v.Bytes())
            o << std::setw(2) << static_cast<unsigned>(b);
        o.flags(saved);
        o.fill(fill);
        break;
    }
    case VK_ARRAY: {
        o << "[";
        const char *sep = "";
        for (const auto &s : v.Array()) {
            o << sep << s;
            sep = " ";
        }
        o << "]";
        break;
    }
    }
    return o;
}

};                                      // end namespace fit
