#pragma once
#include <stdint.h>
#include <iosfwd>
#include <limits>
#include <string>
#include <vector>

namespace fit {

/** Buffer holding FIT data, as expected by ReadFitMessages. */
typedef std::vector<unsigned char> Buffer;


// ....................................................... BaseTypeInfo ....

/** How the bytes of a base type are interpreted. */
enum BaseTypeKind {
    BK_UNSIGNED,
    BK_SIGNED,
    BK_FLOAT,
    BK_STRING
};

/** Description of a FIT base type, as defined by the FIT specification.
 * 'Invalid' is the bit pattern that marks a value as not present. */
struct BaseTypeInfo
{
    uint8_t Code;
    const char *Name;
    int Size;
    BaseTypeKind Kind;
    uint64_t Invalid;
    bool EndianAbility;
};

/** Flag set in base type codes that have multi-byte values. */
const uint8_t BASE_TYPE_ENDIAN_FLAG = 0x80;

/** Mask selecting the base type number out of a base type code. */
const uint8_t BASE_TYPE_NUMBER_MASK = 0x1F;

/** Return the description of 'code', or nullptr if this is not a known base
 * type.  A code written without its endian flag still resolves, codes with
 * the reserved bits (0x60) set, or an endian flag on a single byte type, do
 * not. */
const BaseTypeInfo* LookupBaseType(uint8_t code);

/** Return the byte width of 'code'.  Throws BadTypeId if the type is
 * unknown. */
int TypeSize(uint8_t code);


// ............................................................ FitType ....

/** Template class for defining FIT data types.  ID represents the type id, as
 * defined in the fit, BT is the base type name, such as an int32_t, NA is the
 * "not available" value for the type.  See below for the typedefs of the
 * integer FIT types.
 */
template <int ID, typename BT, uint64_t NA>
struct FitType
{
    template<int OID, typename OBT, uint64_t ONA>
    FitType(const FitType<OID, OBT, ONA>& other) {
        if (other.isNA())
            value = static_cast<BT>(NA);
        else
            value = static_cast<BT>(other.value);
    }

    FitType(const FitType &other) : value(other.value) { }
    FitType(BT v) : value (v) { }
    FitType() : value (static_cast<BT>(NA)) { }

    operator BT() const { return value; }

    FitType& operator= (const FitType &other) {
        value = other.value;
        return *this;
    }

    template<int OID, typename OBT, uint64_t ONA>
    FitType& operator=(const FitType<OID, OBT, ONA>& other) {
        if (other.isNA())
            value = static_cast<BT>(NA);
        else
            value = static_cast<BT>(other.value);
        return *this;
    }

    int TypeID() const { return ID; }
    bool isNA() const { return value == static_cast<BT>(NA); }

    BT value;
};

typedef FitType<0x00, uint8_t, 0xFF> FitEnum;
typedef FitType<0x01, int8_t, 0x7F> FitSint8;
typedef FitType<0x02, uint8_t, 0xFF> FitUint8;
typedef FitType<0x83, int16_t, 0x7FFF> FitSint16;
typedef FitType<0x84, uint16_t, 0xFFFF> FitUint16;
typedef FitType<0x85, int32_t, 0x7FFFFFFF> FitSint32;
typedef FitType<0x86, uint32_t, 0xFFFFFFFF> FitUint32;
typedef FitType<0x0A, uint8_t, 0x0> FitUint8z;
typedef FitType<0x8B, uint16_t, 0x0> FitUint16z;
typedef FitType<0x8C, uint32_t, 0x0> FitUint32z;
typedef FitType<0x0D, uint8_t, 0xFF> FitByte;
typedef FitType<0x8E, int64_t, 0x7FFFFFFFFFFFFFFF> FitSint64;
typedef FitType<0x8F, uint64_t, 0xFFFFFFFFFFFFFFFF> FitUint64;
typedef FitType<0x90, uint64_t, 0x0> FitUint64z;


// .......................................................... FitScalar ....

/** Kind of value held by a FitScalar or a FieldValue. */
enum ValueKind {
    VK_ABSENT,                          // invalid value, field not present
    VK_SINT,
    VK_UINT,
    VK_FLOAT,
    VK_STRING,
    VK_BYTES,                           // opaque bytes
    VK_ARRAY                            // sequence of FitScalar values
};

/** A single numeric value, either a whole field or one element of an
 * array field.  Holds VK_ABSENT, VK_SINT, VK_UINT or VK_FLOAT. */
class FitScalar
{
public:
    FitScalar() : m_Kind(VK_ABSENT), m_Uint(0) {}

    static FitScalar Sint(int64_t v);
    static FitScalar Uint(uint64_t v);
    static FitScalar Float(double v);

    ValueKind Kind() const { return m_Kind; }
    bool IsAbsent() const { return m_Kind == VK_ABSENT; }

    /** Return the value converted to the requested representation.  Throws
     * std::logic_error if the value is absent. */
    int64_t AsSint() const;
    uint64_t AsUint() const;
    double AsFloat() const;

    bool operator==(const FitScalar &other) const;
    bool operator!=(const FitScalar &other) const { return !(*this == other); }

private:
    ValueKind m_Kind;
    union {
        int64_t m_Sint;
        uint64_t m_Uint;
        double m_Float;
    };
};

std::ostream& operator<<(std::ostream &o, const FitScalar &s);


// ......................................................... FieldValue ....

/** A decoded field of a data message.  The value is one of: absent, a
 * signed, unsigned or floating point scalar, a string, an opaque byte
 * sequence or an array of scalars (each element possibly absent).
 *
 * The value also records where it came from: the field definition number,
 * the base type it was decoded with and, for developer fields, the
 * developer data index.
 */
class FieldValue
{
public:
    FieldValue();

    static FieldValue FromScalar(const FitScalar &s);
    static FieldValue FromString(const std::string &s);
    static FieldValue FromBytes(const Buffer &b);
    static FieldValue FromArray(const std::vector<FitScalar> &a);

    ValueKind Kind() const { return m_Kind; }
    bool IsAbsent() const { return m_Kind == VK_ABSENT; }
    bool IsScalar() const {
        return m_Kind == VK_SINT || m_Kind == VK_UINT || m_Kind == VK_FLOAT;
    }

    /** Accessors for the value, they throw std::logic_error when the value
     * is of a different kind. */
    const FitScalar& Scalar() const;
    const std::string& String() const;
    const Buffer& Bytes() const;
    const std::vector<FitScalar>& Array() const;

    int64_t AsSint() const { return Scalar().AsSint(); }
    uint64_t AsUint() const { return Scalar().AsUint(); }
    double AsFloat() const { return Scalar().AsFloat(); }

    uint8_t FieldNumber() const { return m_FieldNumber; }
    uint8_t BaseType() const { return m_BaseType; }
    bool IsDeveloperField() const { return m_IsDevField; }
    uint8_t DeveloperDataIndex() const { return m_DevIndex; }

    /** True for developer fields which had no field description when they
     * were decoded.  Their value is the raw bytes from the data message. */
    bool IsUnresolved() const { return m_Unresolved; }

    void SetOrigin(uint8_t field_number, uint8_t base_type);
    void SetDeveloperOrigin(uint8_t dev_index, uint8_t field_number, uint8_t base_type);
    void SetUnresolved(bool u) { m_Unresolved = u; }

private:
    ValueKind m_Kind;
    FitScalar m_Scalar;
    std::string m_String;
    Buffer m_Bytes;
    std::vector<FitScalar> m_Array;

    uint8_t m_FieldNumber;
    uint8_t m_BaseType;
    bool m_IsDevField;
    uint8_t m_DevIndex;
    bool m_Unresolved;
};

typedef std::vector<FieldValue> FieldList;

std::ostream& operator<<(std::ostream &o, const FieldValue &v);

/** Convert the field value 'v' to the FitType T.  Returns a NA value if the
 * field is absent or is not a scalar.  Values are converted with a
 * static_cast, as the FIT profile declares the type of each field.  A
 * floating point value which is NaN or does not fit into T is NA as well.
 */
template <typename T> T FieldAs (const FieldValue &v)
{
    typedef decltype(T().value) BT;
    if (! v.IsScalar())
        return T();
    switch (v.Kind()) {
    case VK_SINT: return T(static_cast<BT>(v.AsSint()));
    case VK_UINT: return T(static_cast<BT>(v.AsUint()));
    default: {
        double d = v.AsFloat();
        // written so that NaN fails the test
        if (! (d > static_cast<double>(std::numeric_limits<BT>::lowest()) - 1.0
               && d < static_cast<double>(std::numeric_limits<BT>::max()) + 1.0))
            return T();
        return T(static_cast<BT>(d));
    }
    }
}

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
