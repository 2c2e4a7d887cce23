#include "FitField.h"
#include "FitErrors.h"

#include <string.h>

namespace {
using namespace fit;

uint64_t ReadRaw(const unsigned char *data, int size, bool big_endian)
{
    uint64_t num = 0;
    if (big_endian) {
        for (int i = 0; i < size; ++i)
            num = (num << 8) | data[i];
    } else {
        for (int i = size - 1; i >= 0; --i)
            num = (num << 8) | data[i];
    }
    return num;
}

int64_t SignExtend(uint64_t raw, int size)
{
    if (size < 8) {
        int bits = size * 8;
        uint64_t sign = uint64_t(1) << (bits - 1);
        if (raw & sign)
            raw |= ~uint64_t(0) << bits;
    }
    return static_cast<int64_t>(raw);
}

double RawToFloat(uint64_t raw, int size)
{
    if (size == 4) {
        uint32_t r32 = static_cast<uint32_t>(raw);
        float f;
        memcpy(&f, &r32, sizeof(f));
        return f;
    } else {
        double d;
        memcpy(&d, &raw, sizeof(d));
        return d;
    }
}

};                                      // end anonymous namespace

namespace fit {

FitScalar DecodeScalar(const unsigned char *data, const BaseTypeInfo &bt, bool big_endian)
{
    uint64_t raw = ReadRaw(data, bt.Size, big_endian);

    // The invalid check is on the bit pattern, before any interpretation
    if (raw == bt.Invalid)
        return FitScalar();

    switch (bt.Kind) {
    case BK_SIGNED: return FitScalar::Sint(SignExtend(raw, bt.Size));
    case BK_FLOAT: return FitScalar::Float(RawToFloat(raw, bt.Size));
    default: return FitScalar::Uint(raw);
    }
}

FieldValue DecodeField(const unsigned char *data, const BaseTypeInfo &bt,
                       int count, bool big_endian)
{
    if (bt.Kind == BK_STRING) {
        std::string s;
        for (int i = 0; i < count && data[i] != 0; ++i)
            s.push_back(static_cast<char>(data[i]));
        return FieldValue::FromString(s);
    }

    if (count == 1)
        return FieldValue::FromScalar(DecodeScalar(data, bt, big_endian));

    std::vector<FitScalar> elements;
    elements.reserve(count);
    for (int i = 0; i < count; ++i)
        elements.push_back(DecodeScalar(data + i * bt.Size, bt, big_endian));
    return FieldValue::FromArray(elements);
}

FieldValue DecodeField(const unsigned char *data, uint8_t base_type,
                       int count, bool big_endian)
{
    const BaseTypeInfo *bt = LookupBaseType(base_type);
    if (! bt)
        throw BadTypeId ("DecodeField()", base_type);
    return DecodeField(data, *bt, count, big_endian);
}

};                                      // end namespace fit
