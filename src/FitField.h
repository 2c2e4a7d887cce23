#pragma once
#include "FitTypes.h"

namespace fit {

/** Decode a single value of base type 'bt' from the bytes at 'data', which
 * must hold at least bt.Size bytes.  Multi-byte values are read as big
 * endian when 'big_endian' is true.  A value equal to the invalid value of
 * the base type is returned as absent. */
FitScalar DecodeScalar(const unsigned char *data, const BaseTypeInfo &bt, bool big_endian);

/** Decode a field holding 'count' elements of base type 'bt' from 'data'
 * (count * bt.Size bytes).
 *
 * Strings stop at the first NUL byte or after 'count' characters; an empty
 * string is absent.  Other types produce a scalar when 'count' is 1 and an
 * array otherwise, with each element checked against the invalid value on
 * its own.
 *
 * The returned value has no origin set, see FieldValue::SetOrigin().
 */
FieldValue DecodeField(const unsigned char *data, const BaseTypeInfo &bt,
                       int count, bool big_endian);

/** Same as above, but looks up 'base_type' first.  Throws BadTypeId if the
 * base type is not known. */
FieldValue DecodeField(const unsigned char *data, uint8_t base_type,
                       int count, bool big_endian);

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
