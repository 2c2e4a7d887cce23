#pragma once

#include <stdint.h>
#include <iosfwd>

namespace FitDecode {

/** Print a hex dump of 'data' to the stream 'o'.  Each line holds 16 bytes:
 * the address, the character representation and the hex representation.
 * Addresses start at 'base', so a dump of a record can show the record's
 * position in the FIT file.
 */
void DumpData (const unsigned char *data, int size, std::ostream &o, uint32_t base = 0);

/** Put the current time on the output stream o. */
void PutTimestamp(std::ostream &o);


};                                      // end namespace FitDecode

/*
    Local Variables:
    mode: c++
    End:
*/
