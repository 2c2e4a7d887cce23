#pragma once
#include <stdint.h>
#include <stddef.h>

namespace fit {

/** Update the FIT CRC-16 value 'crc' with one more byte. */
uint16_t Crc16Update(uint16_t crc, unsigned char byte);

/** Compute the FIT CRC-16 of 'len' bytes at 'data', starting from 'crc'.
 * The CRC of a block which ends with its own little endian CRC is 0. */
uint16_t Crc16(const unsigned char *data, size_t len, uint16_t crc = 0);

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
