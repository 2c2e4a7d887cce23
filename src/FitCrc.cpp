#include "FitCrc.h"

namespace fit {

uint16_t Crc16Update(uint16_t crc, unsigned char byte)
{
    static const uint16_t crc_table[16] = {
        0x0000, 0xCC01, 0xD801, 0x1400, 0xF001, 0x3C00, 0x2800, 0xE401,
        0xA001, 0x6C00, 0x7800, 0xB401, 0x5000, 0x9C01, 0x8801, 0x4400
    };

    // compute checksum of lower four bits of byte
    uint16_t tmp = crc_table[crc & 0xF];
    crc = (crc >> 4) & 0x0FFF;
    crc = crc ^ tmp ^ crc_table[byte & 0xF];
    // now compute checksum of upper four bits of byte
    tmp = crc_table[crc & 0xF];
    crc = (crc >> 4) & 0x0FFF;
    crc = crc ^ tmp ^ crc_table[(byte >> 4) & 0xF];
    return crc;
}

uint16_t Crc16(const unsigned char *data, size_t len, uint16_t crc)
{
    while (len--)
        crc = Crc16Update(crc, *data++);
    return crc;
}

};                                      // end namespace fit
