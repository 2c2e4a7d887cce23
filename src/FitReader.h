#pragma once
#include "FitFile.h"

#include <iosfwd>
#include <set>
#include <utility>

namespace fit {

// ...................................................... FitDataStream ....

/** Reads the bytes of one FIT file from a ByteSource, keeping count of the
 * record bytes read against the data size from the header and computing
 * the CRC of everything read so far. */
class FitDataStream {
public:
    explicit FitDataStream(ByteSource *src);

    /** Put back a byte which was already taken from the source; it will be
     * returned by the next read. */
    void Unread(unsigned char byte);

    /** Read header bytes, these don't count against the data size. */
    void ReadHeader(unsigned char *buf, int len);

    void SetDataSize(uint32_t size) { m_Pos = 0; m_Limit = size; }
    uint32_t DataSize() const { return m_Limit; }
    uint32_t Position() const { return m_Pos; }

    /** Read record bytes.  Throws BadFitFile with E_DATA_SIZE if this would
     * go past the data size and with E_EOF if the source runs out. */
    void ReadBytes(unsigned char *buf, int len);
    unsigned char ReadByte();

    /** True when all record bytes were read. */
    bool IsEof() const { return m_Pos >= m_Limit; }

    /** Read the two byte file CRC which follows the records.  The CRC bytes
     * themselves are not added to Crc(). */
    uint16_t ReadFileCrc();

    /** CRC of all bytes read so far. */
    uint16_t Crc() const { return m_Crc; }

private:
    void Fill(unsigned char *buf, int len, bool update_crc);

    ByteSource *m_Source;
    int m_Pending;
    uint32_t m_Pos;
    uint32_t m_Limit;
    uint16_t m_Crc;
};


// .......................................................... FitReader ....

/** Decodes the records of one FIT file: definition messages go into the
 * definition table, data messages are decoded and passed to the builder.
 * Developer data id and field description messages also update the
 * developer field registry, before the builder sees them.
 */
class FitReader {
public:
    FitReader(FitDataStream *stream, FitBuilder *b, const ReaderOptions &options);
    ~FitReader();

    /** Read records until the data size of the file is consumed. */
    void ReadMessages();

    /** Read a single record. */
    void ReadRecord();

private:
    FitReader(const FitReader&) = delete;
    FitReader& operator=(const FitReader&) = delete;

    void ReadMessageDef (unsigned char header);
    void ReadDataMessage (int local, bool compressed, unsigned time_offset);
    void DecodeFields (const MessageDef &mdef, FitMessage &msg);
    FieldValue DecodeNativeField (const MessageDef &mdef, const FieldDef &f,
                                  const unsigned char *data);
    FieldValue DecodeDevField (const MessageDef &mdef, const DevFieldDef &f,
                               const unsigned char *data);
    void ProcessDeveloperMessage (const FitMessage &msg);
    std::ostream& Log();

    FitDataStream *m_Stream;
    FitBuilder *m_Builder;
    ReaderOptions m_Options;
    std::ostream *m_LogStream;

    DefinitionTable m_Definitions;
    DeveloperFieldRegistry m_DevFields;
    TimestampTracker m_Timestamp;

    /** Raw bytes of the data message being decoded. */
    Buffer m_Record;
    /** Developer fields already reported as unresolved. */
    std::set<std::pair<uint8_t, uint8_t>> m_Unresolved;
};

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
