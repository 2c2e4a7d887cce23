#include "FitFile.h"
#include "FitReader.h"
#include "FitCrc.h"
#include "Tools.h"

#include <iostream>

namespace {
using namespace fit;

const int HEADER_SIZE_SHORT = 12;
const int HEADER_SIZE_LONG = 14;

FileHeader ReadFileHeader(FitDataStream &stream)
{
    unsigned char data[HEADER_SIZE_LONG];
    stream.ReadHeader(data, 1);
    int hlen = data[0];                 // first byte is the header length
    if (hlen != HEADER_SIZE_SHORT && hlen != HEADER_SIZE_LONG)
        throw BadFitFile ("ReadFileHeader", E_INVALID_HEADER);
    stream.ReadHeader(data + 1, hlen - 1);

    if (data[8] != '.' || data[9] != 'F' || data[10] != 'I' || data[11] != 'T')
        throw BadFitFile ("ReadFileHeader", E_INVALID_HEADER);

    FileHeader h;
    h.HeaderSize = hlen;
    h.ProtocolVersion = data[1];
    h.ProfileVersion = data[2] | (data[3] << 8);
    h.DataSize = (data[4] | (data[5] << 8) | (data[6] << 16)
                  | (static_cast<uint32_t>(data[7]) << 24));

    if (hlen == HEADER_SIZE_LONG) {
        h.HeaderCrc = static_cast<uint16_t>(data[12] | (data[13] << 8));
        // A zero CRC means the header checksum was not computed
        if (h.HeaderCrc != 0 && Crc16 (data, HEADER_SIZE_SHORT) != h.HeaderCrc)
            throw BadFitFile ("ReadFileHeader", E_HEADER_CRC);
    }

    return h;
}

/** Decode one FIT file (header, records and CRC) from 'stream'. */
void ReadFitFile(FitDataStream &stream, FitBuilder *b, const ReaderOptions &options)
{
    FileHeader header = ReadFileHeader(stream);
    if (options.Verbose) {
        std::ostream &log = options.LogStream ? *options.LogStream : std::cerr;
        FitDecode::PutTimestamp(log);
        log << header << std::endl;
    }
    if (b)
        b->OnFileHeader(header);

    stream.SetDataSize(header.DataSize);
    FitReader reader(&stream, b, options);
    reader.ReadMessages();

    uint16_t expected = stream.Crc();
    uint16_t crc = stream.ReadFileCrc();
    if (crc != expected)
        throw BadFitFile ("ReadFitMessages", E_FILE_CRC);
}

};                                      // end anonymous namespace

namespace fit {

FileHeader::FileHeader()
    : HeaderSize (0),
      ProtocolVersion (0),
      ProfileVersion (0),
      DataSize (0)
{
    // empty
}

std::ostream& operator<<(std::ostream &o, const FileHeader &h)
{
    o << "#<FileHeader size: " << (int)h.HeaderSize
      << " protocol: " << (h.ProtocolVersion >> 4) << "." << (h.ProtocolVersion & 0x0F)
      << " profile: " << h.ProfileVersion
      << " data size: " << h.DataSize << ">";
    return o;
}

FitMessage::FitMessage()
    : GlobalNumber (0),
      LocalType (0)
{
    // empty
}

const FieldValue* FitMessage::FindField(uint8_t field_number) const
{
    for (const auto &f : Fields) {
        if (! f.IsDeveloperField() && f.FieldNumber() == field_number)
            return &f;
    }
    return nullptr;
}

const FieldValue* FitMessage::FindDevField(uint8_t dev_index, uint8_t field_number) const
{
    for (const auto &f : Fields) {
        if (f.IsDeveloperField() && f.DeveloperDataIndex() == dev_index
            && f.FieldNumber() == field_number)
            return &f;
    }
    return nullptr;
}

ReaderOptions::ReaderOptions()
    : LogStream (nullptr),
      Verbose (false),
      FollowChainedFiles (true)
{
    // empty
}

FitBuilder::FitBuilder()
    : m_DevFields (nullptr)
{
    // empty
}

FitBuilder::~FitBuilder()
{
    // empty
}

void FitBuilder::OnFileHeader(const FileHeader &)
{
    // empty
}

void FitBuilder::OnMessage(const FitMessage &)
{
    // empty
}

void FitBuilder::OnDeveloperDataId(const DeveloperDataId &)
{
    // empty
}

void FitBuilder::OnFieldDescription(const DeveloperFieldMeta &)
{
    // empty
}

void ReadFitMessages(ByteSource &src, FitBuilder *b, const ReaderOptions &options)
{
    int pending = -1;
    for (;;) {
        // Each FIT file in a chain is decoded with a fresh state
        FitDataStream stream(&src);
        if (pending >= 0)
            stream.Unread(static_cast<unsigned char>(pending));
        ReadFitFile(stream, b, options);

        if (! options.FollowChainedFiles)
            break;
        unsigned char next;
        if (src.Read(&next, 1) == 0)
            break;                      // no more chunks in the FIT file
        if (next != HEADER_SIZE_SHORT && next != HEADER_SIZE_LONG) {
            // Padding after the last file, it cannot start another header
            std::ostream &log = options.LogStream ? *options.LogStream : std::cerr;
            FitDecode::PutTimestamp(log);
            log << "ignoring trailing data after FIT file" << std::endl;
            break;
        }
        pending = next;
    }
}

void ReadFitMessages(Buffer &data, FitBuilder *b)
{
    BufferSource src(data);
    ReadFitMessages(src, b);
}

}; // end namespace fit
