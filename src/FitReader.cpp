#include "FitReader.h"
#include "FitCrc.h"
#include "FitField.h"
#include "Tools.h"

#include <iostream>

namespace {
using namespace fit;

// Record header bits
const unsigned char RH_COMPRESSED_TIMESTAMP = 0x80;
const unsigned char RH_DEFINITION = 0x40;
const unsigned char RH_DEVELOPER_DATA = 0x20;
const unsigned char RH_LOCAL_TYPE = 0x0F;
const unsigned char RH_COMPRESSED_LOCAL_TYPE = 0x60;
const unsigned char RH_TIME_OFFSET = 0x1F;

/** Restores the builder's developer field registry pointer on scope exit. */
class RegistryBinding
{
public:
    RegistryBinding(const DeveloperFieldRegistry **slot, const DeveloperFieldRegistry *r)
        : m_Slot(slot), m_Saved(slot ? *slot : nullptr)
    {
        if (m_Slot)
            *m_Slot = r;
    }

    ~RegistryBinding()
    {
        if (m_Slot)
            *m_Slot = m_Saved;
    }

private:
    const DeveloperFieldRegistry **m_Slot;
    const DeveloperFieldRegistry *m_Saved;
};

};                                      // end anonymous namespace

namespace fit {

// ...................................................... FitDataStream ....

FitDataStream::FitDataStream(ByteSource *src)
    : m_Source (src),
      m_Pending (-1),
      m_Pos (0),
      m_Limit (0),
      m_Crc (0)
{
    // empty
}

void FitDataStream::Unread(unsigned char byte)
{
    m_Pending = byte;
}

void FitDataStream::Fill(unsigned char *buf, int len, bool update_crc)
{
    int have = 0;
    if (len > 0 && m_Pending >= 0) {
        buf[0] = static_cast<unsigned char>(m_Pending);
        m_Pending = -1;
        have = 1;
    }
    if (have < len) {
        size_t n = m_Source->Read(buf + have, len - have);
        if (n != static_cast<size_t>(len - have))
            throw BadFitFile ("FitDataStream::Fill", E_EOF);
    }
    if (update_crc)
        m_Crc = Crc16(buf, len, m_Crc);
}

void FitDataStream::ReadHeader(unsigned char *buf, int len)
{
    Fill(buf, len, true);
}

void FitDataStream::ReadBytes(unsigned char *buf, int len)
{
    if (static_cast<uint64_t>(m_Pos) + len > m_Limit)
        throw BadFitFile ("FitDataStream::ReadBytes", E_DATA_SIZE);
    Fill(buf, len, true);
    m_Pos += len;
}

unsigned char FitDataStream::ReadByte()
{
    unsigned char b;
    ReadBytes(&b, 1);
    return b;
}

uint16_t FitDataStream::ReadFileCrc()
{
    unsigned char data[2];
    Fill(data, 2, false);
    return data[0] | (data[1] << 8);
}


// .......................................................... FitReader ....

FitReader::FitReader(FitDataStream *stream, FitBuilder *b, const ReaderOptions &options)
    : m_Stream(stream),
      m_Builder(b),
      m_Options(options),
      m_LogStream(options.LogStream)
{
    if (m_LogStream == nullptr)
        m_LogStream = &std::cerr;
}

FitReader::~FitReader()
{
    // empty
}

std::ostream& FitReader::Log()
{
    FitDecode::PutTimestamp(*m_LogStream);
    return *m_LogStream;
}

void FitReader::ReadMessages()
{
    RegistryBinding binding(m_Builder ? &m_Builder->m_DevFields : nullptr, &m_DevFields);
    while (! m_Stream->IsEof()) {
        ReadRecord();
    }
}

void FitReader::ReadRecord()
{
    unsigned char header = m_Stream->ReadByte();
    if (header & RH_COMPRESSED_TIMESTAMP) {
        int local = (header & RH_COMPRESSED_LOCAL_TYPE) >> 5;
        ReadDataMessage(local, true, header & RH_TIME_OFFSET);
    } else if (header & RH_DEFINITION) {
        ReadMessageDef (header);
    } else {
        ReadDataMessage(header & RH_LOCAL_TYPE, false, 0);
    }
}

void FitReader::ReadMessageDef (unsigned char header)
{
    MessageDef mdef;
    mdef.LocalNumber = header & RH_LOCAL_TYPE;
    m_Stream->ReadByte();                     // skip reserved byte
    mdef.BigEndian = (m_Stream->ReadByte() != 0);
    unsigned char gmn[2];
    m_Stream->ReadBytes(gmn, 2);
    if (mdef.BigEndian)
        mdef.GlobalNumber = (gmn[0] << 8) | gmn[1];
    else
        mdef.GlobalNumber = gmn[0] | (gmn[1] << 8);
    int nfields = m_Stream->ReadByte();
    for (int i = 0; i < nfields; ++i) {
        unsigned char fd[3];
        m_Stream->ReadBytes(fd, 3);
        mdef.Fields.push_back (FieldDef (fd[0], fd[1], fd[2]));
    }
    if (header & RH_DEVELOPER_DATA) {   // message has developer specific fields
        nfields = m_Stream->ReadByte();
        for (int i = 0; i < nfields; ++i) {
            unsigned char fd[3];
            m_Stream->ReadBytes(fd, 3);
            mdef.DevFields.push_back (DevFieldDef (fd[0], fd[1], fd[2]));
        }
    }
    mdef.ComputeSize();
    if (m_Options.Verbose)
        Log() << mdef << std::endl;
    m_Definitions.Define(mdef);
}

void FitReader::ReadDataMessage (int local, bool compressed, unsigned time_offset)
{
    const MessageDef *mdef = m_Definitions.Find(local);
    if (! mdef)
        throw BadLocalMessageId ("FitReader::ReadDataMessage", local);

    if (compressed && ! m_Timestamp.HasTimestamp())
        throw BadFitFile ("FitReader::ReadDataMessage", E_NO_TIMESTAMP);

    m_Record.resize(mdef->DataMessageSize);
    if (! m_Record.empty())
        m_Stream->ReadBytes(&m_Record[0], static_cast<int>(m_Record.size()));

    FitMessage msg;
    msg.GlobalNumber = mdef->GlobalNumber;
    msg.LocalType = local;

    try {
        DecodeFields(*mdef, msg);
    }
    catch (const BadFitFile &e) {
        if (m_Options.Verbose) {
            Log() << e.what() << ", while decoding " << *mdef << "\n";
            int size = static_cast<int>(m_Record.size());
            FitDecode::DumpData(m_Record.data(), size, *m_LogStream,
                                m_Stream->Position() - size);
            (*m_LogStream) << std::flush;
        }
        throw;
    }

    FitUint32 timestamp;
    if (const FieldValue *v = msg.FindField(FIELD_TIMESTAMP))
        timestamp = FieldAs<FitUint32>(*v);
    if (const FieldValue *v = msg.FindField(FIELD_MESSAGE_INDEX))
        msg.MessageIndex = FieldAs<FitUint16>(*v);

    // An explicit timestamp field wins over the compressed header
    if (! timestamp.isNA()) {
        m_Timestamp.Update(timestamp);
        msg.Timestamp = timestamp;
    } else if (compressed) {
        msg.Timestamp = m_Timestamp.Expand(time_offset);
    } else {
        msg.Timestamp = m_Timestamp.Last();
    }

    if (msg.GlobalNumber == GMN_FIELD_DESCRIPTION
        || msg.GlobalNumber == GMN_DEVELOPER_DATA_ID) {
        ProcessDeveloperMessage(msg);
    }

    if (m_Builder)
        m_Builder->OnMessage(msg);
}

void FitReader::DecodeFields (const MessageDef &mdef, FitMessage &msg)
{
    const unsigned char *data = m_Record.data();
    msg.Fields.reserve(mdef.Fields.size() + mdef.DevFields.size());
    for (const auto &f : mdef.Fields) {
        msg.Fields.push_back(DecodeNativeField(mdef, f, data));
        data += f.Size;
    }
    for (const auto &f : mdef.DevFields) {
        msg.Fields.push_back(DecodeDevField(mdef, f, data));
        data += f.Size;
    }
}

FieldValue FitReader::DecodeNativeField (const MessageDef &mdef, const FieldDef &f,
                                         const unsigned char *data)
{
    const BaseTypeInfo *bt = LookupBaseType(f.BaseType);
    if (! bt)
        throw BadTypeId ("FitReader::DecodeNativeField", f.BaseType);

    FieldValue v;
    if (f.Size == 0 || f.Size % bt->Size) {
        // size needs to be a multiple of the base type size.
        Log() << "global message " << mdef.GlobalNumber << ", field " << (int)f.Number
              << ": invalid size " << (int)f.Size << ", expecting multiple of "
              << bt->Size << ", keeping raw bytes\n";
        v = FieldValue::FromBytes(Buffer(data, data + f.Size));
    } else {
        v = DecodeField(data, *bt, f.Size / bt->Size, mdef.BigEndian);
    }
    v.SetOrigin(f.Number, f.BaseType);
    return v;
}

FieldValue FitReader::DecodeDevField (const MessageDef &mdef, const DevFieldDef &f,
                                      const unsigned char *data)
{
    const DeveloperFieldMeta *meta = m_DevFields.FindField(f.DevIndex, f.Number);
    const BaseTypeInfo *bt = meta ? LookupBaseType(meta->BaseType) : nullptr;

    FieldValue v;
    if (bt && f.Size > 0 && f.Size % bt->Size == 0) {
        v = DecodeField(data, *bt, f.Size / bt->Size, mdef.BigEndian);
        v.SetDeveloperOrigin(f.DevIndex, f.Number, meta->BaseType);
    } else {
        // The size from the definition is all we know, keep the bytes
        v = FieldValue::FromBytes(Buffer(data, data + f.Size));
        v.SetDeveloperOrigin(f.DevIndex, f.Number, meta ? meta->BaseType : 0x0D);
        v.SetUnresolved(true);
        auto key = std::make_pair(f.DevIndex, f.Number);
        if (m_Unresolved.insert(key).second) {
            Log() << "global message " << mdef.GlobalNumber
                  << ", developer " << (int)f.DevIndex << " field " << (int)f.Number
                  << ": " << FitErrorStr(E_DEV_FIELD) << ", keeping raw bytes\n";
        }
    }
    return v;
}

void FitReader::ProcessDeveloperMessage (const FitMessage &msg)
{
    if (msg.GlobalNumber == GMN_FIELD_DESCRIPTION) {
        const DeveloperFieldMeta *meta = m_DevFields.AddFieldDescription(msg.Fields);
        if (! meta) {
            Log() << "ignoring incomplete field description message\n";
            return;
        }
        if (m_Options.Verbose)
            Log() << *meta << std::endl;
        if (m_Builder)
            m_Builder->OnFieldDescription(*meta);
    } else {
        const DeveloperDataId *id = m_DevFields.AddDeveloperDataId(msg.Fields);
        if (! id) {
            Log() << "ignoring developer data id message without an index\n";
            return;
        }
        if (m_Builder)
            m_Builder->OnDeveloperDataId(*id);
    }
}

};                                      // end namespace fit
