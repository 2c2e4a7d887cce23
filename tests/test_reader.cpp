// Tests for decoding complete FIT files: headers, records, CRC and the
// entry points.

#include "FitFile.h"
#include "FitCrc.h"
#include "LinuxUtil.h"
#include "FitTestFile.h"

#include <iostream>
#include <sstream>
#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

using namespace fit;
using namespace fit_test;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

namespace {

const uint32_t POSITION_LAT = 0x12345678;
const uint32_t POSITION_LONG = 0x9ABCDEF0;

/** A file with one "record" message holding two uint32 position fields. */
FitTestFile PositionFile()
{
    FitTestFile f;
    f.Define(0, GMN_RECORD, { FieldDef(0, 4, 0x86), FieldDef(1, 4, 0x86) });
    f.Data(0, Payload().U32(POSITION_LAT).U32(POSITION_LONG));
    return f;
}

/** Decode 'data' and return the error code of the BadFitFile exception
 * thrown, E_OK if there was none. */
int DecodeError(const Buffer &data, RecordingBuilder &b,
                const ReaderOptions &options = ReaderOptions())
{
    BufferSource src(data);
    try {
        ReadFitMessages(src, &b, options);
    }
    catch (const BadFitFile &e) {
        return e.ErrorCode();
    }
    return E_OK;
}

struct StopDecoding {};

class StoppingBuilder : public FitBuilder
{
public:
    StoppingBuilder() : Count(0) {}
    void OnMessage(const FitMessage &) override
    {
        Count++;
        throw StopDecoding();
    }
    int Count;
};

struct PositionSum
{
    PositionSum() : Messages(0), Sum(0) {}
    int Messages;
    uint64_t Sum;
};

};                                      // end anonymous namespace

// ......................................................... Basic file ....

static void testSingleRecord()
{
    std::cout << "\n=== Test: single record message ===\n";
    Buffer data = PositionFile().Finish();
    RecordingBuilder b;
    CHECK(DecodeError(data, b) == E_OK, "file decodes");
    CHECK(b.Headers.size() == 1, "one file header");
    CHECK(b.Headers.size() == 1 && b.Headers[0].HeaderSize == 14, "14 byte header");
    CHECK(b.Headers.size() == 1 && b.Headers[0].ProfileVersion == 2132, "profile version");
    CHECK(b.Messages.size() == 1, "one message");
    if (b.Messages.size() != 1)
        return;
    const FitMessage &m = b.Messages[0];
    CHECK(m.GlobalNumber == GMN_RECORD, "global message number 20");
    CHECK(m.LocalType == 0, "local message type 0");
    CHECK(m.Timestamp.isNA(), "no timestamp");
    CHECK(m.MessageIndex.isNA(), "no message index");
    CHECK(m.Fields.size() == 2, "two fields");
    const FieldValue *lat = m.FindField(0);
    const FieldValue *lon = m.FindField(1);
    CHECK(lat && lat->AsUint() == POSITION_LAT, "position_lat value");
    CHECK(lon && lon->AsUint() == POSITION_LONG, "position_long value");
    CHECK(lat && lat->BaseType() == 0x86, "field keeps its base type");
    CHECK(m.FindField(2) == nullptr, "missing field is not found");

    // The in-memory entry point gives the same result
    RecordingBuilder b2;
    ReadFitMessages(data, &b2);
    CHECK(b2.Messages.size() == 1, "Buffer entry point decodes the message");
}

static void testShortHeader()
{
    std::cout << "\n=== Test: 12 byte header ===\n";
    RecordingBuilder b;
    FitTestFile f(12);
    f.Define(0, GMN_RECORD, { FieldDef(0, 4, 0x86), FieldDef(1, 4, 0x86) });
    f.Data(0, Payload().U32(POSITION_LAT).U32(POSITION_LONG));
    CHECK(DecodeError(f.Finish(), b) == E_OK, "file with 12 byte header decodes");
    CHECK(b.Headers.size() == 1 && b.Headers[0].HeaderCrc.isNA(), "no header CRC");
    CHECK(b.Messages.size() == 1, "one message");
}

// ............................................................. Errors ....

static void testFileCrc()
{
    std::cout << "\n=== Test: file CRC mismatch ===\n";
    Buffer data = PositionFile().Finish();
    data.back() ^= 0x01;
    RecordingBuilder b;
    CHECK(DecodeError(data, b) == E_FILE_CRC, "flipped CRC byte gives E_FILE_CRC");
    CHECK(b.Messages.size() == 1, "messages before the CRC were delivered");
}

static void testUndefinedLocalType()
{
    std::cout << "\n=== Test: data message without a definition ===\n";
    FitTestFile f;
    f.Data(3, Payload().U8(1));
    Buffer data = f.Finish();
    BufferSource src(data);
    RecordingBuilder b;
    int local = -1;
    try {
        ReadFitMessages(src, &b);
    }
    catch (const BadLocalMessageId &e) {
        local = e.LocalMessageId();
        CHECK(e.ErrorCode() == E_LOCAL_MESSAGE, "error code is E_LOCAL_MESSAGE");
    }
    CHECK(local == 3, "BadLocalMessageId names local type 3");
    CHECK(b.Messages.empty(), "no messages delivered");
}

static void testHeaderErrors()
{
    std::cout << "\n=== Test: header errors ===\n";
    Buffer good = PositionFile().Finish();

    Buffer bad_size = good;
    bad_size[0] = 13;
    RecordingBuilder b1;
    CHECK(DecodeError(bad_size, b1) == E_INVALID_HEADER, "header size 13 is rejected");

    Buffer bad_sig = good;
    bad_sig[9] = 'X';
    RecordingBuilder b2;
    CHECK(DecodeError(bad_sig, b2) == E_INVALID_HEADER, "bad signature is rejected");
    CHECK(b2.Headers.empty(), "no header notification for a bad header");

    Buffer bad_crc = good;
    uint16_t wrong = Crc16(good.data(), 12) ^ 0x5555;
    if (wrong == 0)
        wrong = 0x1234;
    bad_crc[12] = wrong & 0xFF;
    bad_crc[13] = wrong >> 8;
    RecordingBuilder b3;
    CHECK(DecodeError(bad_crc, b3) == E_HEADER_CRC, "bad header CRC is rejected");

    FitTestFile no_crc(14, false);
    no_crc.Define(0, GMN_RECORD, { FieldDef(0, 4, 0x86) });
    no_crc.Data(0, Payload().U32(7));
    RecordingBuilder b4;
    CHECK(DecodeError(no_crc.Finish(), b4) == E_OK, "zero header CRC is accepted");
    CHECK(b4.Messages.size() == 1, "message decoded with zero header CRC");

    RecordingBuilder b5;
    CHECK(DecodeError(Buffer(), b5) == E_EOF, "empty input gives E_EOF");

    RecordingBuilder b6;
    CHECK(DecodeError(Buffer(good.begin(), good.begin() + 10), b6) == E_EOF,
          "truncated header gives E_EOF");
}

static void testTruncated()
{
    std::cout << "\n=== Test: truncated file ===\n";
    Buffer data = PositionFile().Finish();
    data.resize(data.size() - 4);       // CRC and part of the last record
    RecordingBuilder b;
    CHECK(DecodeError(data, b) == E_EOF, "truncated records give E_EOF");
    CHECK(b.Messages.empty(), "the cut message is not delivered");

    Buffer no_crc = PositionFile().Finish();
    no_crc.resize(no_crc.size() - 1);
    RecordingBuilder b2;
    CHECK(DecodeError(no_crc, b2) == E_EOF, "missing CRC byte gives E_EOF");
    CHECK(b2.Messages.size() == 1, "records before the missing CRC are delivered");
}

static void testDataSize()
{
    std::cout << "\n=== Test: record past the data size ===\n";
    Buffer data = PositionFile().Finish(-2);
    RecordingBuilder b;
    CHECK(DecodeError(data, b) == E_DATA_SIZE, "data size too small gives E_DATA_SIZE");
    CHECK(b.Messages.empty(), "no messages delivered");
}

static void testUnknownBaseType()
{
    std::cout << "\n=== Test: unknown base type ===\n";
    FitTestFile def_only;
    def_only.Define(0, 100, { FieldDef(0, 2, 0x55) });
    RecordingBuilder b1;
    CHECK(DecodeError(def_only.Finish(), b1) == E_OK,
          "definition with an unknown base type is accepted");

    FitTestFile with_data;
    with_data.Define(0, 100, { FieldDef(0, 2, 0x55) });
    with_data.Data(0, Payload().U16(1));
    Buffer data = with_data.Finish();
    BufferSource src(data);
    RecordingBuilder b2;
    int type_id = -1;
    try {
        ReadFitMessages(src, &b2);
    }
    catch (const BadTypeId &e) {
        type_id = e.TypeId();
    }
    CHECK(type_id == 0x55, "data message with an unknown base type gives BadTypeId");

    // uint32 with reserved bits set is not a uint32
    FitTestFile reserved;
    reserved.Define(0, 100, { FieldDef(0, 4, 0x66) });
    reserved.Data(0, Payload().U32(1));
    Buffer data2 = reserved.Finish();
    BufferSource src2(data2);
    RecordingBuilder b3;
    type_id = -1;
    try {
        ReadFitMessages(src2, &b3);
    }
    catch (const BadTypeId &e) {
        type_id = e.TypeId();
    }
    CHECK(type_id == 0x66, "base type with reserved bits gives BadTypeId");
    CHECK(b3.Messages.empty(), "no message for the bad base type");
}

// ........................................................ Definitions ....

static void testRedefinition()
{
    std::cout << "\n=== Test: local type redefinition ===\n";
    FitTestFile f;
    f.Define(0, GMN_RECORD, { FieldDef(0, 4, 0x86) });
    f.Data(0, Payload().U32(1));
    f.Define(0, 21, { FieldDef(3, 1, 0x02) });
    f.Data(0, Payload().U8(7));
    RecordingBuilder b;
    CHECK(DecodeError(f.Finish(), b) == E_OK, "file decodes");
    CHECK(b.Messages.size() == 2, "two messages");
    if (b.Messages.size() != 2)
        return;
    CHECK(b.Messages[0].GlobalNumber == GMN_RECORD, "first message uses the first definition");
    CHECK(b.Messages[1].GlobalNumber == 21, "second message uses the new definition");
    const FieldValue *v = b.Messages[1].FindField(3);
    CHECK(v && v->AsUint() == 7, "field decoded with the new layout");
}

static void testBigEndian()
{
    std::cout << "\n=== Test: big endian definition ===\n";
    FitTestFile f;
    f.Define(1, 0x0102, { FieldDef(0, 2, 0x84), FieldDef(1, 4, 0x85) }, true);
    f.Define(2, 0x0102, { FieldDef(0, 2, 0x84) });
    f.Data(1, Payload().U16(0x0A0B, true).U32(static_cast<uint32_t>(-5), true));
    f.Data(2, Payload().U16(0x0A0B));
    RecordingBuilder b;
    CHECK(DecodeError(f.Finish(), b) == E_OK, "file decodes");
    CHECK(b.Messages.size() == 2, "two messages");
    if (b.Messages.size() != 2)
        return;
    CHECK(b.Messages[0].GlobalNumber == 0x0102, "big endian global number");
    CHECK(b.Messages[0].LocalType == 1, "local type 1");
    const FieldValue *u = b.Messages[0].FindField(0);
    const FieldValue *s = b.Messages[0].FindField(1);
    CHECK(u && u->AsUint() == 0x0A0B, "big endian uint16");
    CHECK(s && s->AsSint() == -5, "big endian sint32");
    CHECK(b.Messages[1].GlobalNumber == 0x0102, "little endian global number");
    const FieldValue *l = b.Messages[1].FindField(0);
    CHECK(l && l->AsUint() == 0x0A0B, "little endian uint16");
}

static void testMessageIndex()
{
    std::cout << "\n=== Test: message index ===\n";
    FitTestFile f;
    f.Define(0, 19, { FieldDef(FIELD_MESSAGE_INDEX, 2, 0x84), FieldDef(5, 1, 0x00) });
    f.Data(0, Payload().U16(5).U8(2));
    f.Data(0, Payload().U16(0xFFFF).U8(2));
    RecordingBuilder b;
    CHECK(DecodeError(f.Finish(), b) == E_OK, "file decodes");
    CHECK(b.Messages.size() == 2, "two messages");
    if (b.Messages.size() != 2)
        return;
    CHECK(b.Messages[0].MessageIndex == 5, "message index is 5");
    CHECK(b.Messages[1].MessageIndex.isNA(), "invalid message index is NA");
    CHECK(b.Messages[0].FindField(FIELD_MESSAGE_INDEX) != nullptr,
          "message index stays in the field list");
}

static void testFieldSizeMismatch()
{
    std::cout << "\n=== Test: field size not a multiple of the type ===\n";
    std::ostringstream log;
    ReaderOptions options;
    options.LogStream = &log;
    FitTestFile f;
    f.Define(0, 100, { FieldDef(0, 3, 0x84), FieldDef(1, 1, 0x02) });
    f.Data(0, Payload().U8(1).U8(2).U8(3).U8(9));
    RecordingBuilder b;
    CHECK(DecodeError(f.Finish(), b, options) == E_OK, "file decodes");
    CHECK(b.Messages.size() == 1, "one message");
    if (b.Messages.size() != 1)
        return;
    const FieldValue *v = b.Messages[0].FindField(0);
    CHECK(v && v->Kind() == VK_BYTES && v->Bytes().size() == 3, "field kept as raw bytes");
    const FieldValue *next = b.Messages[0].FindField(1);
    CHECK(next && next->AsUint() == 9, "following field is decoded");
    CHECK(log.str().find("invalid size") != std::string::npos, "size mismatch is logged");
}

static void testVerboseLog()
{
    std::cout << "\n=== Test: verbose log ===\n";
    std::ostringstream log;
    ReaderOptions options;
    options.LogStream = &log;
    options.Verbose = true;
    RecordingBuilder b;
    CHECK(DecodeError(PositionFile().Finish(), b, options) == E_OK, "file decodes");
    CHECK(log.str().find("#<FileHeader") != std::string::npos, "header is logged");
    CHECK(log.str().find("#<MDEF local: 0 global: 20") != std::string::npos,
          "definition is logged");

    std::ostringstream quiet;
    ReaderOptions quiet_options;
    quiet_options.LogStream = &quiet;
    RecordingBuilder b2;
    DecodeError(PositionFile().Finish(), b2, quiet_options);
    CHECK(quiet.str().empty(), "nothing logged for a clean file");
}

// ..................................................... Chained files ....

static void testChainedFiles()
{
    std::cout << "\n=== Test: chained files ===\n";
    Buffer first = PositionFile().Finish();
    FitTestFile f2(12);
    f2.Define(0, 21, { FieldDef(0, 1, 0x02) });
    f2.Data(0, Payload().U8(42));
    Buffer second = f2.Finish();

    Buffer chain = first;
    chain.insert(chain.end(), second.begin(), second.end());

    RecordingBuilder b;
    CHECK(DecodeError(chain, b) == E_OK, "chained files decode");
    CHECK(b.Headers.size() == 2, "two file headers");
    CHECK(b.Messages.size() == 2, "messages from both files");
    CHECK(b.Messages.size() == 2 && b.Messages[1].GlobalNumber == 21,
          "second file message");

    RecordingBuilder single;
    ReaderOptions options;
    options.FollowChainedFiles = false;
    CHECK(DecodeError(chain, single, options) == E_OK, "first file only");
    CHECK(single.Headers.size() == 1 && single.Messages.size() == 1,
          "chained file ignored");

    // Definitions do not carry over into the next file
    FitTestFile f3;
    f3.Data(0, Payload().U32(1).U32(2));
    Buffer third = f3.Finish();
    Buffer chain2 = first;
    chain2.insert(chain2.end(), third.begin(), third.end());
    RecordingBuilder b2;
    CHECK(DecodeError(chain2, b2) == E_LOCAL_MESSAGE,
          "definitions are reset for a chained file");
    CHECK(b2.Messages.size() == 1, "first file messages were delivered");

    // Padding after the last file is not another file
    Buffer padded = first;
    padded.push_back(0x00);
    padded.push_back(0x00);
    std::ostringstream log;
    ReaderOptions log_options;
    log_options.LogStream = &log;
    RecordingBuilder b3;
    CHECK(DecodeError(padded, b3, log_options) == E_OK, "trailing padding is ignored");
    CHECK(b3.Headers.size() == 1 && b3.Messages.size() == 1, "one file decoded");
    CHECK(log.str().find("ignoring trailing data") != std::string::npos,
          "trailing padding is logged");

    // Trailing data that looks like a header must be a FIT file
    Buffer bad_chain = first;
    bad_chain.push_back(14);
    bad_chain.push_back(0x10);
    RecordingBuilder b4;
    CHECK(DecodeError(bad_chain, b4, log_options) == E_EOF,
          "truncated chained header is an error");
    CHECK(b4.Messages.size() == 1, "first file messages were delivered");
}

// ...................................................... Entry points ....

static void testCallback()
{
    std::cout << "\n=== Test: callback with context ===\n";
    FitTestFile f;
    f.Define(0, GMN_RECORD, { FieldDef(0, 4, 0x86) });
    f.Data(0, Payload().U32(10));
    f.Data(0, Payload().U32(32));
    Buffer data = f.Finish();
    BufferSource src(data);

    PositionSum sum;
    ForEachFitMessage(
        src,
        [] (FitUint32 ts, uint16_t global, uint8_t local, FitUint16 index,
            const FieldList &fields, PositionSum &ctx) {
            if (global == GMN_RECORD && local == 0 && ts.isNA() && index.isNA()) {
                ctx.Messages++;
                ctx.Sum += fields.at(0).AsUint();
            }
        },
        sum);
    CHECK(sum.Messages == 2, "callback called for each message");
    CHECK(sum.Sum == 42, "context updated by the callback");
}

static void testBuilderException()
{
    std::cout << "\n=== Test: exception from the builder ===\n";
    FitTestFile f;
    f.Define(0, GMN_RECORD, { FieldDef(0, 4, 0x86) });
    f.Data(0, Payload().U32(1));
    f.Data(0, Payload().U32(2));
    Buffer data = f.Finish();
    BufferSource src(data);
    StoppingBuilder b;
    bool stopped = false;
    try {
        ReadFitMessages(src, &b);
    }
    catch (const StopDecoding &) {
        stopped = true;
    }
    CHECK(stopped, "builder exception propagates");
    CHECK(b.Count == 1, "decoding stopped after the first message");
    CHECK(b.DeveloperFields() == nullptr, "registry unbound after the decode");
}

static void testFileSource()
{
    std::cout << "\n=== Test: file source ===\n";
    Buffer data = PositionFile().Finish();
    char name[] = "/tmp/fitdecode-test-XXXXXX";
    int fd = mkstemp(name);
    CHECK(fd != -1, "temporary file created");
    if (fd == -1)
        return;
    ssize_t n = write(fd, data.data(), data.size());
    close(fd);
    CHECK(n == static_cast<ssize_t>(data.size()), "temporary file written");

    RecordingBuilder b;
    try {
        FitDecode::FileSource src(name);
        ReadFitMessages(src, &b);
    }
    catch (const std::exception &e) {
        std::cerr << e.what() << "\n";
    }
    unlink(name);
    CHECK(b.Messages.size() == 1, "message read from a file");

    int error = 0;
    try {
        FitDecode::FileSource src("/nonexistent/dir/file.fit");
    }
    catch (const FitDecode::UnixException &e) {
        error = e.error_code();
    }
    CHECK(error == ENOENT, "missing file throws UnixException");
}

int main()
{
    testSingleRecord();
    testShortHeader();
    testFileCrc();
    testUndefinedLocalType();
    testHeaderErrors();
    testTruncated();
    testDataSize();
    testUnknownBaseType();
    testRedefinition();
    testBigEndian();
    testMessageIndex();
    testFieldSizeMismatch();
    testVerboseLog();
    testChainedFiles();
    testCallback();
    testBuilderException();
    testFileSource();

    std::cout << "\n" << (failures == 0 ? "All tests passed." : "Some tests FAILED.")
              << " (" << failures << " failure(s))\n";
    return failures == 0 ? 0 : 1;
}
