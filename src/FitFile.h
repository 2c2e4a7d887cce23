#pragma once
#include "FitTypes.h"
#include "FitErrors.h"
#include "FitDefinitions.h"
#include "FitDeveloper.h"
#include "FitTimestamp.h"
#include "ByteSource.h"

#include <stdint.h>
#include <iosfwd>
#include <vector>

namespace fit {

/** The header at the start of each FIT file. */
struct FileHeader
{
    FileHeader();

    uint8_t HeaderSize;                 // 12 or 14
    uint8_t ProtocolVersion;
    uint16_t ProfileVersion;
    uint32_t DataSize;                  // bytes of records after the header
    FitUint16 HeaderCrc;                // NA for 12 byte headers
};

std::ostream& operator<<(std::ostream &o, const FileHeader &h);

/** A decoded data message, as passed to FitBuilder::OnMessage(). */
struct FitMessage
{
    FitMessage();

    /** Timestamp of the message in FIT time: the timestamp field of the
     * message, the expanded compressed timestamp, or the last timestamp
     * seen in the file.  NA if the file had no timestamp so far. */
    FitUint32 Timestamp;
    uint16_t GlobalNumber;
    uint8_t LocalType;
    /** Value of the message index field, NA if the message has none. */
    FitUint16 MessageIndex;
    /** Native fields in definition order, followed by developer fields. */
    FieldList Fields;

    /** Find a native field by its field definition number. */
    const FieldValue* FindField(uint8_t field_number) const;

    /** Find a developer field by developer data index and field number. */
    const FieldValue* FindDevField(uint8_t dev_index, uint8_t field_number) const;
};

/** Options controlling ReadFitMessages. */
struct ReaderOptions
{
    ReaderOptions();

    /** Where diagnostic messages are written.  std::cerr if nullptr. */
    std::ostream *LogStream;

    /** Also log the file header, each message definition and a dump of
     * records that fail to decode. */
    bool Verbose;

    /** When a FIT file is followed by more data in the same source, decode
     * it as another FIT file.  Data whose first byte is not a valid header
     * size is logged and ignored, anything else must be a valid FIT file. */
    bool FollowChainedFiles;
};

class FitReader;

/** Builder class for FIT files.  A derived class needs to be implemented by
 * the client and passed to 'ReadFitMessages'.  The instance of the class will
 * receive "On..." notifications as messages are read from the data file.
 * Default implementations do nothing, so the client only needs to implement
 * handlers for messages they are interested in.
 *
 * @note ReadFitMessages is exception safe.  this means that an implementation
 * of this class can abort parsing by throwing an exception (not derived from
 * std::exception).  For example, code that only looks for file ID messages
 * can throw an exception in OnMessage() (which would need to be caught).
 * This will cause the parsing to be aborted, which would save time since
 * this message is usually at the start of the file.
 */
class FitBuilder
{
public:
    FitBuilder();
    virtual ~FitBuilder();

    virtual void OnFileHeader(const FileHeader &header);
    virtual void OnMessage(const FitMessage &message);
    virtual void OnDeveloperDataId(const DeveloperDataId &id);
    virtual void OnFieldDescription(const DeveloperFieldMeta &meta);

    /** Developer data decoded so far from the current FIT file.  Only valid
     * inside the "On..." notifications, nullptr otherwise. */
    const DeveloperFieldRegistry* DeveloperFields() const { return m_DevFields; }

private:
    friend class FitReader;
    const DeveloperFieldRegistry *m_DevFields;
};

/** Read messages from 'src' and pass them to the FitBuilder instance.
 * Throws BadFitFile (or a derived class) if the data cannot be decoded,
 * notifications sent before the error was found are not undone. */
void ReadFitMessages(ByteSource &src, FitBuilder *b,
                     const ReaderOptions &options = ReaderOptions());

/** Read messages from the 'data' buffer and pass them to the FitBuilder
 * instance. */
void ReadFitMessages(Buffer &data, FitBuilder *b);


// .................................................. ForEachFitMessage ....

/** FitBuilder which forwards data messages to a callback, together with a
 * context object owned by the caller. */
template <typename Callback, typename Context>
class CallbackBuilder : public FitBuilder
{
public:
    CallbackBuilder(Callback cb, Context &context)
        : m_Callback(cb), m_Context(context)
    {
    }

    void OnMessage(const FitMessage &m) override
    {
        m_Callback(m.Timestamp, m.GlobalNumber, m.LocalType,
                   m.MessageIndex, m.Fields, m_Context);
    }

private:
    Callback m_Callback;
    Context &m_Context;
};

/** Decode all FIT messages from 'src' and call 'cb' for each data message,
 * in file order, as:
 *
 *     cb(FitUint32 timestamp, uint16_t global_message_number,
 *        uint8_t local_message_type, FitUint16 message_index,
 *        const FieldList &fields, Context &context)
 *
 * 'context' is passed through to the callback unchanged.
 */
template <typename Callback, typename Context>
void ForEachFitMessage(ByteSource &src, Callback cb, Context &context,
                       const ReaderOptions &options = ReaderOptions())
{
    CallbackBuilder<Callback, Context> b(cb, context);
    ReadFitMessages(src, &b, options);
}

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
