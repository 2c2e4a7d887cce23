#pragma once
#include <stdint.h>
#include <iosfwd>
#include <vector>

namespace fit {

/** Field definition numbers with the same meaning in all messages. */
enum CommonFieldNumber {
    FIELD_TIMESTAMP = 253,
    FIELD_MESSAGE_INDEX = 254
};

/** Global message numbers the decoder itself needs to know about. */
enum GlobalMessageNumber
{
    GMN_RECORD = 20,
    GMN_FIELD_DESCRIPTION = 206,
    GMN_DEVELOPER_DATA_ID = 207
};

struct FieldDef
{
    FieldDef (uint8_t num, uint8_t  sz, uint8_t type)
        : Number (num), Size (sz), BaseType (type) {/* empty */}
    uint8_t Number;
    uint8_t Size;
    uint8_t BaseType;
};

struct DevFieldDef
{
    DevFieldDef (uint8_t num, uint8_t sz, uint8_t dev)
        : Number (num), Size (sz), DevIndex (dev) {/* empty */}
    uint8_t Number;
    uint8_t Size;
    uint8_t DevIndex;
};

struct MessageDef
{
    MessageDef();

    /** Recompute DataMessageSize from the field lists. */
    void ComputeSize();

    int LocalNumber;
    int GlobalNumber;
    bool BigEndian;
    /** Size of the data message for this message definition.  This can be
     * computed by adding the sizes of a Fields and DevFields in this
     * structure, but it is cached here.
     */
    int DataMessageSize;
    std::vector<FieldDef> Fields;
    std::vector<DevFieldDef> DevFields;
};

std::ostream& operator<<(std::ostream &o, const MessageDef &m);


// .................................................... DefinitionTable ....

/** Message definitions indexed by local message type.  A new definition for
 * a local message type replaces the previous one. */
class DefinitionTable
{
public:
    static const int MAX_LOCAL_TYPES = 16;

    DefinitionTable();

    /** Store 'mdef' in the slot for mdef.LocalNumber, which must be less
     * than MAX_LOCAL_TYPES. */
    void Define(const MessageDef &mdef);

    /** Return the definition for 'local', or nullptr if there is none. */
    const MessageDef* Find(int local) const;

    void Clear();

private:
    MessageDef m_Definitions[MAX_LOCAL_TYPES];
    bool m_Defined[MAX_LOCAL_TYPES];
};

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
