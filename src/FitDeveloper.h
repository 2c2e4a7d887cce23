#pragma once
#include "FitTypes.h"

#include <map>
#include <string>
#include <utility>

namespace fit {

/** Description of a developer field, built from a field description
 * message.  Key is (DeveloperDataIndex, FieldNumber). */
struct DeveloperFieldMeta
{
    DeveloperFieldMeta();

    uint8_t DeveloperDataIndex;
    uint8_t FieldNumber;
    uint8_t BaseType;
    std::string Name;                   // empty if not present
    std::string Units;                  // empty if not present
    FitUint8 Scale;
    FitSint8 Offset;
    FitUint16 NativeMessage;
    FitUint8 NativeField;
};

std::ostream& operator<<(std::ostream &o, const DeveloperFieldMeta &m);

/** The application which owns a developer data index, built from a
 * developer data id message. */
struct DeveloperDataId
{
    DeveloperDataId();

    uint8_t DeveloperDataIndex;
    Buffer DeveloperId;
    Buffer ApplicationId;
    FitUint16 ManufacturerId;
    FitUint32 ApplicationVersion;
};


// ............................................. DeveloperFieldRegistry ....

/** Collects developer data id and field description messages as they are
 * decoded, so that developer fields in later data messages can be
 * resolved.  Descriptions are looked up when a data message is decoded, not
 * when its definition is read, as they may come later or not at all. */
class DeveloperFieldRegistry
{
public:
    /** Record a field description from the fields of a field description
     * message (global message 206).  Returns the stored description, or
     * nullptr if the message lacks the developer data index, field number
     * or base type.  A description for an existing key replaces it. */
    const DeveloperFieldMeta* AddFieldDescription(const FieldList &fields);

    /** Record a developer data id message (global message 207).  Returns
     * nullptr if the message has no developer data index. */
    const DeveloperDataId* AddDeveloperDataId(const FieldList &fields);

    const DeveloperFieldMeta* FindField(uint8_t dev_index, uint8_t field_num) const;
    const DeveloperDataId* FindDeveloper(uint8_t dev_index) const;

    size_t FieldCount() const { return m_Fields.size(); }
    size_t DeveloperCount() const { return m_Developers.size(); }
    void Clear();

private:
    typedef std::pair<uint8_t, uint8_t> Key;
    std::map<Key, DeveloperFieldMeta> m_Fields;
    std::map<uint8_t, DeveloperDataId> m_Developers;
};

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
