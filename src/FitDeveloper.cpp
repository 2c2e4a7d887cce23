#include "FitDeveloper.h"

#include <iostream>

namespace {
using namespace fit;

// Field numbers in the field description message
enum {
    FD_DEVELOPER_DATA_INDEX = 0,
    FD_FIELD_DEFINITION_NUMBER = 1,
    FD_FIT_BASE_TYPE_ID = 2,
    FD_FIELD_NAME = 3,
    FD_SCALE = 6,
    FD_OFFSET = 7,
    FD_UNITS = 8,
    FD_NATIVE_MESG_NUM = 14,
    FD_NATIVE_FIELD_NUM = 15
};

// Field numbers in the developer data id message
enum {
    DD_DEVELOPER_ID = 0,
    DD_APPLICATION_ID = 1,
    DD_MANUFACTURER_ID = 2,
    DD_DEVELOPER_DATA_INDEX = 3,
    DD_APPLICATION_VERSION = 4
};

std::string GetString(const FieldValue &v)
{
    if (v.Kind() == VK_STRING)
        return v.String();
    return std::string();
}

Buffer GetBytes(const FieldValue &v)
{
    Buffer b;
    if (v.Kind() == VK_BYTES) {
        b = v.Bytes();
    } else if (v.Kind() == VK_ARRAY) {
        for (const auto &s : v.Array())
            b.push_back(s.IsAbsent() ? 0xFF : static_cast<unsigned char>(s.AsUint()));
    } else if (v.IsScalar()) {
        b.push_back(static_cast<unsigned char>(v.AsUint()));
    }
    return b;
}

};                                      // end anonymous namespace

namespace fit {

DeveloperFieldMeta::DeveloperFieldMeta()
    : DeveloperDataIndex (0),
      FieldNumber (0),
      BaseType (0)
{
    // empty
}

std::ostream& operator<<(std::ostream &o, const DeveloperFieldMeta &m)
{
    o << "#<DevField index: " << (int)m.DeveloperDataIndex
      << " number: " << (int)m.FieldNumber
      << " type: 0x" << std::hex << (int)m.BaseType << std::dec;
    if (! m.Name.empty())
        o << " name: " << m.Name;
    if (! m.Units.empty())
        o << " units: " << m.Units;
    o << ">";
    return o;
}

DeveloperDataId::DeveloperDataId()
    : DeveloperDataIndex (0)
{
    // empty
}


// ............................................. DeveloperFieldRegistry ....

const DeveloperFieldMeta* DeveloperFieldRegistry::AddFieldDescription(const FieldList &fields)
{
    FitUint8 dev_index, field_num, base_type;
    DeveloperFieldMeta meta;

    for (const auto &f : fields) {
        if (f.IsDeveloperField())
            continue;
        switch (f.FieldNumber()) {
        case FD_DEVELOPER_DATA_INDEX: dev_index = FieldAs<FitUint8>(f); break;
        case FD_FIELD_DEFINITION_NUMBER: field_num = FieldAs<FitUint8>(f); break;
        case FD_FIT_BASE_TYPE_ID: base_type = FieldAs<FitUint8>(f); break;
        case FD_FIELD_NAME: meta.Name = GetString(f); break;
        case FD_SCALE: meta.Scale = FieldAs<FitUint8>(f); break;
        case FD_OFFSET: meta.Offset = FieldAs<FitSint8>(f); break;
        case FD_UNITS: meta.Units = GetString(f); break;
        case FD_NATIVE_MESG_NUM: meta.NativeMessage = FieldAs<FitUint16>(f); break;
        case FD_NATIVE_FIELD_NUM: meta.NativeField = FieldAs<FitUint8>(f); break;
            // silently ignore all other field types
        }
    }

    if (dev_index.isNA() || field_num.isNA() || base_type.isNA())
        return nullptr;

    meta.DeveloperDataIndex = dev_index;
    meta.FieldNumber = field_num;
    meta.BaseType = base_type;
    Key key(meta.DeveloperDataIndex, meta.FieldNumber);
    m_Fields[key] = meta;
    return &m_Fields[key];
}

const DeveloperDataId* DeveloperFieldRegistry::AddDeveloperDataId(const FieldList &fields)
{
    FitUint8 dev_index;
    DeveloperDataId id;

    for (const auto &f : fields) {
        if (f.IsDeveloperField())
            continue;
        switch (f.FieldNumber()) {
        case DD_DEVELOPER_ID: id.DeveloperId = GetBytes(f); break;
        case DD_APPLICATION_ID: id.ApplicationId = GetBytes(f); break;
        case DD_MANUFACTURER_ID: id.ManufacturerId = FieldAs<FitUint16>(f); break;
        case DD_DEVELOPER_DATA_INDEX: dev_index = FieldAs<FitUint8>(f); break;
        case DD_APPLICATION_VERSION: id.ApplicationVersion = FieldAs<FitUint32>(f); break;
            // silently ignore all other field types
        }
    }

    if (dev_index.isNA())
        return nullptr;

    id.DeveloperDataIndex = dev_index;
    m_Developers[id.DeveloperDataIndex] = id;
    return &m_Developers[id.DeveloperDataIndex];
}

const DeveloperFieldMeta* DeveloperFieldRegistry::FindField(uint8_t dev_index, uint8_t field_num) const
{
    auto pos = m_Fields.find(Key(dev_index, field_num));
    if (pos == m_Fields.end())
        return nullptr;
    return &pos->second;
}

const DeveloperDataId* DeveloperFieldRegistry::FindDeveloper(uint8_t dev_index) const
{
    auto pos = m_Developers.find(dev_index);
    if (pos == m_Developers.end())
        return nullptr;
    return &pos->second;
}

void DeveloperFieldRegistry::Clear()
{
    m_Fields.clear();
    m_Developers.clear();
}

};                                      // end namespace fit
