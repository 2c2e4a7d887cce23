#include "FitDefinitions.h"

#include <iostream>
#include <stdexcept>

namespace fit {

MessageDef::MessageDef()
    : LocalNumber (0),
      GlobalNumber (0),
      BigEndian (false),
      DataMessageSize (0)
{
    // empty
}

void MessageDef::ComputeSize()
{
    int size = 0;
    for (const auto &f : Fields)
        size += f.Size;
    for (const auto &f : DevFields)
        size += f.Size;
    DataMessageSize = size;
}

std::ostream& operator<<(std::ostream &o, const MessageDef &m)
{
    o << "#<MDEF local: " << m.LocalNumber << " global: " << m.GlobalNumber
      << (m.BigEndian ? " big-endian" : "")
      << " size: " << m.DataMessageSize << " fields: " << m.Fields.size()
      << " dev fields: " << m.DevFields.size() << ">";
    return o;
}


// .................................................... DefinitionTable ....

DefinitionTable::DefinitionTable()
{
    Clear();
}

void DefinitionTable::Define(const MessageDef &mdef)
{
    if (mdef.LocalNumber < 0 || mdef.LocalNumber >= MAX_LOCAL_TYPES)
        throw std::out_of_range("DefinitionTable::Define: bad local message type");
    m_Definitions[mdef.LocalNumber] = mdef;
    m_Defined[mdef.LocalNumber] = true;
}

const MessageDef* DefinitionTable::Find(int local) const
{
    if (local < 0 || local >= MAX_LOCAL_TYPES || ! m_Defined[local])
        return nullptr;
    return &m_Definitions[local];
}

void DefinitionTable::Clear()
{
    for (int i = 0; i < MAX_LOCAL_TYPES; ++i) {
        m_Definitions[i] = MessageDef();
        m_Defined[i] = false;
    }
}

};                                      // end namespace fit
