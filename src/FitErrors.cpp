#include "FitErrors.h"

#include <sstream>

namespace fit {

const char* FitErrorStr (int e)
{
    switch(e) {
    case E_OK: return "OK";
    case E_INVALID_HEADER: return "bad header";
    case E_HEADER_CRC: return "bad header checksum";
    case E_FILE_CRC: return "bad payload checksum";
    case E_DATA_SIZE: return "record extends past declared data size";
    case E_EOF: return "short payload";
    case E_LOCAL_MESSAGE: return "unknown local message id";
    case E_DEV_FIELD: return "unresolved developer field";
    case E_NO_TIMESTAMP: return "compressed timestamp without a reference timestamp";
    case E_BASE_TYPE: return "bad FIT type id";
    default: return "unknown";
    }
}


// ......................................................... BadFitFile ....

BadFitFile::BadFitFile (const char *who, int error)
    : m_Error (error),
      m_Who (who),
      m_MessageDone (false)
{
    // empty
}

BadFitFile::BadFitFile (const std::string &who, int error)
    : m_Error (error),
      m_Who (who),
      m_MessageDone (false)
{
    // empty
}

BadFitFile::~BadFitFile()
{
    // empty
}

const char* BadFitFile::what() const noexcept(true)
{
    if (! m_MessageDone) {
        FormatMessage(m_Message);
        m_MessageDone = true;
    }
    return m_Message.c_str();
}

void BadFitFile::FormatMessage(std::string &msg) const
{
    std::ostringstream o;
    o << m_Who << ": " << FitErrorStr (m_Error);
    msg = o.str();
}


// .......................................................... BadTypeId ....

BadTypeId::BadTypeId (const char *who, int type_id)
    : BadFitFile (who, E_BASE_TYPE),
      m_TypeId (type_id)
{
    // empty
}

BadTypeId::~BadTypeId()
{
    // empty
}

void BadTypeId::FormatMessage(std::string &msg) const
{
    std::ostringstream o;
    o << Who() << ": bad FIT type id, 0x" << std::hex << m_TypeId;
    msg = o.str();
}


// .................................................. BadLocalMessageId ....

BadLocalMessageId::BadLocalMessageId (const char *who, int local_id)
    : BadFitFile (who, E_LOCAL_MESSAGE),
      m_LocalMessageId (local_id)
{
    // empty
}

BadLocalMessageId::~BadLocalMessageId()
{
    // empty
}

void BadLocalMessageId::FormatMessage(std::string &msg) const
{
    std::ostringstream o;
    o << Who() << ": unknown local message id, " << m_LocalMessageId;
    msg = o.str();
}

};                                      // end namespace fit
