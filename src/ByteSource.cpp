#include "ByteSource.h"

#include <string.h>

namespace fit {

ByteSource::~ByteSource()
{
    // empty
}


// ....................................................... BufferSource ....

BufferSource::BufferSource(const unsigned char *data, size_t size)
    : m_Data (data),
      m_Size (size),
      m_Pos (0)
{
    // empty
}

BufferSource::BufferSource(const Buffer &data)
    : m_Data (data.empty() ? nullptr : &data[0]),
      m_Size (data.size()),
      m_Pos (0)
{
    // empty
}

BufferSource::~BufferSource()
{
    // empty
}

size_t BufferSource::Read(unsigned char *buf, size_t n)
{
    size_t avail = m_Size - m_Pos;
    if (n > avail)
        n = avail;
    if (n > 0) {
        memcpy(buf, m_Data + m_Pos, n);
        m_Pos += n;
    }
    return n;
}

};                                      // end namespace fit
