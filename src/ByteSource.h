#pragma once
#include "FitTypes.h"

#include <stddef.h>

namespace fit {

/** Sequential source of bytes for the FIT decoder.  The decoder only reads
 * forward and never seeks. */
class ByteSource
{
public:
    virtual ~ByteSource();

    /** Read up to 'n' bytes into 'buf'.  Returns the number of bytes read,
     * which is less than 'n' only when the end of the data was reached. */
    virtual size_t Read(unsigned char *buf, size_t n) = 0;
};


// ....................................................... BufferSource ....

/** Byte source reading from memory.  The data must outlive the source. */
class BufferSource : public ByteSource
{
public:
    BufferSource(const unsigned char *data, size_t size);
    explicit BufferSource(const Buffer &data);
    ~BufferSource();

    size_t Read(unsigned char *buf, size_t n) override;
    size_t Position() const { return m_Pos; }

private:
    const unsigned char *m_Data;
    size_t m_Size;
    size_t m_Pos;
};

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
