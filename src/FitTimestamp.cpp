#include "FitTimestamp.h"
#include "FitErrors.h"

namespace fit {

TimestampTracker::TimestampTracker()
{
    // empty, m_Last starts out as NA
}

void TimestampTracker::Update(uint32_t timestamp)
{
    m_Last = timestamp;
}

uint32_t TimestampTracker::Expand(unsigned offset)
{
    if (! HasTimestamp())
        throw BadFitFile ("TimestampTracker::Expand", E_NO_TIMESTAMP);

    offset &= OFFSET_MASK;
    uint32_t last = m_Last;
    uint32_t ts = (last & ~OFFSET_MASK) + offset;
    if (offset < (last & OFFSET_MASK))
        ts += ROLLOVER;
    m_Last = ts;
    return ts;
}

void TimestampTracker::Reset()
{
    m_Last = FitUint32();
}

};                                      // end namespace fit
