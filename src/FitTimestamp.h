#pragma once
#include "FitTypes.h"

namespace fit {

/** Seconds between the UNIX epoch and the FIT epoch (UTC 00:00:00 Dec 31
 * 1989). */
const uint32_t fit_epoch = 631065600;

/** Convert a FIT timestamp into a UNIX timestamp. */
inline int64_t FitTimeToUnix(uint32_t fit_time)
{
    return static_cast<int64_t>(fit_time) + fit_epoch;
}

// ................................................... TimestampTracker ....

/** Keeps track of the last absolute timestamp seen in a FIT file, and
 * expands compressed timestamp headers relative to it. */
class TimestampTracker
{
public:
    static const uint32_t OFFSET_MASK = 0x1F;
    static const uint32_t ROLLOVER = 0x20;

    TimestampTracker();

    bool HasTimestamp() const { return ! m_Last.isNA(); }

    /** Last timestamp seen, NA if there was none. */
    FitUint32 Last() const { return m_Last; }

    /** Record an absolute timestamp, from a timestamp field. */
    void Update(uint32_t timestamp);

    /** Expand the 5 bit 'offset' from a compressed timestamp header into an
     * absolute timestamp and make it the last timestamp.  The low 5 bits of
     * the last timestamp are replaced by 'offset', and if that moves back
     * in time, 32 seconds are added.  Throws BadFitFile (E_NO_TIMESTAMP)
     * if no timestamp was seen yet.
     */
    uint32_t Expand(unsigned offset);

    void Reset();

private:
    FitUint32 m_Last;
};

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
