#pragma once
#include <stdint.h>
#include <exception>
#include <string>

namespace fit {

/** Error codes for everything that can go wrong while decoding a FIT file.
 * All of them, except E_DEV_FIELD, abort the decoding of the current file.
 */
enum FitError {
    E_OK = 0,
    E_INVALID_HEADER,                   // bad header length or signature
    E_HEADER_CRC,                       // bad header checksum
    E_FILE_CRC,                         // bad payload checksum
    E_DATA_SIZE,                        // record extends past the data size
    E_EOF,                              // stream ended before the data size
    E_LOCAL_MESSAGE,                    // data message without a definition
    E_DEV_FIELD,                        // developer field with no description
    E_NO_TIMESTAMP,                     // compressed timestamp, no reference
    E_BASE_TYPE                         // unknown base type
};

/** Return a short description for the FitError code 'e'. */
const char* FitErrorStr (int e);


// ......................................................... BadFitFile ....

/** Exception thrown when a FIT file cannot be decoded.  ErrorCode() tells
 * what went wrong, the message also names the function that detected the
 * problem. */
class BadFitFile : public std::exception
{
public:
    BadFitFile (const char *who, int error);
    BadFitFile (const std::string &who, int error);
    virtual ~BadFitFile();

    const char* what() const noexcept(true) override;
    int ErrorCode() const { return m_Error; }

protected:
    virtual void FormatMessage(std::string &msg) const;
    const std::string& Who() const { return m_Who; }

private:
    int m_Error;
    std::string m_Who;
    mutable std::string m_Message;
    mutable bool m_MessageDone;
};


// .......................................................... BadTypeId ....

/** Exception thrown when an unknown FIT base type is needed to decode a
 * field. */
class BadTypeId : public BadFitFile
{
public:
    BadTypeId (const char *who, int type_id);
    ~BadTypeId();

    int TypeId() const { return m_TypeId; }

protected:
    void FormatMessage(std::string &msg) const override;

private:
    int m_TypeId;
};


// .................................................. BadLocalMessageId ....

/** Exception thrown when the code encounters a local message ID that was not
 * defined yet.
 */
class BadLocalMessageId : public BadFitFile
{
public:
    BadLocalMessageId (const char *who, int local_id);
    ~BadLocalMessageId();

    int LocalMessageId() const { return m_LocalMessageId; }

protected:
    void FormatMessage(std::string &msg) const override;

private:
    int m_LocalMessageId;
};

};                                      // end namespace fit

/*
    Local Variables:
    mode: c++
    End:
*/
