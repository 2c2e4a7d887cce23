#pragma once

#include "ByteSource.h"

#include <string>
#include <exception>

namespace FitDecode
{
    /** Convenience class to throw exception with errno error codes and get
     * proper error names for them. */
    class UnixException : public std::exception
    {
    public:
        UnixException(const char *who, int error_code);
        UnixException(const std::string &who, int error_code);
        const char* what() const noexcept(true) override;
        int error_code() const { return m_ErrorCode; }

    private:
        std::string m_Who;
        int m_ErrorCode;
        mutable std::string m_Message;
        mutable bool m_MessageDone;
    };

    /** Byte source reading a file sequentially with read(2).  Data is read
     * in chunks, so the whole file is never held in memory.  An exception
     * is thrown if the file cannot be opened or read.
     */
    class FileSource : public fit::ByteSource
    {
    public:
        explicit FileSource(const std::string &file_name);
        ~FileSource();

        size_t Read(unsigned char *buf, size_t n) override;

        const std::string& FileName() const { return m_FileName; }

    private:
        FileSource(const FileSource&) = delete;
        FileSource& operator=(const FileSource&) = delete;

        std::string m_FileName;
        int m_Fd;
    };

};                                      // end namespace FitDecode

/*
    Local Variables:
    mode: c++
    End:
*/
