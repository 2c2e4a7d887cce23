#include "LinuxUtil.h"

#include <sstream>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

namespace FitDecode
{

    UnixException::UnixException(const char *who, int error_code)
        : m_Who(who), m_ErrorCode(error_code), m_MessageDone(false)
    {
        // empty
    }

    UnixException::UnixException(const std::string &who, int error_code)
        : m_Who(who), m_ErrorCode(error_code), m_MessageDone(false)
    {
        // empty
    }

    const char* UnixException::what() const noexcept(true)
    {
        if (!m_MessageDone) {
            std::ostringstream msg;
            msg << m_Who << ": (" << m_ErrorCode << ") " << strerror(m_ErrorCode);
            m_Message = msg.str();
            m_MessageDone = true;
        }
        return m_Message.c_str();
    }

    FileSource::FileSource(const std::string &file_name)
        : m_FileName(file_name),
          m_Fd(-1)
    {
        m_Fd = ::open(file_name.c_str(), O_RDONLY);
        if (m_Fd == -1) {
            std::ostringstream who;
            who << "FileSource: open " << file_name;
            throw UnixException(who.str(), errno);
        }
    }

    FileSource::~FileSource()
    {
        if (m_Fd != -1)
            ::close(m_Fd);
    }

    size_t FileSource::Read(unsigned char *buf, size_t n)
    {
        // read(2) may return less than asked for, keep going until we have
        // 'n' bytes or reach the end of the file.
        size_t total = 0;
        while (total < n) {
            ssize_t r = ::read(m_Fd, buf + total, n - total);
            if (r < 0) {
                if (errno == EINTR)
                    continue;
                throw UnixException("FileSource: read", errno);
            }
            else if (r == 0) {          // End of file
                break;
            }
            total += r;
        }
        return total;
    }

};                                      // end namespace FitDecode
