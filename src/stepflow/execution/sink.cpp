#include "stepflow/execution/sink.hpp"

#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace stepflow
{

namespace
{

int open_or_throw(const std::string& path, int flags)
{
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        throw std::system_error(errno, std::generic_category(), "Cannot open '" + path + "'");
    }
    return fd;
}

} // namespace

int InheritedSink::stdout_fd() const noexcept
{
    return STDOUT_FILENO;
}

int InheritedSink::stderr_fd() const noexcept
{
    return STDERR_FILENO;
}

NullSink::NullSink()
    : m_fd{open_or_throw("/dev/null", O_WRONLY)}
{}

NullSink::~NullSink()
{
    ::close(m_fd);
}

FileSink::FileSink(const std::string& stdout_path, const std::string& stderr_path)
{
    const int flags = O_WRONLY | O_CREAT | O_APPEND;
    m_out_fd = open_or_throw(stdout_path, flags);
    if (stderr_path == stdout_path)
    {
        m_err_fd = m_out_fd;
        return;
    }
    try
    {
        m_err_fd = open_or_throw(stderr_path, flags);
    }
    catch (...)
    {
        ::close(m_out_fd);
        throw;
    }
}

FileSink::~FileSink()
{
    if (m_err_fd != m_out_fd)
    {
        ::close(m_err_fd);
    }
    ::close(m_out_fd);
}

} // namespace stepflow
