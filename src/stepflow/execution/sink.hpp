/**
 * @file sink.hpp
 * @brief ISink interface and the bundled sink implementations.
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

/**
 * @brief Destination of a step process's standard output and error.
 *
 * @details
 * ProcessRunner duplicates these descriptors onto the child's fd 1 and 2. The
 * sink owns the descriptors; opening and closing them is its responsibility.
 * Every concurrently running step writes to the same sink.
 */
class ISink
{
public:
    virtual ~ISink() = default;

    virtual int stdout_fd() const noexcept = 0;
    virtual int stderr_fd() const noexcept = 0;
};

using SinkPtr = std::shared_ptr<ISink>;

/**
 * @brief Passes the parent's own stdout and stderr through to the child.
 */
class InheritedSink : public ISink
{
public:
    int stdout_fd() const noexcept override;
    int stderr_fd() const noexcept override;
};

/**
 * @brief Discards all output (`/dev/null`).
 */
class NullSink : public ISink
{
public:
    /**
     * @throws std::system_error if `/dev/null` cannot be opened.
     */
    NullSink();
    ~NullSink() override;

    NullSink(const NullSink&) = delete;
    NullSink& operator=(const NullSink&) = delete;

    int stdout_fd() const noexcept override { return m_fd; }
    int stderr_fd() const noexcept override { return m_fd; }

private:
    int m_fd{-1};
};

/**
 * @brief Appends stdout and stderr to two files.
 *
 * @details Both paths may name the same file; it is then opened once.
 */
class FileSink : public ISink
{
public:
    /**
     * @throws std::system_error if a file cannot be opened.
     */
    FileSink(const std::string& stdout_path, const std::string& stderr_path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    int stdout_fd() const noexcept override { return m_out_fd; }
    int stderr_fd() const noexcept override { return m_err_fd; }

private:
    int m_out_fd{-1};
    int m_err_fd{-1};
};

} // namespace stepflow
