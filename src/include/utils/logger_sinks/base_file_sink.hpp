#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "fsp_platform.hpp"

namespace fspec::utils
{

/**
 * @class BaseFileSink
 * @brief Cross-platform append-only file handle used by FileSink.
 *
 * Not a Sink itself: it opens, writes, flushes and closes one file. With
 * `use_flock` each write is wrapped in an exclusive `flock`, so several
 * processes can append to the same log file without interleaving lines.
 */
class BaseFileSink
{
  public:
    BaseFileSink();
    virtual ~BaseFileSink();

    BaseFileSink(const BaseFileSink &) = delete;
    BaseFileSink &operator=(const BaseFileSink &) = delete;
    BaseFileSink(BaseFileSink &&) = delete;
    BaseFileSink &operator=(BaseFileSink &&) = delete;

  protected:
    /**
     * @brief Opens `path` for appending, creating it if needed.
     * @throws std::system_error on failure.
     */
    void open(const std::filesystem::path &path, bool use_flock);

    void close();

    /**
     * @brief Appends `content` in a single write call.
     * @throws std::system_error on a failed or short write.
     */
    void fwrite(const std::string &content);

    void fflush();

    bool is_open() const;

    const std::filesystem::path &path() const { return m_path; }

    std::filesystem::path m_path;
    bool m_use_flock = false;

#ifdef FSPEC_PLATFORM_WIN64
    void *m_file_handle = nullptr;
#else
    int m_fd = -1;
#endif
};

} // namespace fspec::utils
