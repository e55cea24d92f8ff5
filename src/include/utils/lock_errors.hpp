#pragma once
/**
 * @file lock_errors.hpp
 * @brief Exceptions thrown by LockedFileManager.
 *
 * The lock primitives below the manager report through `std::error_code`; the
 * manager maps those codes onto this hierarchy:
 *
 *   std::errc::timed_out   -> LockTimeoutError
 *   std::errc::owner_dead  -> LockCompromisedError
 *   JSON syntax or schema  -> ParseError
 *   anything else          -> std::filesystem::filesystem_error
 *
 * Exceptions thrown by a transaction's mutate function are not wrapped; they
 * reach the caller unchanged.
 */
#include <filesystem>
#include <stdexcept>
#include <string>

#include "fspec_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251 4275)
#endif

namespace fspec::utils
{

class FSPEC_UTILS_EXPORT LockedFileError : public std::runtime_error
{
  public:
    LockedFileError(const std::string &what, std::filesystem::path path)
        : std::runtime_error(what), m_path(std::move(path))
    {
    }

    /// The managed file the failed operation was about.
    const std::filesystem::path &path() const noexcept { return m_path; }

  private:
    std::filesystem::path m_path;
};

/// The inter-process lock could not be acquired within the retry budget.
class FSPEC_UTILS_EXPORT LockTimeoutError : public LockedFileError
{
  public:
    using LockedFileError::LockedFileError;
};

/// The lock file was removed or taken over by another owner while we held it.
class FSPEC_UTILS_EXPORT LockCompromisedError : public LockedFileError
{
  public:
    using LockedFileError::LockedFileError;
};

/// The file is not valid JSON, or does not convert to the requested type.
class FSPEC_UTILS_EXPORT ParseError : public LockedFileError
{
  public:
    using LockedFileError::LockedFileError;
};

} // namespace fspec::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
