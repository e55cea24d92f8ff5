#pragma once
/**
 * @file atomic_writer.hpp
 * @brief Write-to-temp-then-rename replacement of a whole file.
 *
 * Readers opening the target concurrently see either the complete old content or
 * the complete new content, never a partial file. Steps, in order:
 *
 *   1. create the parent directory if it is missing,
 *   2. refuse a target that is a symbolic link (`operation_not_permitted`),
 *   3. create `{target}.tmp.{pid}_{8HEX}` beside the target with `O_EXCL`,
 *   4. write everything, fsync, copy the target's permission bits, close,
 *   5. rename over the target (retried on EBUSY/ETXTBSY/EINTR),
 *   6. fsync the parent directory (best effort).
 *
 * A failure in steps 3 to 5 unlinks the temp file; the target is never touched.
 */
#include <filesystem>
#include <string_view>
#include <system_error>

#include "fspec_utils_export.h"

namespace fspec::utils
{

/**
 * @brief Atomically replaces @p target with @p content.
 * @param ec Cleared on success; on failure holds the OS error (also logged at error level).
 */
FSPEC_UTILS_EXPORT void atomic_write_file(const std::filesystem::path &target,
                                          std::string_view content,
                                          std::error_code &ec) noexcept;

/// Name for a fresh temp file beside @p target: `{target}.tmp.{pid}_{8HEX}`.
FSPEC_UTILS_EXPORT std::filesystem::path make_temp_path(const std::filesystem::path &target);

} // namespace fspec::utils
