#pragma once
/**
 * @file uid_utils.hpp
 * @brief Unique names for temporary files and lock ownership tokens.
 *
 * ## Formats
 *
 *   Temp suffix:  {PID}_{8HEX}              e.g. "4242_3A7F2B1C"
 *   Lock token:   {PID}-{8HEX}{8HEX}        e.g. "4242-9E1D4C2AB3F12E9A"
 *
 * The PID keeps names from different processes apart; the random part keeps
 * names from different threads and successive calls apart. A lock token is
 * compared byte-for-byte to decide whether a lock file still belongs to us.
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

#include "fsp_platform.hpp"

namespace fspec::uid
{

namespace detail
{

/// Returns a 32-bit random value.
/// Prefers std::random_device; falls back to a high-res-clock+Knuth hash on failure.
inline uint32_t random_u32()
{
    try
    {
        std::random_device rd;
        if (rd.entropy() > 0.0)
        {
            return rd();
        }
    }
    catch (const std::exception &)
    {
        // random_device may throw when no entropy source is available.
    }
    const auto ns = static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    return static_cast<uint32_t>((ns ^ (ns >> 17U)) * 2654435761ULL);
}

} // namespace detail

/**
 * @brief Suffix for a temporary write file: @c "{PID}_{8HEX}".
 */
inline std::string generate_temp_suffix()
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%llu_%08X",
                  static_cast<unsigned long long>(platform::get_pid()), detail::random_u32());
    return buf;
}

/**
 * @brief Ownership token written into a lock file: @c "{PID}-{16HEX}".
 */
inline std::string generate_lock_token()
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%llu-%08X%08X",
                  static_cast<unsigned long long>(platform::get_pid()), detail::random_u32(),
                  detail::random_u32());
    return buf;
}

} // namespace fspec::uid
