#include "fsp_service.hpp"
#include "utils/lock_metrics.hpp"

namespace fspec::utils
{

const char *to_string(LockType type) noexcept
{
    return type == LockType::Read ? "READ" : "WRITE";
}

std::string LockMetrics::format_record(LockType type, const std::filesystem::path &path,
                                       std::chrono::milliseconds wait,
                                       std::chrono::milliseconds hold, int retries)
{
    return fmt::format("[LOCK] Acquired {} lock on {} (waited {}ms, held {}ms, retries {})",
                       to_string(type), path.string(), wait.count(), hold.count(), retries);
}

void LockMetrics::record(LockType type, const std::filesystem::path &path,
                         std::chrono::milliseconds wait, std::chrono::milliseconds hold,
                         int retries) const
{
    if (!m_enabled)
    {
        return;
    }
    LOGGER_DEBUG("{}", format_record(type, path, wait, hold, retries));
}

} // namespace fspec::utils
