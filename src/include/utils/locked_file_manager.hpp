#pragma once
/**
 * @file locked_file_manager.hpp
 * @brief Locked read and read-modify-write access to shared JSON state files.
 *
 * Every operation takes the inter-process lock first and the in-process lock
 * second, and releases them in the opposite order on every exit path.
 *
 * ```cpp
 * fspec::utils::InProcessLockRegistry registry;
 * fspec::utils::LockedFileManager files(registry);
 *
 * auto units = files.read_json("/work/units.json", {{"units", nlohmann::json::array()}});
 *
 * files.transaction("/work/units.json", [&](nlohmann::json &doc) {
 *     doc["units"].push_back(new_unit);
 * });
 * ```
 *
 * A transaction whose function throws writes nothing; the exception reaches
 * the caller unchanged. Updates to several files are separate transactions and
 * are not atomic as a group.
 *
 * Typed variants convert through nlohmann's `from_json`/`to_json`:
 *
 * ```cpp
 * struct Counter { int count = 0; };
 * NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Counter, count)
 *
 * files.transaction<Counter>(path, [](Counter &c) { ++c.count; });
 * Counter c = files.read_json(path, Counter{});
 * ```
 *
 * Errors (see lock_errors.hpp): LockTimeoutError, LockCompromisedError,
 * ParseError, std::filesystem::filesystem_error for I/O failures.
 */
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "fspec_utils_export.h"
#include "utils/in_process_lock.hpp"
#include "utils/lock_config.hpp"
#include "utils/lock_errors.hpp"
#include "utils/lock_metrics.hpp"

namespace fspec::utils
{

class FSPEC_UTILS_EXPORT LockedFileManager
{
  public:
    using MutateFn = std::function<void(nlohmann::json &)>;

    /**
     * @brief Uses `LockConfig::current()`.
     * @note Panics unless the InterProcessLock and LockConfig modules are initialized.
     */
    explicit LockedFileManager(InProcessLockRegistry &registry);

    LockedFileManager(InProcessLockRegistry &registry, LockConfig config);

    /**
     * @brief Reads and parses @p path under a shared lock.
     *
     * When the file does not exist it is created with @p default_value under an
     * exclusive lock, unless another caller created it first; either way the
     * current content is returned.
     */
    nlohmann::json read_json(const std::filesystem::path &path,
                             const nlohmann::json &default_value);

    /// Typed read; ParseError if the content does not convert to T.
    template <typename T> T read_json(const std::filesystem::path &path, const T &default_value);

    /**
     * @brief Read-modify-write of @p path under an exclusive lock.
     *
     * @p fn receives the parsed document (an empty object when the file does not
     * exist) and mutates it in place. The result is written with
     * `atomic_write_file` only if @p fn returns normally.
     */
    void transaction(const std::filesystem::path &path, const MutateFn &fn);

    /**
     * @brief Typed transaction; @p fn is called with a `T&`.
     * @note A missing file starts as `{}`, so T must be constructible from an empty object.
     */
    template <typename T, typename Fn> void transaction(const std::filesystem::path &path, Fn &&fn);

    const LockConfig &config() const noexcept { return m_config; }
    InProcessLockRegistry &registry() noexcept { return m_registry; }

    /// Two-space indented JSON followed by a newline.
    static std::string serialize(const nlohmann::json &doc, const std::filesystem::path &path);

  private:
    template <typename T> static T convert(const nlohmann::json &doc, const std::filesystem::path &path);

    nlohmann::json create_default(const std::filesystem::path &target,
                                  const nlohmann::json &default_value);

    InProcessLockRegistry &m_registry;
    LockConfig m_config;
    LockMetrics m_metrics;
};

template <typename T>
T LockedFileManager::convert(const nlohmann::json &doc, const std::filesystem::path &path)
{
    try
    {
        return doc.get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ParseError(fmt::format("Content of '{}' does not match the expected type: {}",
                                     path.string(), e.what()),
                         path);
    }
}

template <typename T>
T LockedFileManager::read_json(const std::filesystem::path &path, const T &default_value)
{
    const nlohmann::json doc = read_json(path, nlohmann::json(default_value));
    return convert<T>(doc, path);
}

template <typename T, typename Fn>
void LockedFileManager::transaction(const std::filesystem::path &path, Fn &&fn)
{
    static_assert(std::is_invocable_v<Fn &, T &>, "transaction<T>: fn must accept T&");
    transaction(path,
                [&](nlohmann::json &doc)
                {
                    T value = convert<T>(doc, path);
                    std::invoke(fn, value);
                    doc = nlohmann::json(value);
                });
}

} // namespace fspec::utils
