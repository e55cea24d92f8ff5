#pragma once
/**
 * @file fsp_filestore.hpp
 * @brief Layer 3: The locked JSON file store built on fsp_service.
 *
 * Include this single header for LockedFileManager and its building blocks:
 * the in-process readers-writer registry, the lock-file based inter-process
 * lock, the atomic writer, lock configuration and lock metrics.
 */
#include "fsp_service.hpp"

#include <nlohmann/json.hpp>

#include "utils/lock_errors.hpp"
#include "utils/lock_config.hpp"
#include "utils/lock_metrics.hpp"
#include "utils/atomic_writer.hpp"
#include "utils/in_process_lock.hpp"
#include "utils/inter_process_lock.hpp"
#include "utils/locked_file_manager.hpp"
