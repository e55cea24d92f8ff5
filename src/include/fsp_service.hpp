#pragma once
/**
 * @file fsp_service.hpp
 * @brief Layer 2: Service modules built on fsp_base.
 *
 * Provides lifecycle management, logging and backoff strategies for retry loops.
 */
#include "fsp_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
