// tests/test_framework/test_entrypoint.h
#pragma once

#include "fsp_base.hpp"
#include <gtest/gtest.h>
/**
 * @file test_entrypoint.h
 * @brief Provides an API for registering worker scenario dispatchers.
 */

// Path of the running test binary, used by worker-spawning tests.
extern std::string g_self_exe_path;

/**
 * @brief Type definition for a worker scenario dispatcher function.
 *
 * A dispatcher takes the arguments of `main()`, matches `argv[1]` against the
 * scenarios it knows and runs the corresponding worker. It returns the worker's
 * exit code, or -1 when the scenario is not one of its own.
 */
using WorkerDispatchFn = int (*)(int argc, char **argv);

/**
 * @brief Registers a worker scenario dispatcher with the test entry point.
 *
 * Worker translation units call this from a static initializer, so each test
 * executable dispatches exactly the workers it links.
 */
void register_worker_dispatcher(WorkerDispatchFn fn);
