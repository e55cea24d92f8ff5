// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point for test executables using the isolated-process harness.
 *
 * 1. **Worker mode**: started with a "module.scenario" argument, the binary runs
 *    the matching registered worker. Workers own their lifecycle through
 *    `run_gtest_worker()` or `run_worker_bare()`.
 *
 * 2. **Test runner mode**: GoogleTest runs with no lifecycle initialized. Tests
 *    that need lifecycle modules either spawn a worker via
 *    IsolatedProcessTest::SpawnWorker() or hold a suite-level LifecycleGuard.
 */
#include "test_entrypoint.h"
#include "fsp_base.hpp"
#include <vector>

std::string g_self_exe_path;

// Function-local static avoids static-init-order issues with the registrars.
static std::vector<WorkerDispatchFn> &worker_dispatchers()
{
    static std::vector<WorkerDispatchFn> list;
    return list;
}

void register_worker_dispatcher(WorkerDispatchFn fn)
{
    worker_dispatchers().push_back(fn);
}

int main(int argc, char **argv)
{
    g_self_exe_path = (argc >= 1) ? argv[0] : "";

    if (argc > 1)
    {
        std::string mode_str = argv[1];
        // GoogleTest flags ("--gtest_filter=Suite.Case") are not scenarios.
        if (mode_str.rfind("-", 0) != 0 && mode_str.find('.') != std::string::npos)
        {
            for (auto fn : worker_dispatchers())
            {
                int r = fn(argc, argv);
                if (r != -1) // -1: not one of this dispatcher's scenarios
                    return r;
            }
            fmt::print(stderr, "[WORKER FAILURE] Unknown worker scenario '{}'\n", mode_str);
            return 64;
        }
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
