#include "strata_test_utils.hpp"

// Register StrataEnvironment so the tracer starts clean before any test
// runs. gtest_main provides main(), so we use a static-init trick.
static auto *const kStrataEnv =
    ::testing::AddGlobalTestEnvironment(new strata::testing::StrataEnvironment);
