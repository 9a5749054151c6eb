#pragma once

#include <chrono>
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <strata/strata.hpp>
#include <type_traits>
#include <vector>

namespace strata {
namespace testing {

// ============================================================================
// Global environment: resets tracing once
// ============================================================================

class StrataEnvironment : public ::testing::Environment {
  public:
    void SetUp() override {
        trace::disable();
        trace::clear();
    }
};

// ============================================================================
// Timing test helpers
// ============================================================================

#define SKIP_IF_NO_TIMING()                                                    \
    do {                                                                       \
        if (!strata::system::should_run_timing_tests()) {                      \
            GTEST_SKIP() << "timing tests disabled";                           \
        }                                                                      \
    } while (0)

// ============================================================================
// Context fixtures
// ============================================================================

// Host device with two asynchronous queues
inline ContextOptions DefaultOptions() {
    ContextOptions options;
    options.queues_per_device = 2;
    return options;
}

// Host device plus two discrete devices with two queues each
inline ContextOptions DiscreteOptions() {
    ContextOptions options;
    options.queues_per_device = 2;
    options.discrete_devices = 2;
    return options;
}

class ContextTest : public ::testing::Test {
  protected:
    void SetUp() override { context = DeviceContext::create(DefaultOptions()); }

    // Asynchronous queue index (1-based) on the host device
    QueuePtr async_queue(size_t index) const {
        return context->queue(0, index);
    }

    ContextPtr context;
};

// ============================================================================
// Tensor construction and comparison utilities
// ============================================================================

// Dense float tensor holding 0, 1, ... count - 1
inline Tensor Iota(const ContextPtr &context, const ShapeArray &extents) {
    std::vector<float> values(static_cast<size_t>(extents.product()));
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(i);
    }
    return Tensor::from_vector(context, values, extents);
}

template <typename T>
void ExpectTensorEquals(const Tensor &t, const std::vector<T> &expected_data,
                        double epsilon = 1e-6) {
    ASSERT_EQ(t.count(), static_cast<int64_t>(expected_data.size()))
        << "Tensor size mismatch";
    auto values = t.template to_vector<T>();
    for (size_t i = 0; i < expected_data.size(); ++i) {
        if constexpr (std::is_floating_point_v<T>) {
            EXPECT_NEAR(static_cast<double>(values[i]),
                        static_cast<double>(expected_data[i]), epsilon)
                << "Tensor data mismatch at index " << i;
        } else {
            EXPECT_EQ(values[i], expected_data[i])
                << "Tensor data mismatch at index " << i;
        }
    }
}

// Storage identity of two tensors
inline bool SharesStorage(const Tensor &a, const Tensor &b) {
    return a.storage() == b.storage();
}

} // namespace testing
} // namespace strata
