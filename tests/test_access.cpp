#include "strata_test_utils.hpp"

#include <atomic>
#include <thread>

using namespace strata;
using namespace strata::testing;

class AccessTest : public ContextTest {};

// ============================================================================
// Copy-on-write
// ============================================================================

TEST_F(AccessTest, UniqueOwnerWritesInPlace) {
    auto t = Iota(context, {3, 4});
    const Storage *before = t.storage().get();
    EXPECT_TRUE(t.is_unique_reference());

    t.set_item<float>({0, 0}, 42.0f);
    EXPECT_EQ(t.storage().get(), before);
    EXPECT_FALSE(t.last_access_mutated_view());
    EXPECT_EQ(t.item<float>({0, 0}), 42.0f);
}

TEST_F(AccessTest, CopyDetachesOnWrite) {
    auto a = Iota(context, {4});
    auto b = a;
    EXPECT_TRUE(SharesStorage(a, b));
    EXPECT_FALSE(a.is_unique_reference());

    b.set_item<float>({1}, -1.0f);
    EXPECT_FALSE(SharesStorage(a, b));
    EXPECT_TRUE(b.last_access_mutated_view());
    ExpectTensorEquals<float>(a, {0, 1, 2, 3});
    ExpectTensorEquals<float>(b, {0, -1, 2, 3});

    // b now owns its storage alone
    b.set_item<float>({2}, -2.0f);
    EXPECT_FALSE(b.last_access_mutated_view());
    ExpectTensorEquals<float>(b, {0, -1, -2, 3});
}

TEST_F(AccessTest, ViewWriteDoesNotAffectParent) {
    auto t = Iota(context, {3, 4});
    auto row = t.view({1, 0}, {1, 4});
    row.set_item<float>({0, 0}, 100.0f);

    EXPECT_FALSE(SharesStorage(t, row));
    EXPECT_EQ(t.item<float>({1, 0}), 4.0f);
    ExpectTensorEquals<float>(row, {100, 5, 6, 7});
    // the copy keeps the view's offset into a full-size storage
    EXPECT_EQ(row.offset(), 4);
    EXPECT_EQ(row.storage()->count(), 12);
}

TEST_F(AccessTest, ReadsNeverCopy) {
    auto a = Iota(context, {4});
    auto b = a;
    a.read_only_bytes();
    b.read_only_bytes(async_queue(1));
    EXPECT_TRUE(SharesStorage(a, b));
}

TEST_F(AccessTest, SharedViewWritesAreVisibleToAliases) {
    auto t = Iota(context, {3, 4}).shared_view();
    ASSERT_TRUE(t.is_shared());
    auto row = t.view({1, 0}, {1, 4});
    EXPECT_TRUE(row.is_shared());

    ExpectTensorEquals<float>(row, {4, 5, 6, 7});
    t.set_item<float>({1, 2}, 99.0f);
    EXPECT_TRUE(SharesStorage(t, row));
    ExpectTensorEquals<float>(row, {4, 5, 99, 7});

    // an unshared alias of the same storage detaches when written
    Tensor alias(t.shape(), t.storage(), t.offset(), false);
    alias.set_item<float>({1, 3}, -7.0f);
    EXPECT_FALSE(SharesStorage(alias, row));
    EXPECT_TRUE(alias.last_access_mutated_view());
    ExpectTensorEquals<float>(alias.view({1, 0}, {1, 4}), {4, 5, 99, -7});
    ExpectTensorEquals<float>(row, {4, 5, 99, 7});
}

TEST_F(AccessTest, SharedViewOfSharedStorageCopiesFirst) {
    auto t = Iota(context, {4});
    auto other = t;
    auto shared = t.shared_view();
    EXPECT_FALSE(SharesStorage(shared, other));
    EXPECT_TRUE(SharesStorage(shared, t));
}

TEST_F(AccessTest, SharedViewCanReshape) {
    auto t = Iota(context, {2, 6});
    auto grid = t.shared_view(nullptr, ShapeArray{3, 4});
    EXPECT_EQ(grid.extents(), ShapeArray({3, 4}));
    EXPECT_TRUE(SharesStorage(t, grid));
    EXPECT_THROW(t.shared_view(nullptr, ShapeArray{5, 2}), ShapeError);
}

TEST_F(AccessTest, ReadOnlyReferenceRejectsWrites) {
    const std::vector<int32_t> data = {1, 2, 3};
    auto t = Tensor::reference_to(context, data.data(), {3});
    EXPECT_THROW(t.read_write_bytes(), PreconditionViolation);
    EXPECT_THROW(t.read_write_bytes(async_queue(1)), PreconditionViolation);
}

TEST_F(AccessTest, TensorWithoutStorageIsRejected) {
    Tensor t;
    EXPECT_THROW(t.read_only_bytes(), PreconditionViolation);
}

TEST_F(AccessTest, ConcurrentCopiesDetachIndependently) {
    auto source = Iota(context, {64});
    constexpr int kThreads = 8;
    std::vector<Tensor> copies(kThreads, source);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&copies, i] {
            copies[static_cast<size_t>(i)].set_item<float>(
                {0}, static_cast<float>(1000 + i));
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(source.item<float>({0}), 0.0f);
    for (int i = 0; i < kThreads; ++i) {
        const auto &copy = copies[static_cast<size_t>(i)];
        EXPECT_EQ(copy.item<float>({0}), static_cast<float>(1000 + i));
        EXPECT_EQ(copy.item<float>({63}), 63.0f);
    }
}

// ============================================================================
// Cross-queue synchronization
// ============================================================================

TEST_F(AccessTest, HostReadWaitsForAsyncWrite) {
    auto t = Tensor::empty(context, {4}, DType::Float32);
    auto q1 = async_queue(1);
    q1->delay(std::chrono::milliseconds(20));
    auto data = t.read_write<float>(q1);
    q1->enqueue([data] {
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<float>(i + 1);
        }
    });

    // null queue resolves to the host queue and blocks
    ExpectTensorEquals<float>(t, {1, 2, 3, 4});
    EXPECT_EQ(t.storage()->last_mutating_queue(), q1);
}

TEST_F(AccessTest, QueueReadIsOrderedAfterOtherQueueWrite) {
    auto t = Tensor::empty(context, {16}, DType::Int32);
    auto q1 = async_queue(1);
    auto q2 = async_queue(2);

    q1->delay(std::chrono::milliseconds(30));
    auto out = t.read_write<int32_t>(q1);
    q1->enqueue([out] {
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = static_cast<int32_t>(i * i);
        }
    });

    auto in = t.read_only<int32_t>(q2);
    std::vector<int32_t> seen;
    q2->enqueue([in, &seen] { seen.assign(in.begin(), in.end()); });
    q2->wait_until_complete();

    ASSERT_EQ(seen.size(), 16u);
    for (size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i], static_cast<int32_t>(i * i));
    }
}

TEST_F(AccessTest, SharedViewCopyWaitsForPendingWrite) {
    auto t = Tensor::empty(context, {4}, DType::Float32);
    auto q1 = async_queue(1);
    q1->delay(std::chrono::milliseconds(50));
    auto data = t.read_write<float>(q1);
    q1->enqueue([data] {
        for (auto &value : data) {
            value = 7.0f;
        }
    });

    // the alias forces the shared view to copy the pending storage
    auto alias = t;
    Tensor shared = t.shared_view();
    EXPECT_FALSE(SharesStorage(shared, alias));
    ExpectTensorEquals<float>(shared, {7, 7, 7, 7});
    ExpectTensorEquals<float>(alias, {7, 7, 7, 7});
}

TEST_F(AccessTest, CopyOnQueueIsAwaitedByLaterAccess) {
    auto t = Iota(context, {4});
    auto alias = t;
    auto q1 = async_queue(1);
    q1->delay(std::chrono::milliseconds(50));

    Tensor shared = t.shared_view(q1);
    EXPECT_EQ(shared.storage()->last_mutating_queue(), q1);
    ExpectTensorEquals<float>(shared, {0, 1, 2, 3});
}

TEST_F(AccessTest, AssignIsOrderedAfterPendingWrite) {
    auto t = Tensor::empty(context, {4}, DType::Float32);
    auto q1 = async_queue(1);
    q1->delay(std::chrono::milliseconds(50));
    auto data = t.read_write<float>(q1);
    q1->enqueue([data] {
        for (auto &value : data) {
            value = 1.0f;
        }
    });

    auto alias = t;
    t.assign({1}, {3}, Tensor::from_vector(context, std::vector<float>{8, 9},
                                           {2}));
    ExpectTensorEquals<float>(t, {1, 8, 9, 1});
    ExpectTensorEquals<float>(alias, {1, 1, 1, 1});
}

TEST_F(AccessTest, ConcatenateReadsAfterPendingWrite) {
    auto a = Tensor::empty(context, {2}, DType::Float32);
    auto b = Iota(context, {2});
    auto q1 = async_queue(1);
    q1->delay(std::chrono::milliseconds(50));
    auto data = a.read_write<float>(q1);
    q1->enqueue([data] {
        data[0] = 5.0f;
        data[1] = 6.0f;
    });

    auto joined = ops::concatenate({a, b});
    ExpectTensorEquals<float>(joined, {5, 6, 0, 1});
}

TEST_F(AccessTest, DeviceToDeviceAccessDoesNotBlock) {
    SKIP_IF_NO_TIMING();
    auto t = Tensor::empty(context, {4}, DType::Float32);
    auto q1 = async_queue(1);
    auto q2 = async_queue(2);

    q1->delay(std::chrono::milliseconds(300));
    t.read_write_bytes(q1);

    auto start = std::chrono::steady_clock::now();
    t.read_only_bytes(q2);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::milliseconds(250));

    q2->wait_until_complete();
}

TEST_F(AccessTest, WritesOnSameQueueDoNotSynchronize) {
    trace::enable(trace::Category::QueueSync);
    trace::clear();
    auto t = Tensor::empty(context, {4}, DType::Float32);
    auto q1 = async_queue(1);
    t.read_write_bytes(q1);
    t.read_write_bytes(q1);
    t.read_only_bytes(q1);
    q1->wait_until_complete();

    size_t syncs = 0;
    for (const auto &event : trace::Tracer::instance().events()) {
        if (event.op_name == "synchronize")
            ++syncs;
    }
    EXPECT_EQ(syncs, 0u);
    trace::disable();
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(AccessTest, QueueErrorIsStickyUntilCleared) {
    auto t = Iota(context, {4});
    auto q1 = async_queue(1);
    q1->throw_test_error();

    EXPECT_THROW(q1->wait_until_complete(), DeviceError);
    EXPECT_TRUE(q1->has_error());
    EXPECT_THROW(t.read_only_bytes(q1), DeviceError);
    EXPECT_THROW(t.read_write_bytes(q1), DeviceError);
    EXPECT_NE(context->host_device()->last_error(), nullptr);

    // other queues are unaffected
    EXPECT_NO_THROW(t.read_only_bytes(async_queue(2)));

    context->clear_errors();
    EXPECT_FALSE(q1->has_error());
    EXPECT_NO_THROW(t.read_only_bytes(q1));
    q1->wait_until_complete();
}

TEST_F(AccessTest, WaitTimeoutRaisesTimeoutError) {
    SKIP_IF_NO_TIMING();
    context->set_timeout(std::chrono::milliseconds(50));
    auto t = Tensor::empty(context, {4}, DType::Float32);
    auto q1 = async_queue(1);

    q1->delay(std::chrono::milliseconds(500));
    t.read_write_bytes(q1);
    EXPECT_THROW(t.read_only_bytes(), TimeoutError);

    context->set_timeout(std::nullopt);
    q1->wait_until_complete();
    context->clear_errors();
    EXPECT_NO_THROW(t.read_only_bytes());
}
