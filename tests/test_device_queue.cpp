#include "strata_test_utils.hpp"

#include <atomic>
#include <cstring>
#include <thread>

using namespace strata;
using namespace strata::testing;

class DeviceQueueTest : public ContextTest {};

TEST_F(DeviceQueueTest, ContextLayout) {
    EXPECT_EQ(context->device_count(), 1u);
    auto host = context->host_device();
    EXPECT_EQ(host->id(), 0);
    EXPECT_TRUE(host->is_unified());
    ASSERT_EQ(host->queues().size(), 3u);
    EXPECT_EQ(host->queue(0), context->host_queue());
    EXPECT_TRUE(context->host_queue()->execute_synchronously());
    EXPECT_FALSE(async_queue(1)->execute_synchronously());
    EXPECT_EQ(async_queue(1)->name(), "cpu:0_q1");
    EXPECT_TRUE(context->is_host_queue(*context->host_queue()));
    EXPECT_FALSE(context->is_host_queue(*async_queue(1)));
    EXPECT_THROW(context->queue(0, 3), IndexError);
    EXPECT_THROW(context->device(1), IndexError);
}

TEST(DeviceContextLayout, DiscreteDevicesHaveOwnQueues) {
    auto context = DeviceContext::create(DiscreteOptions());
    ASSERT_EQ(context->device_count(), 3u);
    for (size_t d = 1; d < 3; ++d) {
        auto device = context->device(d);
        EXPECT_EQ(device->id(), static_cast<int>(d));
        EXPECT_FALSE(device->is_unified());
        EXPECT_EQ(device->queues().size(), 2u);
        EXPECT_EQ(context->queue(d, 0)->device_id(), static_cast<int>(d));
    }
}

TEST_F(DeviceQueueTest, WorkRunsInSubmissionOrder) {
    auto q = async_queue(1);
    std::vector<int> order;
    for (int i = 0; i < 50; ++i) {
        q->enqueue([&order, i] { order.push_back(i); });
    }
    q->wait_until_complete();
    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(order[static_cast<size_t>(i)], i);
    }
}

TEST_F(DeviceQueueTest, EventSignalsAfterPriorWork) {
    auto q = async_queue(1);
    std::atomic<bool> done{false};
    q->delay(std::chrono::milliseconds(10));
    q->enqueue([&done] { done = true; });
    auto event = q->create_event();
    EXPECT_FALSE(event->occurred());
    q->record(event);
    event->wait();
    EXPECT_TRUE(event->occurred());
    EXPECT_TRUE(done.load());
}

TEST_F(DeviceQueueTest, QueueWaitsForEventOnOtherQueue) {
    auto q1 = async_queue(1);
    auto q2 = async_queue(2);
    std::atomic<int> value{0};
    q1->delay(std::chrono::milliseconds(20));
    q1->enqueue([&value] { value = 1; });
    auto event = q1->create_event();
    q1->record(event);

    int seen = -1;
    q2->wait(event);
    q2->enqueue([&value, &seen] { seen = value.load(); });
    q2->wait_until_complete();
    EXPECT_EQ(seen, 1);
}

TEST_F(DeviceQueueTest, SynchronousQueueRunsInline) {
    auto host = context->host_queue();
    auto caller = std::this_thread::get_id();
    std::thread::id ran_on;
    host->enqueue([&ran_on] { ran_on = std::this_thread::get_id(); });
    EXPECT_EQ(ran_on, caller);
}

TEST(DeviceQueueOptions, SynchronousQueuesOption) {
    auto options = DefaultOptions();
    options.synchronous_queues = true;
    auto context = DeviceContext::create(options);
    auto q = context->queue(0, 1);
    EXPECT_TRUE(q->execute_synchronously());
    int value = 0;
    q->enqueue([&value] { value = 7; });
    EXPECT_EQ(value, 7);
}

TEST_F(DeviceQueueTest, ErrorSkipsLaterWork) {
    auto q = async_queue(1);
    std::atomic<bool> ran{false};
    q->throw_test_error();
    q->enqueue([&ran] { ran = true; });
    EXPECT_THROW(q->wait_until_complete(), DeviceError);
    EXPECT_FALSE(ran.load());

    q->clear_error();
    q->enqueue([&ran] { ran = true; });
    q->wait_until_complete();
    EXPECT_TRUE(ran.load());
}

TEST_F(DeviceQueueTest, FirstErrorWins) {
    auto q = async_queue(1);
    q->report(std::make_exception_ptr(DeviceError("first")));
    q->report(std::make_exception_ptr(DeviceError("second")));
    try {
        q->check_error();
        FAIL() << "expected DeviceError";
    } catch (const DeviceError &e) {
        EXPECT_NE(std::string(e.what()).find("first"), std::string::npos);
    }
    q->clear_error();
    EXPECT_NO_THROW(q->check_error());
}

TEST_F(DeviceQueueTest, ErrorHandlerCanAbsorbDeviceErrors) {
    auto device = context->host_device();
    std::atomic<int> handled{0};
    device->set_error_handler([&handled](std::exception_ptr) {
        ++handled;
        return true;
    });

    auto q = async_queue(1);
    q->throw_test_error();
    EXPECT_THROW(q->wait_until_complete(), DeviceError);
    EXPECT_EQ(handled.load(), 1);
    // the queue error stays sticky, the device error is absorbed
    EXPECT_TRUE(q->has_error());
    EXPECT_EQ(device->last_error(), nullptr);
    device->set_error_handler(nullptr);
    context->clear_errors();
}

TEST_F(DeviceQueueTest, TimeoutPropagatesToQueues) {
    context->set_timeout(std::chrono::milliseconds(25));
    for (const auto &queue : context->host_device()->queues()) {
        ASSERT_TRUE(queue->timeout().has_value());
        EXPECT_EQ(queue->timeout()->count(), 25);
        EXPECT_EQ(queue->create_event()->timeout(), queue->timeout());
    }
    context->set_timeout(std::nullopt);
    EXPECT_FALSE(async_queue(1)->timeout().has_value());
}

TEST_F(DeviceQueueTest, EventWaitTimesOut) {
    SKIP_IF_NO_TIMING();
    context->set_timeout(std::chrono::milliseconds(20));
    auto q = async_queue(1);
    q->delay(std::chrono::milliseconds(300));
    auto event = q->create_event();
    q->record(event);
    EXPECT_THROW(event->wait(), TimeoutError);
    context->set_timeout(std::nullopt);
    q->wait_until_complete();
}

TEST_F(DeviceQueueTest, CopyAndZeroOperateOnDeviceArrays) {
    auto device = context->host_device();
    auto q = async_queue(1);
    auto src = device->allocate(16);
    auto dst = device->allocate(16);
    std::memset(src->data(), 0xAB, 16);

    q->copy_async(dst, src, 16);
    q->wait_until_complete();
    EXPECT_EQ(std::memcmp(dst->data(), src->data(), 16), 0);

    q->zero(dst, 8);
    q->wait_until_complete();
    auto bytes = static_cast<const uint8_t *>(dst->data());
    EXPECT_EQ(bytes[0], 0);
    EXPECT_EQ(bytes[7], 0);
    EXPECT_EQ(bytes[8], 0xAB);

    EXPECT_THROW(q->copy_async(dst, src, 32), DeviceError);
    EXPECT_EQ(device->memory_in_use(), 32u);
}
