#include "onboard/Channel.hpp"

#include <gtest/gtest.h>

#include <thread>

#include <poll.h>

static bool readable(int fd) {
    pollfd pfd = {.fd = fd, .events = POLLIN};
    return poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN);
}

TEST(channel_tests, keeps_post_order) {
    CExecutionChannel channel;
    ASSERT_TRUE(channel.good());

    channel.post(STaskStarted{.idx = 0});
    channel.post(STaskSucceeded{.idx = 0, .output = "ok"});
    channel.post(STaskStarted{.idx = 1});
    channel.post(STaskFailed{.idx = 1, .error = "boom"});
    channel.post(SReviewComplete{.anyFailed = true});

    const auto MSGS = channel.drain();
    ASSERT_EQ(MSGS.size(), 5u);
    EXPECT_EQ(std::get<STaskStarted>(MSGS[0]).idx, 0u);
    EXPECT_EQ(std::get<STaskSucceeded>(MSGS[1]).output, std::optional<std::string>{"ok"});
    EXPECT_EQ(std::get<STaskStarted>(MSGS[2]).idx, 1u);
    EXPECT_EQ(std::get<STaskFailed>(MSGS[3]).error, "boom");
    EXPECT_TRUE(std::get<SReviewComplete>(MSGS[4]).anyFailed);

    EXPECT_TRUE(channel.drain().empty());
}

TEST(channel_tests, wake_fd_follows_the_queue) {
    CExecutionChannel channel;
    EXPECT_FALSE(readable(channel.wakeFd()));

    channel.post(SStepComplete{});
    EXPECT_TRUE(readable(channel.wakeFd()));

    channel.drain();
    EXPECT_FALSE(readable(channel.wakeFd()));
}

TEST(channel_tests, single_worker_order_survives_threads) {
    CExecutionChannel channel;

    std::thread       worker([&channel] {
        for (size_t i = 0; i < 500; ++i) {
            channel.post(STaskStarted{.idx = i});
            channel.post(STaskSucceeded{.idx = i});
        }
    });

    std::vector<SExecutionMessage> all;
    while (all.size() < 1000) {
        auto batch = channel.drain();
        all.insert(all.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
    }
    worker.join();

    for (size_t i = 0; i < 500; ++i) {
        ASSERT_EQ(std::get<STaskStarted>(all[i * 2]).idx, i);
        ASSERT_EQ(std::get<STaskSucceeded>(all[i * 2 + 1]).idx, i);
    }
}
