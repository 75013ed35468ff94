#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <edge-actors.hpp>

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

#include "../tooltestsuites/scheduler_test.hpp"

using edge_actors::task;
using edge_actors::test::scheduler_test_t;

namespace {

    struct outcome {
        int finished = 0;
        int failed = 0;
    };

    auto track(outcome& state) {
        return [&state](std::exception_ptr failure) {
            ++state.finished;
            if (failure) {
                ++state.failed;
            }
        };
    }

    task<void> produce(edge_actors::recipient<int> output, int first, int count, std::vector<int>* accepted) {
        for (int i = first; i < first + count; ++i) {
            auto error = co_await output.send(i);
            if (error) {
                co_return;
            }
            accepted->push_back(i);
        }
    }

    task<void> produce_all(edge_actors::recipient<int> output, std::vector<int> values, std::vector<std::error_code>* results) {
        for (auto value : values) {
            results->push_back(co_await output.send(value));
        }
    }

    task<void> consume(edge_actors::mailbox_t<int>* input, std::vector<int>* received) {
        while (auto value = co_await input->receive()) {
            received->push_back(*value);
        }
    }

} // namespace

TEST_CASE("channel - capacity is at least one message") {
    auto [sender, mailbox] = edge_actors::make_channel<int>(0);
    REQUIRE(mailbox.capacity() == 1);
    REQUIRE_FALSE(sender.try_send(1));
    REQUIRE(sender.try_send(2) == edge_actors::channel_errc::full);
}

TEST_CASE("channel - messages of one producer arrive in order") {
    scheduler_test_t scheduler;
    auto [sender, mailbox] = edge_actors::make_channel<int>(4);
    std::vector<int> accepted;
    std::vector<int> received;
    outcome producer;
    outcome consumer;

    edge_actors::launch(scheduler, produce(std::move(sender), 0, 100, &accepted), track(producer));
    edge_actors::launch(scheduler, consume(&mailbox, &received), track(consumer));
    scheduler.run();

    REQUIRE(producer.finished == 1);
    REQUIRE(consumer.finished == 1);
    REQUIRE(producer.failed + consumer.failed == 0);
    REQUIRE(received.size() == 100);
    REQUIRE(std::is_sorted(received.begin(), received.end()));
    REQUIRE(received == accepted);
}

TEST_CASE("channel - send suspends while the mailbox is full") {
    scheduler_test_t scheduler;
    auto [sender, mailbox] = edge_actors::make_channel<int>(2);
    std::vector<int> accepted;
    outcome producer;

    edge_actors::launch(scheduler, produce(sender, 0, 3, &accepted), track(producer));
    scheduler.run();

    REQUIRE(accepted == std::vector<int>{0, 1});
    REQUIRE(producer.finished == 0);
    REQUIRE(mailbox.size() == 2);

    auto first = mailbox.try_receive();
    REQUIRE(first);
    REQUIRE(*first == 0);
    // the parked message took the free slot, the producer is only scheduled
    REQUIRE(mailbox.size() == 2);
    REQUIRE(accepted.size() == 2);

    scheduler.run();
    REQUIRE(accepted == std::vector<int>{0, 1, 2});
    REQUIRE(producer.finished == 1);
    REQUIRE(*mailbox.try_receive() == 1);
    REQUIRE(*mailbox.try_receive() == 2);
    REQUIRE_FALSE(mailbox.try_receive());
}

TEST_CASE("channel - try_send never waits") {
    auto [sender, mailbox] = edge_actors::make_channel<int>(2);
    REQUIRE_FALSE(sender.try_send(1));
    REQUIRE_FALSE(sender.try_send(2));
    REQUIRE(sender.try_send(3) == edge_actors::channel_errc::full);
    REQUIRE(*mailbox.try_receive() == 1);
    REQUIRE_FALSE(sender.try_send(4));
    REQUIRE(*mailbox.try_receive() == 2);
    REQUIRE(*mailbox.try_receive() == 4);
}

TEST_CASE("channel - a parked receiver gets the next message directly") {
    scheduler_test_t scheduler;
    auto [sender, mailbox] = edge_actors::make_channel<int>(1);
    std::vector<int> received;
    outcome consumer;

    edge_actors::launch(scheduler, consume(&mailbox, &received), track(consumer));
    scheduler.run();
    REQUIRE(received.empty());

    REQUIRE_FALSE(sender.try_send(7));
    REQUIRE_FALSE(sender.try_send(8));
    scheduler.run();
    REQUIRE(received == std::vector<int>{7, 8});
    REQUIRE(consumer.finished == 0);

    {
        auto dropped = std::move(sender);
    }
    scheduler.run();
    REQUIRE(consumer.finished == 1);
}

TEST_CASE("channel - end of stream once the last recipient is dropped") {
    scheduler_test_t scheduler;
    std::vector<int> received;
    outcome consumer;
    auto channel = edge_actors::make_channel<int>(4);
    auto& mailbox = channel.receiver;

    {
        auto copy = channel.sender;
        REQUIRE_FALSE(copy.try_send(1));
        REQUIRE_FALSE(channel.sender.try_send(2));
        auto dropped = std::move(channel.sender);
        REQUIRE_FALSE(mailbox.closed());
    }
    REQUIRE(mailbox.closed());

    edge_actors::launch(scheduler, consume(&mailbox, &received), track(consumer));
    scheduler.run();
    REQUIRE(received == std::vector<int>{1, 2});
    REQUIRE(consumer.finished == 1);
    REQUIRE_FALSE(mailbox.blocking_receive());
}

TEST_CASE("channel - closing the mailbox releases parked senders") {
    scheduler_test_t scheduler;
    auto [sender, mailbox] = edge_actors::make_channel<int>(1);
    std::vector<std::error_code> results;
    outcome producer;

    edge_actors::launch(scheduler, produce_all(sender, {1, 2}, &results), track(producer));
    scheduler.run();
    REQUIRE(results.size() == 1);

    mailbox.close();
    scheduler.run();
    REQUIRE(producer.finished == 1);
    REQUIRE(results.size() == 2);
    REQUIRE_FALSE(results[0]);
    REQUIRE(results[1] == edge_actors::channel_errc::closed);

    // what was accepted before the close is still delivered
    REQUIRE(*mailbox.try_receive() == 1);
    REQUIRE_FALSE(mailbox.try_receive());
    REQUIRE(sender.try_send(3) == edge_actors::channel_errc::closed);
}

TEST_CASE("channel - sending to a dropped mailbox fails") {
    auto channel = edge_actors::make_channel<int>(4);
    auto sender = channel.sender;
    REQUIRE_FALSE(sender.try_send(1));
    {
        auto dropped = std::move(channel.receiver);
    }
    REQUIRE(sender.closed());
    REQUIRE(sender.try_send(2) == edge_actors::channel_errc::closed);
    REQUIRE(sender.blocking_send(3) == edge_actors::channel_errc::closed);
}

TEST_CASE("channel - runtime requests skip the queue") {
    using input = edge_actors::fan_in_message<int>;
    auto [sender, mailbox] = edge_actors::make_channel<input>(1);
    edge_actors::signal_sender_t signal(mailbox.channel());

    REQUIRE_FALSE(sender.try_send(1));
    REQUIRE(sender.try_send(2) == edge_actors::channel_errc::full);
    REQUIRE_FALSE(signal.send(edge_actors::runtime_request::shutdown));

    auto first = mailbox.try_receive();
    REQUIRE(first);
    REQUIRE(first->is_runtime_request());
    auto second = mailbox.try_receive();
    REQUIRE(second);
    REQUIRE(second->get<int>() == 1);
}

TEST_CASE("channel - the control handle does not keep a mailbox open") {
    using input = edge_actors::fan_in_message<int>;
    auto channel = edge_actors::make_channel<input>(1);
    edge_actors::signal_sender_t signal(channel.receiver.channel());
    {
        auto dropped = std::move(channel.sender);
    }
    REQUIRE(channel.receiver.closed());
    REQUIRE(signal.closed());
    REQUIRE(signal.send(edge_actors::runtime_request::shutdown) == edge_actors::channel_errc::closed);
}

TEST_CASE("channel - receive_for gives up after the timeout") {
    auto [sender, mailbox] = edge_actors::make_channel<int>(1);
    REQUIRE_FALSE(mailbox.receive_for(std::chrono::milliseconds(10)));
    REQUIRE_FALSE(mailbox.closed());
    REQUIRE_FALSE(sender.try_send(5));
    auto value = mailbox.receive_for(std::chrono::milliseconds(10));
    REQUIRE(value);
    REQUIRE(*value == 5);
}

TEST_CASE("channel - concurrent producers lose and duplicate nothing") {
    constexpr int producers = 4;
    constexpr int per_producer = 1000;
    auto channel = edge_actors::make_channel<int>(8);
    auto& mailbox = channel.receiver;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([sender = channel.sender, p] {
            for (int i = 0; i < per_producer; ++i) {
                if (sender.blocking_send(p * per_producer + i)) {
                    return;
                }
            }
        });
    }
    {
        auto dropped = std::move(channel.sender);
    }

    std::vector<std::vector<int>> by_producer(producers);
    while (auto value = mailbox.blocking_receive()) {
        by_producer[*value / per_producer].push_back(*value % per_producer);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& values : by_producer) {
        REQUIRE(values.size() == per_producer);
        for (int i = 0; i < per_producer; ++i) {
            REQUIRE(values[i] == i);
        }
    }
}
