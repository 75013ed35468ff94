#include <benchmark/benchmark.h>
#include <edge-actors.hpp>

#include <cstdint>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "../../test/tooltestsuites/scheduler_test.hpp"

using edge_actors::task;

namespace {

    task<void> produce(edge_actors::recipient<std::int64_t> output, std::int64_t count) {
        for (std::int64_t i = 0; i < count; ++i) {
            if (co_await output.send(i)) {
                co_return;
            }
        }
    }

    task<void> consume(edge_actors::mailbox_t<std::int64_t>* input, std::int64_t* sum) {
        while (auto value = co_await input->receive()) {
            *sum += *value;
        }
    }

    /// forwards until its input ends, like a stage of a pipeline
    class forwarder final {
    public:
        using input_type = edge_actors::fan_in_message<std::int64_t>;
        using output_type = std::int64_t;
        using message_box_type = edge_actors::builder::simple_message_box<input_type, output_type>;

        explicit forwarder(message_box_type&& box)
            : box_(std::move(box)) {
        }

        const std::string& name() const noexcept {
            return box_.name();
        }

        task<std::error_code> run() {
            while (auto message = co_await box_.receive()) {
                if (message->is_runtime_request()) {
                    break;
                }
                if (co_await box_.send(message->get<std::int64_t>())) {
                    break;
                }
            }
            co_return std::error_code{};
        }

    private:
        message_box_type box_;
    };

} // namespace

// try_send/try_receive on one thread, no suspension at all
static void BM_TrySendReceive(benchmark::State& state) {
    auto [sender, mailbox] = edge_actors::make_channel<std::int64_t>(static_cast<std::size_t>(state.range(0)));
    std::int64_t value = 0;

    for (auto _ : state) {
        if (sender.try_send(value++)) {
            state.SkipWithError("mailbox unexpectedly full");
            break;
        }
        auto received = mailbox.try_receive();
        benchmark::DoNotOptimize(received);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TrySendReceive)->Arg(1)->Arg(16)->Unit(benchmark::kNanosecond);

// producer and consumer coroutines on a test executor, parking on every full or empty mailbox
static void BM_CoroutinePingPong(benchmark::State& state) {
    const auto messages = state.range(1);

    for (auto _ : state) {
        edge_actors::test::scheduler_test_t scheduler;
        auto [sender, mailbox] = edge_actors::make_channel<std::int64_t>(static_cast<std::size_t>(state.range(0)));
        std::int64_t sum = 0;
        edge_actors::launch(scheduler, produce(std::move(sender), messages), [](std::exception_ptr) {});
        edge_actors::launch(scheduler, consume(&mailbox, &sum), [](std::exception_ptr) {});
        scheduler.run();
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * messages);
}
BENCHMARK(BM_CoroutinePingPong)
    ->Args({1, 1024})
    ->Args({16, 1024})
    ->Args({256, 1024})
    ->Unit(benchmark::kMicrosecond);

// external threads feeding one mailbox with blocking sends
static void BM_BlockingProducers(benchmark::State& state) {
    const auto producers = state.range(0);
    constexpr std::int64_t per_producer = 10000;

    for (auto _ : state) {
        auto channel = edge_actors::make_channel<std::int64_t>(64);
        std::vector<std::thread> threads;
        for (std::int64_t p = 0; p < producers; ++p) {
            threads.emplace_back([sender = channel.sender] {
                for (std::int64_t i = 0; i < per_producer; ++i) {
                    if (sender.blocking_send(i)) {
                        return;
                    }
                }
            });
        }
        {
            auto dropped = std::move(channel.sender);
        }
        std::int64_t sum = 0;
        while (auto value = channel.receiver.blocking_receive()) {
            sum += *value;
        }
        for (auto& thread : threads) {
            thread.join();
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * producers * per_producer);
}
BENCHMARK(BM_BlockingProducers)->DenseRange(1, 4)->Unit(benchmark::kMillisecond)->UseRealTime();

namespace {

    /// runs one pipeline of @p stages forwarders to completion; empty on success
    std::string run_pipeline(std::int64_t stages, std::int64_t messages) {
        std::vector<edge_actors::builder::actor_builder_t<forwarder>> builders;
        builders.reserve(static_cast<std::size_t>(stages));
        for (std::int64_t i = 0; i < stages; ++i) {
            builders.push_back(edge_actors::builder::make_actor_builder<forwarder>("stage", 64));
        }
        for (std::size_t i = 1; i < builders.size(); ++i) {
            if (auto error = edge_actors::builder::link(builders[i - 1], builders[i])) {
                return error.message();
            }
        }
        auto [output, results] = edge_actors::make_channel<std::int64_t>(64);
        if (auto error = builders.back().set_output(std::move(output))) {
            return error.message();
        }
        auto source = builders.front().input_recipient();
        if (!source) {
            return source.error().message();
        }

        edge_actors::runtime_t runtime;
        auto handle = runtime.handle();
        for (auto& builder : builders) {
            if (auto error = handle.spawn(std::move(builder))) {
                return error.message();
            }
        }

        std::thread feeder([source = std::move(source).value(), messages] {
            for (std::int64_t i = 0; i < messages; ++i) {
                if (source.blocking_send(i)) {
                    return;
                }
            }
        });
        std::thread drainer([&results] {
            std::int64_t sum = 0;
            while (auto value = results.blocking_receive()) {
                sum += *value;
            }
            benchmark::DoNotOptimize(sum);
        });

        auto error = runtime.run();
        feeder.join();
        drainer.join();
        return error ? error.message() : std::string();
    }

} // namespace

// a full runtime: a chain of forwarders between an external producer and consumer
static void BM_RuntimePipeline(benchmark::State& state) {
    constexpr std::int64_t messages = 10000;

    edge_actors::logger().set_level(edge_actors::log_level::warn);
    for (auto _ : state) {
        auto error = run_pipeline(state.range(0), messages);
        if (!error.empty()) {
            state.SkipWithError(error.c_str());
            break;
        }
    }

    state.SetItemsProcessed(state.iterations() * messages);
}
BENCHMARK(BM_RuntimePipeline)->Arg(1)->Arg(4)->Unit(benchmark::kMillisecond)->UseRealTime();

BENCHMARK_MAIN();
