#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <edge-actors.hpp>

#include <algorithm>
#include <any>
#include <string>
#include <system_error>
#include <vector>

#include "../tooltestsuites/scheduler_test.hpp"

using edge_actors::builder::link_state;
using edge_actors::builder::message_box_builder;

namespace {

    using text_input = edge_actors::fan_in_message<std::string>;

    class sink_actor final {
    public:
        using input_type = text_input;
        using output_type = std::string;

        explicit sink_actor(edge_actors::builder::simple_message_box<input_type, output_type>&& box)
            : box_(std::move(box)) {
        }

        const std::string& name() const noexcept {
            return box_.name();
        }

        edge_actors::task<std::error_code> run() {
            while (auto message = co_await box_.receive()) {
                if (message->is_runtime_request()) {
                    break;
                }
            }
            co_return std::error_code{};
        }

    private:
        edge_actors::builder::simple_message_box<input_type, output_type> box_;
    };

    /// forwards every text to its output
    class echo_actor final {
    public:
        using input_type = text_input;
        using output_type = std::string;

        explicit echo_actor(edge_actors::builder::simple_message_box<input_type, output_type>&& box)
            : box_(std::move(box)) {
        }

        const std::string& name() const noexcept {
            return box_.name();
        }

        edge_actors::task<std::error_code> run() {
            while (auto message = co_await box_.receive()) {
                if (message->is_runtime_request()) {
                    break;
                }
                if (auto error = co_await box_.send(message->get<std::string>())) {
                    co_return error;
                }
            }
            co_return std::error_code{};
        }

    private:
        edge_actors::builder::simple_message_box<input_type, output_type> box_;
    };

    using text_box = edge_actors::builder::simple_message_box<std::string, std::string>;

    edge_actors::task<void> send_text(text_box* box, std::string text) {
        if (auto error = co_await box->send(std::move(text))) {
            throw std::system_error(error);
        }
    }

    /// collects log lines at @p level and above while alive
    class log_capture final {
    public:
        explicit log_capture(edge_actors::log_level level)
            : level_(edge_actors::logger().level()) {
            edge_actors::logger().set_level(level);
            edge_actors::logger().set_sink([this](edge_actors::log_level, std::string_view target, std::string_view message) {
                lines_.push_back(std::string(target) + ": " + std::string(message));
            });
        }

        ~log_capture() {
            edge_actors::logger().set_sink(nullptr);
            edge_actors::logger().set_level(level_);
        }

        bool contains(const std::string& text) const {
            return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
                return line.find(text) != std::string::npos;
            });
        }

    private:
        edge_actors::log_level level_;
        std::vector<std::string> lines_;
    };

} // namespace

static_assert(edge_actors::actor<sink_actor>);
static_assert(edge_actors::actor_builder<edge_actors::builder::actor_builder_t<sink_actor>>);

TEST_CASE("errors - categories and messages") {
    std::error_code closed = edge_actors::channel_errc::closed;
    REQUIRE(closed.category().name() == std::string("edge-actors.channel"));
    REQUIRE_FALSE(closed.message().empty());

    std::error_code spawned = edge_actors::link_errc::already_spawned;
    REQUIRE(spawned.category().name() == std::string("edge-actors.link"));
    REQUIRE(spawned != closed);

    edge_actors::runtime_error_t success;
    REQUIRE_FALSE(success);
    REQUIRE(success.message() == "success");

    auto failure = edge_actors::runtime_error_t::actor_error("relay-1", std::make_error_code(std::errc::io_error));
    REQUIRE(failure);
    REQUIRE(failure.is(edge_actors::runtime_errc::actor_error));
    REQUIRE(failure.actor() == "relay-1");
    REQUIRE(failure.cause() == std::errc::io_error);
    REQUIRE(failure.message().find("relay-1") != std::string::npos);
}

TEST_CASE("result - holds a value or an error") {
    edge_actors::result<int> value = 42;
    REQUIRE(value);
    REQUIRE(*value == 42);
    REQUIRE_FALSE(value.error());

    edge_actors::result<int> error = edge_actors::link_errc::already_linked;
    REQUIRE_FALSE(error);
    REQUIRE(error.error() == edge_actors::link_errc::already_linked);
}

TEST_CASE("message box builder - connect exchanges recipients") {
    message_box_builder<std::string, int> builder("parser");
    REQUIRE(builder.state() == link_state::building);

    auto [output, results] = edge_actors::make_channel<int>(4);
    auto input = builder.connect(output);
    REQUIRE(input);
    REQUIRE(builder.state() == link_state::linked);

    auto box = std::move(builder).build();
    REQUIRE(box);
    REQUIRE(box->name() == "parser");

    REQUIRE_FALSE(input->try_send(std::string("12")));
    auto received = box->try_receive();
    REQUIRE(received);
    REQUIRE(*received == "12");

    REQUIRE_FALSE(box->output().try_send(12));
    REQUIRE(*results.try_receive() == 12);
}

TEST_CASE("message box builder - a single output") {
    message_box_builder<std::string, int> builder("parser");
    auto first = edge_actors::make_channel<int>(4);
    auto second = edge_actors::make_channel<int>(4);

    REQUIRE_FALSE(builder.set_output(first.sender));
    REQUIRE(builder.set_output(second.sender) == edge_actors::link_errc::already_linked);
    auto linked = builder.connect(second.sender);
    REQUIRE_FALSE(linked);
    REQUIRE(linked.error() == edge_actors::link_errc::already_linked);
}

TEST_CASE("message box builder - links are rejected once built") {
    message_box_builder<std::string, int> builder("parser");
    auto box = std::move(builder).build();
    REQUIRE(box);
    REQUIRE(builder.state() == link_state::spawned);

    auto [output, results] = edge_actors::make_channel<int>(4);
    REQUIRE(builder.set_output(output) == edge_actors::link_errc::already_spawned);
    REQUIRE(builder.connect(output).error() == edge_actors::link_errc::already_spawned);
    REQUIRE(builder.input_recipient().error() == edge_actors::link_errc::already_spawned);

    auto again = std::move(builder).build();
    REQUIRE_FALSE(again);
    REQUIRE(again.error() == edge_actors::link_errc::already_spawned);
}

TEST_CASE("message box builder - a moved-from builder counts as spawned") {
    message_box_builder<std::string, int> builder("parser");
    auto moved = std::move(builder);
    REQUIRE(builder.state() == link_state::spawned);
    REQUIRE(builder.input_recipient().error() == edge_actors::link_errc::already_spawned);
    REQUIRE(moved.state() == link_state::building);
    REQUIRE(moved.input_recipient());
}

TEST_CASE("message box builder - unconnected ends have defaults") {
    message_box_builder<std::string, int> builder("idle");
    auto box = std::move(builder).build();
    REQUIRE(box);

    // the output goes nowhere, the input stays open and empty
    REQUIRE_FALSE(box->output().try_send(1));
    REQUIRE_FALSE(box->input().closed());
    REQUIRE_FALSE(box->try_receive());
}

TEST_CASE("peer linker - erased connect checks the message types") {
    message_box_builder<std::string, int> builder("parser");
    edge_actors::builder::peer_linker<std::string, int>& linker = builder;

    auto wrong = edge_actors::make_channel<std::string>(4);
    auto mismatch = linker.connect_any(std::any(wrong.sender));
    REQUIRE_FALSE(mismatch);
    REQUIRE(mismatch.error() == edge_actors::link_errc::type_mismatch);
    REQUIRE(builder.state() == link_state::building);

    auto right = edge_actors::make_channel<int>(4);
    auto linked = linker.connect_any(std::any(right.sender));
    REQUIRE(linked);
    auto* input = std::any_cast<edge_actors::recipient<std::string>>(&linked.value());
    REQUIRE(input != nullptr);
    REQUIRE_FALSE(input->try_send(std::string("ok")));
}

TEST_CASE("link - producer output adapted to the consumer input") {
    message_box_builder<int, std::string> producer("producer");
    auto consumer = edge_actors::builder::make_actor_builder<sink_actor>("consumer", 4);

    REQUIRE_FALSE(edge_actors::builder::link(producer, consumer));
    REQUIRE(producer.state() == link_state::linked);
    REQUIRE(consumer.state() == link_state::linked);
    REQUIRE(edge_actors::builder::link(producer, consumer) == edge_actors::link_errc::already_linked);
}

TEST_CASE("actor builder - linking after spawn is rejected") {
    edge_actors::runtime_t runtime(edge_actors::runtime_config{1});
    auto handle = runtime.handle();
    auto builder = edge_actors::builder::make_actor_builder<sink_actor>("sink", 4);

    REQUIRE_FALSE(std::move(builder).spawn(handle));
    REQUIRE(builder.state() == link_state::spawned);
    REQUIRE(builder.input_recipient().error() == edge_actors::link_errc::already_spawned);
    REQUIRE(builder.set_output(edge_actors::null_recipient<std::string>()) == edge_actors::link_errc::already_spawned);

    auto spawned_twice = handle.spawn(std::move(builder));
    REQUIRE(spawned_twice.is(edge_actors::runtime_errc::spawn_failed));
    REQUIRE(spawned_twice.cause() == edge_actors::link_errc::already_spawned);

    runtime.shutdown();
    REQUIRE_FALSE(runtime.run());
}

TEST_CASE("link - a recipient dropped before spawn leaves the input open") {
    auto a = edge_actors::builder::make_actor_builder<echo_actor>("a", 4);
    auto b = edge_actors::builder::make_actor_builder<echo_actor>("b", 4);
    {
        auto peek = b.input_recipient();
        REQUIRE(peek);
    }
    REQUIRE_FALSE(b.signal_sender().closed());

    REQUIRE_FALSE(edge_actors::builder::link(a, b));
    auto [output, results] = edge_actors::make_channel<std::string>(4);
    REQUIRE_FALSE(b.set_output(std::move(output)));
    {
        auto source = a.input_recipient();
        REQUIRE(source);
        REQUIRE_FALSE(source->try_send(std::string("x")));
    }

    edge_actors::runtime_t runtime(edge_actors::runtime_config{1});
    REQUIRE_FALSE(runtime.spawn(std::move(a), std::move(b)));
    REQUIRE_FALSE(runtime.run());

    REQUIRE(results.try_receive() == std::string("x"));
    REQUIRE_FALSE(results.try_receive());
}

TEST_CASE("message box builder - inputs handed out close the mailbox once dropped after build") {
    message_box_builder<std::string, int> builder("parser");
    auto input = builder.input_recipient();
    REQUIRE(input);
    auto box = std::move(builder).build();
    REQUIRE(box);
    REQUIRE_FALSE(box->input().closed());

    REQUIRE_FALSE(input->try_send(std::string("only")));
    {
        auto last_producer = std::move(input).value();
    }
    REQUIRE(box->try_receive() == std::string("only"));
    REQUIRE(box->input().closed());
}

TEST_CASE("simple message box - logs what comes in and goes out") {
    message_box_builder<std::string, std::string> builder("chatty");
    auto [output, results] = edge_actors::make_channel<std::string>(4);
    auto input = builder.connect(std::move(output));
    REQUIRE(input);
    auto box = std::move(builder).build();
    REQUIRE(box);

    log_capture logs(edge_actors::log_level::trace);
    edge_actors::test::scheduler_test_t scheduler;
    auto no_failure = [](std::exception_ptr failure) { REQUIRE_FALSE(failure); };

    REQUIRE_FALSE(input->try_send(std::string("hello")));
    REQUIRE(box->try_receive() == std::string("hello"));
    edge_actors::launch(scheduler, send_text(&*box, "world"), no_failure);
    scheduler.run();
    REQUIRE(results.try_receive() == std::string("world"));
    REQUIRE(logs.contains("chatty: recv hello"));
    REQUIRE(logs.contains("chatty: send world"));

    box->set_logging(false);
    REQUIRE_FALSE(input->try_send(std::string("quiet")));
    REQUIRE(box->try_receive() == std::string("quiet"));
    edge_actors::launch(scheduler, send_text(&*box, "hush"), no_failure);
    scheduler.run();
    REQUIRE(results.try_receive() == std::string("hush"));
    REQUIRE_FALSE(logs.contains("quiet"));
    REQUIRE_FALSE(logs.contains("hush"));
}

TEST_CASE("simple message box - closing either end") {
    message_box_builder<std::string, std::string> builder("closing");
    auto [output, results] = edge_actors::make_channel<std::string>(4);
    auto input = builder.connect(std::move(output));
    REQUIRE(input);
    auto box = std::move(builder).build();
    REQUIRE(box);

    SECTION("closing the output is end-of-stream for the peer") {
        REQUIRE_FALSE(box->output().try_send(std::string("last")));
        box->close_output();
        REQUIRE(results.try_receive() == std::string("last"));
        REQUIRE_FALSE(results.try_receive());
        REQUIRE(results.closed());
        // later output goes nowhere
        REQUIRE_FALSE(box->output().try_send(std::string("dropped")));
    }

    SECTION("closing the input keeps what is buffered") {
        REQUIRE_FALSE(input->try_send(std::string("buffered")));
        box->close_input();
        REQUIRE(input->try_send(std::string("refused")) == edge_actors::channel_errc::closed);
        REQUIRE(box->try_receive() == std::string("buffered"));
        REQUIRE_FALSE(box->try_receive());
        REQUIRE(box->input().closed());
    }
}
