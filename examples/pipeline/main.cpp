#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <edge-actors.hpp>

struct reading final {
    std::string sensor;
    double celsius;

    friend std::ostream& operator<<(std::ostream& os, const reading& r) {
        return os << r.sensor << '=' << r.celsius << 'C';
    }
};

struct sensor_alarm final {
    std::string reason;

    friend std::ostream& operator<<(std::ostream& os, const sensor_alarm& a) {
        return os << "alarm(" << a.reason << ')';
    }
};

/// "sensor value" lines into readings
class line_parser final {
public:
    using input_type = std::string;
    using output_type = reading;

    edge_actors::result<std::vector<reading>> convert(const std::string& line) {
        std::istringstream stream(line);
        reading r;
        if (!(stream >> r.sensor >> r.celsius)) {
            return std::make_error_code(std::errc::invalid_argument);
        }
        return std::vector<reading>{r};
    }
};

/// Reports readings above a threshold and every alarm coming from the side channel.
class monitor_actor final {
public:
    using input_type = edge_actors::fan_in_message<reading, sensor_alarm>;
    using output_type = std::string;
    using message_box_type = edge_actors::builder::simple_message_box<input_type, output_type>;

    monitor_actor(message_box_type&& box, double threshold)
        : box_(std::move(box))
        , threshold_(threshold) {
    }

    const std::string& name() const noexcept {
        return box_.name();
    }

    edge_actors::task<std::error_code> run() {
        while (auto message = co_await box_.receive()) {
            if (message->is_runtime_request()) {
                break;
            }
            auto report = message->visit(edge_actors::type_traits::overloaded{
                [](edge_actors::runtime_request) { return std::string(); },
                [this](const reading& r) {
                    ++seen_;
                    return r.celsius > threshold_ ? "too hot: " + edge_actors::to_string(r) : std::string();
                },
                [](const sensor_alarm& a) { return "external " + edge_actors::to_string(a); }});
            if (report.empty()) {
                continue;
            }
            if (co_await box_.send(std::move(report))) {
                break;
            }
        }
        if (auto error = co_await box_.send("readings seen: " + std::to_string(seen_))) {
            edge_actors::logger().warn(name(), "summary dropped: %", error.message());
        }
        co_return std::error_code{};
    }

private:
    message_box_type box_;
    double threshold_;
    std::size_t seen_ = 0;
};

void feed_sensors(edge_actors::recipient<std::string> lines, edge_actors::recipient<sensor_alarm> alarms) {
    for (const char* line : {"boiler 25.5", "boiler 31.0", "attic 12.0", "attic 35.5"}) {
        if (lines.blocking_send(std::string(line))) {
            return;
        }
    }
    if (auto error = alarms.blocking_send(sensor_alarm{"smoke in the attic"})) {
        std::cerr << "[Sensors] alarm lost: " << error.message() << std::endl;
    }
}

int main() {
    edge_actors::runtime_t runtime(edge_actors::runtime_config::from_environment());

    auto parser = edge_actors::builder::make_converter_builder("parser", line_parser{});
    auto monitor = edge_actors::builder::make_actor_builder<monitor_actor>("monitor", 8, 30.0);
    if (auto error = edge_actors::builder::link(parser, monitor)) {
        std::cerr << "link failed: " << error.message() << std::endl;
        return 1;
    }
    auto [reports_out, reports] = edge_actors::make_channel<std::string>(8);
    if (auto error = monitor.set_output(std::move(reports_out))) {
        std::cerr << "link failed: " << error.message() << std::endl;
        return 1;
    }

    // the sensors hold the only external producers: once they are done the graph winds down
    std::thread sensors;
    {
        auto lines = parser.input_recipient();
        auto monitor_input = monitor.input_recipient();
        if (!lines || !monitor_input) {
            std::cerr << "no input to feed" << std::endl;
            return 1;
        }
        sensors = std::thread(feed_sensors, std::move(lines).value(), monitor_input->adapt<sensor_alarm>());
    }

    if (auto error = runtime.spawn(std::move(parser), std::move(monitor))) {
        std::cerr << "spawn failed: " << error << std::endl;
        sensors.join();
        return 1;
    }

    std::thread printer([&reports] {
        while (auto report = reports.blocking_receive()) {
            std::cerr << "[Monitor] " << *report << std::endl;
        }
    });

    auto error = runtime.run();
    sensors.join();
    printer.join();
    if (error) {
        std::cerr << "runtime failed: " << error << std::endl;
        return 1;
    }
    return 0;
}
