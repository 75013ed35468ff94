#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <exception>
#include <memory_resource>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <edge-actors/builder/message_box_builder.hpp>
#include <edge-actors/builder/peer_linker.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/fan_in.hpp>
#include <edge-actors/logger.hpp>
#include <edge-actors/mailbox/mailbox.hpp>
#include <edge-actors/mailbox/recipient.hpp>
#include <edge-actors/result.hpp>
#include <edge-actors/task.hpp>

namespace edge_actors { namespace builder {

    using client_id = std::size_t;

    /// a request tagged with the client that must receive the response
    template<message Request>
    struct request_envelope final {
        client_id client;
        Request request;

        friend std::ostream& operator<<(std::ostream& os, const request_envelope& envelope) {
            return os << '#' << envelope.client << ' ' << envelope.request;
        }
    };

    /// @brief Answers each request with exactly one response.
    template<class S>
    concept server = requires(S& s, typename S::request_type request) {
        typename S::request_type;
        typename S::response_type;
        { s.handle(std::move(request)) } -> std::same_as<task<typename S::response_type>>;
    } && message<typename S::request_type> && message<typename S::response_type>;

    /// @brief Serves its clients, one request at a time unless built with a higher max concurrency.
    ///
    /// With a max concurrency above one, up to that many handle() calls are in
    /// flight at once, possibly on different workers, and responses go out in
    /// completion order. The actor finishes only once every started request is answered.
    template<server S>
    class server_actor final {
    public:
        using request_type = typename S::request_type;
        using response_type = typename S::response_type;
        using input_type = fan_in_message<request_envelope<request_type>>;

        server_actor(std::string name,
                     mailbox::mailbox_t<input_type> requests,
                     std::vector<mailbox::recipient<response_type>> clients,
                     S server,
                     std::size_t max_concurrency = 1,
                     std::optional<mailbox::recipient<input_type>> idle_source = std::nullopt)
            : name_(std::move(name))
            , requests_(std::move(requests))
            , clients_(std::move(clients))
            , server_(std::move(server))
            , max_concurrency_(std::max<std::size_t>(1, max_concurrency))
            , idle_source_(std::move(idle_source)) {
        }

        const std::string& name() const noexcept {
            return name_;
        }

        std::size_t max_concurrency() const noexcept {
            return max_concurrency_;
        }

        task<std::error_code> run() {
            auto* executor = co_await this_executor();
            if (max_concurrency_ > 1 && executor != nullptr) {
                co_return co_await run_concurrently(*executor);
            }
            while (auto message = co_await requests_.receive()) {
                if (message->is_runtime_request()) {
                    break;
                }
                co_await serve(next_request(std::move(*message)));
            }
            co_return std::error_code{};
        }

    private:
        struct completion final {
            client_id client;
            std::exception_ptr failure;

            friend std::ostream& operator<<(std::ostream& os, const completion& done) {
                return os << "done #" << done.client;
            }
        };

        request_envelope<request_type> next_request(input_type&& message) {
            auto envelope = std::move(message).template get<request_envelope<request_type>>();
            logger().debug(name_, "recv %", envelope);
            return envelope;
        }

        task<void> serve(request_envelope<request_type> envelope) {
            auto response = co_await server_.handle(std::move(envelope.request));
            if (auto error = co_await clients_[envelope.client].send(std::move(response))) {
                // one client gone does not stop the others
                logger().warn(name_, "client #% is gone: %", envelope.client, error.message());
            }
        }

        task<std::error_code> run_concurrently(scheduler::executor_t& executor) {
            auto [done, completions] = mailbox::make_channel<completion>(max_concurrency_);
            std::size_t in_flight = 0;
            std::exception_ptr failure;

            auto settle = [&](const completion& finished) {
                --in_flight;
                if (finished.failure && !failure) {
                    failure = finished.failure;
                }
            };

            while (!failure) {
                if (in_flight == max_concurrency_) {
                    auto finished = co_await completions.receive();
                    if (!finished) {
                        break;
                    }
                    settle(*finished);
                    continue;
                }
                auto message = co_await requests_.receive();
                if (!message || message->is_runtime_request()) {
                    break;
                }
                auto envelope = next_request(std::move(*message));
                const client_id client = envelope.client;
                launch(executor, serve(std::move(envelope)), [done = done, client, name = name_](std::exception_ptr error) {
                    if (auto lost = done.try_send(completion{client, error})) {
                        logger().error(name, "request of client #% finished unseen: %", client, lost.message());
                    }
                });
                ++in_flight;
                while (auto finished = completions.try_receive()) {
                    settle(*finished);
                }
            }

            while (in_flight > 0) {
                auto finished = co_await completions.receive();
                if (!finished) {
                    break;
                }
                settle(*finished);
            }
            if (failure) {
                std::rethrow_exception(failure);
            }
            co_return std::error_code{};
        }

        std::string name_;
        mailbox::mailbox_t<input_type> requests_;
        std::vector<mailbox::recipient<response_type>> clients_;
        S server_;
        std::size_t max_concurrency_;
        std::optional<mailbox::recipient<input_type>> idle_source_;
    };

    /// @brief Builder of a server_actor. Every connect() registers one more client.
    ///
    /// Like message_box_builder it holds a producer on its own input until build().
    template<server S>
    class server_builder_t final : public peer_linker<typename S::request_type, typename S::response_type> {
    public:
        using actor_type = server_actor<S>;
        using request_type = typename S::request_type;
        using response_type = typename S::response_type;
        using input_type = typename actor_type::input_type;

        server_builder_t(std::string name,
                         S server,
                         std::size_t capacity = default_mailbox_capacity,
                         std::pmr::memory_resource* resource = std::pmr::get_default_resource())
            : name_(std::move(name))
            , channel_(make_counted<mailbox::detail::channel_t<input_type>>(capacity, resource))
            , server_(std::move(server)) {
            self_.emplace(channel_);
        }

        server_builder_t(server_builder_t&& other) noexcept
            : name_(std::move(other.name_))
            , channel_(std::move(other.channel_))
            , self_(std::move(other.self_))
            , clients_(std::move(other.clients_))
            , server_(std::move(other.server_))
            , max_concurrency_(other.max_concurrency_)
            , state_(std::exchange(other.state_, link_state::spawned)) {
            other.self_.reset();
        }

        const std::string& name() const noexcept {
            return name_;
        }

        link_state state() const noexcept {
            return state_;
        }

        std::size_t clients() const noexcept {
            return clients_.size();
        }

        /// How many requests may be handled at once; zero counts as one.
        server_builder_t& with_max_concurrency(std::size_t max_concurrency) noexcept {
            max_concurrency_ = std::max<std::size_t>(1, max_concurrency);
            return *this;
        }

        std::size_t max_concurrency() const noexcept {
            return max_concurrency_;
        }

        /// Registers @p responses as a new client; requests sent to the returned recipient are answered there.
        result<mailbox::recipient<request_type>> connect(mailbox::recipient<response_type> responses) override {
            if (state_ == link_state::spawned) {
                return link_errc::already_spawned;
            }
            const client_id id = clients_.size();
            clients_.push_back(std::move(responses));
            state_ = link_state::linked;
            mailbox::recipient<input_type> requests(channel_);
            return requests.template map<request_type>([id](request_type&& request) {
                return input_type(request_envelope<request_type>{id, std::move(request)});
            });
        }

        mailbox::signal_sender_t signal_sender() const {
            if (!channel_) {
                return mailbox::signal_sender_t();
            }
            return mailbox::signal_sender_t(channel_);
        }

        result<actor_type> build() && {
            if (state_ == link_state::spawned) {
                return link_errc::already_spawned;
            }
            std::optional<mailbox::recipient<input_type>> idle_source;
            if (clients_.empty()) {
                idle_source = std::move(self_);
            }
            self_.reset();
            state_ = link_state::spawned;
            return actor_type(name_,
                              mailbox::mailbox_t<input_type>(std::move(channel_)),
                              std::move(clients_),
                              std::move(server_),
                              max_concurrency_,
                              std::move(idle_source));
        }

    private:
        std::string name_;
        intrusive_ptr<mailbox::detail::channel_t<input_type>> channel_;
        std::optional<mailbox::recipient<input_type>> self_;
        std::vector<mailbox::recipient<response_type>> clients_;
        S server_;
        std::size_t max_concurrency_ = 1;
        link_state state_ = link_state::building;
    };

    /// @brief The client side of a server: sends one request at a time and awaits its response.
    template<message Request, message Response>
    class client_message_box final {
    public:
        using request_type = Request;
        using response_type = Response;

        client_message_box(std::string name, mailbox::recipient<Request> requests, mailbox::mailbox_t<Response> responses)
            : name_(std::move(name))
            , requests_(std::move(requests))
            , responses_(std::move(responses)) {
        }

        /// Registers a new client on @p service. At most one response is ever pending.
        static result<client_message_box> connect(std::string name, peer_linker<Request, Response>& service) {
            auto channel = mailbox::make_channel<Response>(1);
            auto requests = service.connect(std::move(channel.sender));
            if (!requests) {
                return requests.error();
            }
            return client_message_box(std::move(name), std::move(requests).value(), std::move(channel.receiver));
        }

        const std::string& name() const noexcept {
            return name_;
        }

        /// channel_errc::closed when the service is gone before answering
        task<result<Response>> await_response(Request request) {
            logger().trace(name_, "send %", request);
            if (auto error = co_await requests_.send(std::move(request))) {
                co_return error;
            }
            auto response = co_await responses_.receive();
            if (!response) {
                co_return make_error_code(channel_errc::closed);
            }
            logger().debug(name_, "recv %", *response);
            co_return result<Response>(std::move(*response));
        }

    private:
        std::string name_;
        mailbox::recipient<Request> requests_;
        mailbox::mailbox_t<Response> responses_;
    };

}} // namespace edge_actors::builder
