#pragma once

#include <edge-actors/errors.hpp>

namespace edge_actors {

    namespace {

        class channel_category_t final : public std::error_category {
        public:
            const char* name() const noexcept override {
                return "edge-actors.channel";
            }

            std::string message(int value) const override {
                switch (static_cast<channel_errc>(value)) {
                    case channel_errc::closed:
                        return "the receiving end of the channel is closed";
                    case channel_errc::full:
                        return "the channel is full";
                }
                return "unknown channel error";
            }
        };

        class link_category_t final : public std::error_category {
        public:
            const char* name() const noexcept override {
                return "edge-actors.link";
            }

            std::string message(int value) const override {
                switch (static_cast<link_errc>(value)) {
                    case link_errc::already_spawned:
                        return "the actor has already been spawned and can no longer be linked";
                    case link_errc::type_mismatch:
                        return "the peer does not exchange the expected message types";
                    case link_errc::already_linked:
                        return "the output of the actor is already linked";
                }
                return "unknown link error";
            }
        };

        class runtime_category_t final : public std::error_category {
        public:
            const char* name() const noexcept override {
                return "edge-actors.runtime";
            }

            std::string message(int value) const override {
                switch (static_cast<runtime_errc>(value)) {
                    case runtime_errc::actor_error:
                        return "actor error";
                    case runtime_errc::actor_panic:
                        return "actor panicked";
                    case runtime_errc::spawn_failed:
                        return "failed to spawn actor";
                    case runtime_errc::runtime_stopped:
                        return "the runtime no longer accepts actors";
                    case runtime_errc::shutdown_timeout:
                        return "timeout waiting for all actors to shutdown";
                }
                return "unknown runtime error";
            }
        };

    } // namespace

    const std::error_category& channel_category() noexcept {
        static const channel_category_t category;
        return category;
    }

    const std::error_category& link_category() noexcept {
        static const link_category_t category;
        return category;
    }

    const std::error_category& runtime_category() noexcept {
        static const runtime_category_t category;
        return category;
    }

    std::string runtime_error_t::message() const {
        if (!kind_) {
            return "success";
        }
        std::string result = kind_.message();
        if (!actor_.empty()) {
            result += " in '" + actor_ + "'";
        }
        if (cause_ && cause_ != kind_) {
            result += ": " + cause_.message();
        }
        return result;
    }

} // namespace edge_actors
