#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace mavftp {
    namespace util {

        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Synchronous observer list ───────────────────────────────────────────────
        // Listeners may unsubscribe themselves while an emit() is in progress; the
        // removal is applied once dispatch finishes.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = INVALID_TOKEN;
                std::function<void(Args...)> fn;
                bool removed = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            bool dispatching_ = false;

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                if (!fn)
                    return INVALID_TOKEN;
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if (it->token != token || it->removed)
                        continue;
                    if (dispatching_) {
                        it->removed = true;
                    } else {
                        listeners_.erase(it);
                    }
                    return true;
                }
                return false;
            }

            void emit(Args... args) {
                dispatching_ = true;
                for (usize i = 0; i < listeners_.size(); ++i) {
                    if (!listeners_[i].removed)
                        listeners_[i].fn(args...);
                }
                dispatching_ = false;

                for (auto it = listeners_.begin(); it != listeners_.end();) {
                    it = it->removed ? listeners_.erase(it) : it + 1;
                }
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.removed)
                        ++active;
                }
                return active;
            }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace mavftp
