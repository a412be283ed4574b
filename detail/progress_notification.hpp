#pragma once
#ifndef YA_XDCC_DETAIL_PROGRESS_NOTIFICATION_HPP_
#define YA_XDCC_DETAIL_PROGRESS_NOTIFICATION_HPP_

#include "receiver/adi.hpp"
#include <map>
#include <mutex>

namespace ya_xdcc {
    namespace core {
        namespace detail {
            class progress_notification {
                std::mutex m_listener_mutex;
                std::uint32_t m_next_key = 0u;
                std::map<std::uint32_t, receiver::task::progress::listener> m_receiver_listeners;

              public:
                progress_notification();
                progress_notification(const progress_notification &) = delete;
                progress_notification &operator=(const progress_notification &) = delete;

                // listeners run on the posting thread
                void post_progress(const receiver::task::progress &pg);
                api::optional<std::uint32_t> add_listener(receiver::task::progress::listener lst);
                bool remove_listener(std::uint32_t key);
            };
        } // namespace detail
    }
}
#endif
