#include "detail/progress_notification.hpp"

namespace ya_xdcc {
    namespace core {
        namespace detail {
            progress_notification::progress_notification() = default;

            void progress_notification::post_progress(const receiver::task::progress &pg)
            {
                std::lock_guard lsts_lock(m_listener_mutex);
                for (auto &[key, lst] : m_receiver_listeners)
                {
                    lst(pg);
                }
            }

            api::optional<std::uint32_t> progress_notification::add_listener(receiver::task::progress::listener lst)
            {
                auto lst_key = api::optional<std::uint32_t>{};
                if (lst)
                {
                    std::lock_guard lsts_lock(m_listener_mutex);
                    auto [iter, inserted] = m_receiver_listeners.emplace(m_next_key, std::move(lst));
                    if (inserted)
                        lst_key = m_next_key++;
                }

                return lst_key;
            }

            bool progress_notification::remove_listener(std::uint32_t key)
            {
                std::lock_guard lsts_lock(m_listener_mutex);
                return m_receiver_listeners.erase(key) > 0;
            }
        } // namespace detail
    } // namespace core
}
