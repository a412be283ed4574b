#include "receiver/detail/session_context.hpp"

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			session_context::session_context(task::parameters p)
				: params(std::move(p)) {}

			session_context::~session_context() = default;

			std::uintmax_t session_context::declared_size() const{
				return (connected.load(std::memory_order_acquire) or ended.load()) and offer ? offer->size : 0u;
			}

			void session_context::raise_warning(std::string text, bool short_lived){
				std::lock_guard warning_lock(m_warning_mutex);
				m_warning = std::move(text);
				m_short_warning = short_lived;
			}

			void session_context::clear_warning(){
				std::lock_guard warning_lock(m_warning_mutex);
				m_warning.clear();
				m_short_warning = true;
			}

			api::optional<std::string> session_context::take_warning(){
				std::lock_guard warning_lock(m_warning_mutex);
				if (m_warning.empty())
					return api::nullopt;
				auto warning = m_warning;
				if (m_short_warning)
					m_warning.clear();
				return warning;
			}
		}
	}
}
