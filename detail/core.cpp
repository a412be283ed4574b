#include "detail/core.hpp"
#include "detail/logging.hpp"

namespace ya_xdcc {
	namespace core {
		namespace detail {
			execution_unit::execution_unit(type t) :
				m_work_guard(boost::asio::make_work_guard<boost::asio::io_context::executor_type>(m_work_ctx.get_executor())),
				m_type(t) {

			}

			void execution_unit::start() {
				if (not m_work_thread.joinable()) {
					log::get()->trace("Starting {} execution unit",
						m_type == type::network_io ? "network" : "timer");

					std::lock_guard work_guard_lock(m_guard_mutex);
					if (not m_work_guard)
						m_work_guard.emplace(boost::asio::make_work_guard<boost::asio::io_context::executor_type>(m_work_ctx.get_executor()));

					m_work_thread = std::thread{ [this]() {
						std::unique_lock work_guard_lock(m_guard_mutex);
						auto handled = std::size_t(0u);
						do {
							work_guard_lock.unlock();
							handled = m_work_ctx.run_one();
							work_guard_lock.lock();
						} while (m_work_guard or handled > 0);
						work_guard_lock.unlock();
					} };
				}
			}

			void execution_unit::stop() {
				{
					std::lock_guard work_guard_lock(m_guard_mutex);
					m_work_guard = api::nullopt;
				}
				if (m_work_thread.joinable())
					m_work_thread.join();
			}

			boost::asio::io_context& execution_unit::context(){
				return m_work_ctx;
			}

			execution_unit::~execution_unit() {
				stop();
			}
		}
	}
}
