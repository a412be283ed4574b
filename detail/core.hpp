#pragma once
#ifndef YA_XDCC_DETAIL_CORE_HPP_
#define YA_XDCC_DETAIL_CORE_HPP_

#include "api_binder.hpp"
#include <utility>
#include "boost/asio.hpp"

#include <mutex>
#include <thread>

namespace ya_xdcc {
	namespace core {
		namespace detail {
			// one io_context plus the thread that drives it
			class execution_unit {
				boost::asio::io_context	m_work_ctx;
				std::mutex				m_guard_mutex;
				api::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
					m_work_guard;
				std::thread					m_work_thread;
			public:
				enum class type {
					network_io,
					timers
				};

				explicit execution_unit(type t);
				execution_unit(execution_unit&& from) = delete;
				execution_unit(const execution_unit& from) = delete;

				void start();
				// drops the work guard and joins after the outstanding work drained
				void stop();

				boost::asio::io_context& context();

				~execution_unit();
			private:
				const type					m_type;
			};
		}
	}
}

#endif
