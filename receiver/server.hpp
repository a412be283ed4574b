#pragma once
#ifndef YA_XDCC_RECEIVER_SERVER_HPP_
#define YA_XDCC_RECEIVER_SERVER_HPP_

#include "receiver/adi.hpp"
#include "receiver/session_port.hpp"
#include <memory>

namespace ya_xdcc{
	namespace receiver{
		class server{
			class impl;
			std::unique_ptr<impl>			m_impl;
		public:
			explicit server(port_factory factory);
			server(const server&) = delete;
			server(server&&) = delete;
			server& operator=(const server&) = delete;
			server& operator=(server&&) = delete;
			~server();

			// blocks until the session delivered its outcome
			task::outcome fetch(const task::parameters& params);
			api::variant<task::batch_result, std::error_condition>
				fetch_batch(const task::parameters& params, const std::string& id_spec);
			// safe to call from any thread, also ends the rest of a running batch
			void interrupt();

			api::optional<std::uint32_t> install_progress_monitor(task::progress::listener lst);
			bool remove_progress_monitor(std::uint32_t key);
		};
	}
}

#endif
