#pragma once
#ifndef YA_XDCC_RECEIVER_SESSION_PORT_HPP_
#define YA_XDCC_RECEIVER_SESSION_PORT_HPP_

#include "api_binder.hpp"
#include <utility>
#include "boost/asio.hpp"

#include <functional>
#include <memory>
#include <string>

namespace ya_xdcc{
	namespace receiver{
		// The IRC session engine seen from the downloader: it delivers inbound events
		// to a listener and accepts a handful of outbound actions. Every event must be
		// delivered on the thread running the io_context the port was created with.
		// After quit() the port has to report on_disconnect() eventually and release
		// whatever asynchronous work it still holds on that io_context.
		class session_port{
		public:
			class listener{
			public:
				virtual void on_welcome() = 0;
				virtual void on_join(const std::string& nick, const std::string& channel) = 0;
				// source is empty for server originated messages
				virtual void on_ctcp(const api::optional<std::string>& source,
					const std::string& command, const std::string& payload) = 0;
				virtual void on_private_message(const api::optional<std::string>& source,
					const std::string& text) = 0;
				virtual void on_disconnect() = 0;
				virtual ~listener();
			};

			virtual void open(std::weak_ptr<listener> lst) = 0;
			virtual std::string nickname() const = 0;
			virtual void send_private_message(const std::string& target, const std::string& text) = 0;
			virtual void send_ctcp_reply(const std::string& target, const std::string& text) = 0;
			virtual void join(const std::string& channel) = 0;
			virtual void quit(const std::string& reason) = 0;
			virtual ~session_port();
		};

		using port_factory = std::function<std::unique_ptr<session_port> (boost::asio::io_context&)>;
	}
}

#endif
