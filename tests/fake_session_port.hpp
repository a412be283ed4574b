#pragma once
#ifndef YA_XDCC_TESTS_FAKE_SESSION_PORT_HPP_
#define YA_XDCC_TESTS_FAKE_SESSION_PORT_HPP_

#include "receiver/session_port.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ya_xdcc{
	namespace testing{
		class fake_session_port;

		// Shared between a test and every port it hands out, records the outbound
		// actions and decides how the "network" answers them.
		struct port_script{
			using reaction = std::function<void (fake_session_port& port,
				const std::string& target, const std::string& text)>;

			std::string					nick = "downloader";
			// answer private messages, typically the pack request
			reaction					on_private_message;
			bool						confirm_joins = true;
			bool						confirm_quit = true;

			void record(std::string entry);
			std::vector<std::string> recorded() const;
			std::string quit_reason() const;
			bool quit_requested() const;
			// a quit that reached the port before open()
			bool quit_before_open() const;
			std::vector<std::string> ctcp_replies() const;
		private:
			friend class fake_session_port;
			mutable std::mutex			m_mutex;
			std::vector<std::string>	m_actions;
			std::vector<std::string>	m_ctcp_replies;
			std::string					m_quit_reason;
			bool						m_quit_requested = false;
			bool						m_opened = false;
			bool						m_quit_before_open = false;
		};

		class fake_session_port : public receiver::session_port{
			boost::asio::io_context&				m_ctx;
			std::shared_ptr<port_script>			m_script;
			std::weak_ptr<listener>					m_listener;
		public:
			fake_session_port(boost::asio::io_context& ctx, std::shared_ptr<port_script> script);

			void open(std::weak_ptr<listener> lst) override;
			std::string nickname() const override;
			void send_private_message(const std::string& target, const std::string& text) override;
			void send_ctcp_reply(const std::string& target, const std::string& text) override;
			void join(const std::string& channel) override;
			void quit(const std::string& reason) override;

			// inbound events, delivered on the io_context like a real port would
			void deliver_ctcp(api::optional<std::string> source, std::string command, std::string payload);
			void deliver_private_message(api::optional<std::string> source, std::string text);
		private:
			template<typename F>
			void deliver(F&& f){
				boost::asio::post(m_ctx, [lst = m_listener, f = std::forward<F>(f)](){
					if (auto target = lst.lock(); target)
						f(*target);
				});
			}
		};

		receiver::port_factory make_port_factory(std::shared_ptr<port_script> script);
	}
}

#endif
