// ADI is short for Application Data Interface
#pragma once
#ifndef YA_XDCC_RECEIVER_ADI_HPP_
#define YA_XDCC_RECEIVER_ADI_HPP_

#include "api_binder.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace ya_xdcc{
	namespace receiver{
		namespace task{
			enum class status{
				awaiting_welcome,
				joining_channel,
				requesting,
				transferring,
				complete,
				failed
			};

			// who may send us a DCC offer (and whose private messages get echoed)
			struct sender_policy{
				bool					accept_target = true;
				bool					accept_all = false;
				// server originated events carry no source nick at all
				bool					accept_server = false;
				std::set<std::string>	names;

				// comma separated list of "target", "all", "server" and nicks
				static sender_policy parse(const std::string& spec);
				static sender_policy target_only();
			};

			struct pre_message{
				std::string		target;
				std::string		text;
			};

			struct progress{
				status			current_status;
				std::uintmax_t	received_bytes = 0u;
				std::uintmax_t	total_bytes = 0u;
				std::string		file_name;
				std::string		status_line;
				using listener = std::function<void (const progress&)>;
			};

			struct outcome{
				bool				success = false;
				std::error_condition	reason;
				std::string			file_name;
				api::fs::path		destination;
				std::uintmax_t		received_bytes = 0u;
				std::uintmax_t		total_bytes = 0u;
				std::string			message;
			};

			struct batch_result{
				bool				success = true;
				std::vector<std::pair<std::uint64_t, outcome>>	sessions;
			};

			struct parameters{
				std::string					bot;
				std::string					pack_id;
				std::string					verb = "XDCC SEND";
				std::string					id_prefix = "#";
				sender_policy				sender;
				api::optional<std::string>	channel;
				std::chrono::milliseconds	timeout = std::chrono::seconds(30);
				std::chrono::milliseconds	poll_interval = std::chrono::seconds(1);
				std::chrono::milliseconds	completion_grace = std::chrono::seconds(1);
				std::chrono::milliseconds	quit_linger = std::chrono::seconds(5);
				std::string					user_agent = "ya_xdcc/0.1.0 (boost.asio)";
				bool						force_response = false;
				std::string					disconnect_message;
				std::vector<pre_message>	pre_messages;
				// "-" writes to standard output
				std::string					output = ".";
				int							verbosity = 0;
				std::size_t					status_width = 80u;

				std::string request_text() const;

				parameters();
				parameters(const parameters&);
				parameters(parameters&&);
				parameters& operator=(const parameters&);
				parameters& operator=(parameters&&);
				~parameters();
			};

			constexpr auto stdout_marker = "-";
		}
	}
}

#endif
