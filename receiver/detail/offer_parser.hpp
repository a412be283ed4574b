#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_OFFER_PARSER_HPP_
#define YA_XDCC_RECEIVER_DETAIL_OFFER_PARSER_HPP_

#include "receiver/adi.hpp"
#include "receiver/detail/session_context.hpp"

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			namespace offer{
				constexpr auto ctcp_command = "DCC";
				constexpr auto send_subcommand = "SEND";

				// A sourceless message passes only when the policy accepts the server,
				// the bot itself passes when the policy (or the caller) accepts the target.
				[[nodiscard]] bool authorized(const task::sender_policy& policy,
					const api::optional<std::string>& source, const std::string& bot,
					bool always_accept_target = false);

				// "SEND <file> <addr> <port> <size>" with shell style quoting.
				// bad_message for a malformed payload, protocol_error for any other subcommand.
				[[nodiscard]] api::variant<transfer_descriptor, std::error_condition>
					parse(const std::string& payload);

				[[nodiscard]] api::optional<boost::asio::ip::address_v4>
					decode_address(const std::string& numeric);
			}
		}
	}
}

#endif
