#pragma once
#ifndef YA_XDCC_CLI_OPTIONS_HPP_
#define YA_XDCC_CLI_OPTIONS_HPP_

#include "receiver/adi.hpp"

#include <string>
#include <vector>

namespace ya_xdcc{
	namespace cli{
		constexpr std::uint16_t default_irc_port = 6667u;

		struct invocation{
			bool						show_help = false;
			std::string					host;
			std::uint16_t				port = default_irc_port;
			std::string					nick;
			// a single pack id, or an id list when batch is set
			std::string					ids;
			bool						batch = false;
			receiver::task::parameters	params;
		};

		// throws boost::program_options::error on malformed command lines
		invocation parse(int argc, const char* const argv[]);
		invocation parse(const std::vector<std::string>& args);

		std::string usage();
		std::string current_user();
	}
}

#endif
