#pragma once
#ifndef YA_XDCC_HPP_
#define YA_XDCC_HPP_

#include "receiver/server.hpp"
#include "cli/options.hpp"

namespace ya_xdcc {
	// Runs a parsed command line to completion and returns the process exit status.
	// The caller supplies the IRC side through the port factory.
	int run(const cli::invocation& inv, receiver::port_factory factory);

	std::size_t terminal_width();
}

#endif
