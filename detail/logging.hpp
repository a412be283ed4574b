#pragma once
#ifndef YA_XDCC_DETAIL_LOGGING_HPP_
#define YA_XDCC_DETAIL_LOGGING_HPP_

#include <memory>
#include "spdlog/spdlog.h"

namespace ya_xdcc{
	namespace log{
		// the library wide logger, writes to stderr
		std::shared_ptr<spdlog::logger> get();

		// 0 shows informational messages, 1 adds debug, 2 and above everything
		void set_verbosity(int verbosity);
	}
}

#endif
