#include "detail/logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

namespace ya_xdcc{
	namespace log{
		namespace {
			constexpr auto logger_name = "ya_xdcc";

			std::shared_ptr<spdlog::logger> create_logger(){
				auto existing = spdlog::get(logger_name);
				if (existing)
					return existing;
				auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
				auto logger = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
				logger->set_pattern("%H:%M:%S.%e [%^%l%$] %v");
				logger->set_level(spdlog::level::info);
				spdlog::register_logger(logger);
				return logger;
			}
		}

		std::shared_ptr<spdlog::logger> get(){
			static auto the_logger = create_logger();
			return the_logger;
		}

		void set_verbosity(int verbosity){
			auto level = spdlog::level::info;
			if (verbosity == 1)
				level = spdlog::level::debug;
			else if (verbosity >= 2)
				level = spdlog::level::trace;
			get()->set_level(level);
		}
	}
}
