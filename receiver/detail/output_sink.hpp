#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_OUTPUT_SINK_HPP_
#define YA_XDCC_RECEIVER_DETAIL_OUTPUT_SINK_HPP_

#include "receiver/adi.hpp"

#include <fstream>
#include <memory>
#include <ostream>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			class output_sink{
				struct private_ctor_tag {};
				std::ofstream		m_file_stream;
				std::ostream*		m_stream = nullptr;
				api::fs::path		m_path;
			public:
				output_sink(std::ostream& os, private_ctor_tag tag);
				output_sink(const api::fs::path& fp, private_ctor_tag tag);
				output_sink(const output_sink&) = delete;
				output_sink& operator=(const output_sink&) = delete;
				~output_sink();

				// "-" is standard output, an existing directory receives the basename of the
				// offered file, anything else is the destination path itself (truncated)
				[[nodiscard]] static api::variant<api::fs::path, std::error_condition>
					resolve(const std::string& designator, const std::string& offered_name);
				[[nodiscard]] static api::variant<std::unique_ptr<output_sink>, std::error_condition>
					open(const std::string& designator, const std::string& offered_name);

				[[nodiscard]] bool write(const std::uint8_t* data, std::size_t length);
				void close();
				bool is_standard_output() const;
				const api::fs::path& path() const;
			};
		}
	}
}

#endif
