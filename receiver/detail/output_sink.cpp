#include "receiver/detail/output_sink.hpp"
#include "detail/logging.hpp"

#include <iostream>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			output_sink::output_sink(std::ostream& os, private_ctor_tag tag)
				: m_stream(&os) {}

			output_sink::output_sink(const api::fs::path& fp, private_ctor_tag tag)
				: m_file_stream(fp, std::ios_base::binary | std::ios_base::out | std::ios_base::trunc),
				m_path(fp) {
				if (m_file_stream.is_open())
					m_stream = &m_file_stream;
			}

			output_sink::~output_sink(){
				close();
			}

			api::variant<api::fs::path, std::error_condition>
				output_sink::resolve(const std::string& designator, const std::string& offered_name){
				auto ec = api::error_code{};
				auto target = api::fs::path{ designator };
				if (designator.empty() or api::fs::is_directory(target, ec)){
					if (designator.empty())
						target = api::fs::current_path();
					// only the basename of the offer is trusted
					auto base_name = api::fs::path{ offered_name }.filename();
					if (base_name.empty() or base_name == "." or base_name == "..")
						return std::make_error_condition(std::errc::invalid_argument);
					return target / base_name;
				}
				return target;
			}

			api::variant<std::unique_ptr<output_sink>, std::error_condition>
				output_sink::open(const std::string& designator, const std::string& offered_name){
				if (designator == task::stdout_marker)
					return std::make_unique<output_sink>(std::cout, private_ctor_tag{});

				auto resolved = resolve(designator, offered_name);
				if (api::holds_alternative<std::error_condition>(resolved))
					return api::get<std::error_condition>(resolved);

				auto& fp = api::get<api::fs::path>(resolved);
				auto sink = std::make_unique<output_sink>(fp, private_ctor_tag{});
				if (sink->m_stream == nullptr){
					log::get()->error("Cannot open {} for writing", fp.string());
					return std::make_error_condition(std::errc::io_error);
				}
				log::get()->info("Downloading into: {}", fp.string());
				return sink;
			}

			bool output_sink::write(const std::uint8_t* data, std::size_t length){
				if (m_stream == nullptr)
					return false;
				m_stream->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
				m_stream->flush();
				return m_stream->good();
			}

			void output_sink::close(){
				if (m_stream == nullptr)
					return;
				m_stream->flush();
				if (m_file_stream.is_open())
					m_file_stream.close();
				m_stream = nullptr;
			}

			bool output_sink::is_standard_output() const{
				return m_path.empty();
			}

			const api::fs::path& output_sink::path() const{
				return m_path;
			}
		}
	}
}
