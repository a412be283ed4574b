#include "cli/options.hpp"

#include "boost/program_options.hpp"
#include "boost/lexical_cast.hpp"
#include "boost/algorithm/string/split.hpp"
#include "boost/algorithm/string/classification.hpp"

#include <cstdlib>
#include <sstream>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace po = boost::program_options;

namespace ya_xdcc{
	namespace cli{
		namespace {
			po::options_description visible_options(){
				auto desc = po::options_description{ "Options" };
				desc.add_options()
					("help,h", "show this help")
					("output,o", po::value<std::string>()->default_value("."),
						"destination file or directory, - writes to standard output")
					("nick,n", po::value<std::string>(), "nickname, defaults to the current user")
					("channel,c", po::value<std::string>(), "channel to join before requesting the pack")
					("id-prefix", po::value<std::string>()->default_value("#"), "prefix of the pack id")
					("verb", po::value<std::string>()->default_value("XDCC SEND"), "command sent to the bot")
					("user-agent", po::value<std::string>()->default_value(receiver::task::parameters{}.user_agent),
						"CTCP VERSION reply")
					("timeout,t", po::value<int>()->default_value(30), "seconds without progress before giving up")
					("force-response", po::bool_switch(), "send acknowledgements even when the socket would block")
					("sender", po::value<std::string>()->default_value("target"),
						"who may offer the file: target, all, server or nick names, comma separated")
					("disconnect-message", po::value<std::string>()->default_value(""), "quit message")
					("pre-message", po::value<std::vector<std::string>>()->composing(),
						"TARGET=MESSAGE sent before the request, repeatable")
					("batch", po::bool_switch(), "treat the id as a list like 1,4-7 and fetch them in order")
					("verbose,v", "more output, repeat for even more");
				return desc;
			}

			po::options_description positional_options(){
				auto desc = po::options_description{};
				desc.add_options()
					("target", po::value<std::string>())
					("bot", po::value<std::string>())
					("id", po::value<std::string>());
				return desc;
			}

			// program_options cannot count switches, strip -v, -vv... and --verbose beforehand
			int take_verbosity(std::vector<std::string>& args){
				auto verbosity = 0;
				auto remaining = std::vector<std::string>{};
				for (auto& arg : args) {
					if (arg == "--verbose")
						verbosity++;
					else if (arg.size() > 1u and arg[0] == '-' and
						arg.find_first_not_of('v', 1) == std::string::npos)
						verbosity += static_cast<int>(arg.size() - 1u);
					else
						remaining.push_back(arg);
				}
				args.swap(remaining);
				return verbosity;
			}

			void split_target(const std::string& target, invocation& result){
				auto parts = std::vector<std::string>{};
				boost::algorithm::split(parts, target, boost::algorithm::is_any_of(":"));
				if (parts.size() > 2u or parts[0].empty())
					throw po::validation_error(po::validation_error::invalid_option_value, "target", target);

				result.host = parts[0];
				if (parts.size() == 2u) {
					auto port = std::uint16_t(0u);
					if (parts[1].find_first_not_of("0123456789") != std::string::npos or
						not boost::conversion::try_lexical_convert(parts[1], port) or port == 0u)
						throw po::validation_error(po::validation_error::invalid_option_value, "target", target);
					result.port = port;
				}
			}

			receiver::task::pre_message split_pre_message(const std::string& value){
				const auto separator = value.find('=');
				if (separator == std::string::npos or separator == 0u)
					throw po::validation_error(po::validation_error::invalid_option_value, "pre-message", value);
				return { value.substr(0, separator), value.substr(separator + 1) };
			}
		}

		std::string current_user(){
#ifdef _WIN32
			const auto* name = std::getenv("USERNAME");
			if (name != nullptr and *name != '\0')
				return name;
#else
			const auto* name = std::getenv("USER");
			if (name != nullptr and *name != '\0')
				return name;
			if (const auto* pw = ::getpwuid(::getuid()); pw != nullptr and pw->pw_name != nullptr)
				return pw->pw_name;
#endif
			return "ya_xdcc";
		}

		std::string usage(){
			auto out = std::ostringstream{};
			out << "Usage: ya_xdcc <server[:port]> <bot> <id> [options]\n\n" << visible_options();
			return out.str();
		}

		invocation parse(int argc, const char* const argv[]){
			auto args = std::vector<std::string>{};
			for (auto i = 1; i < argc; ++i)
				args.emplace_back(argv[i]);
			return parse(args);
		}

		invocation parse(const std::vector<std::string>& args){
			auto result = invocation{};
			auto remaining = args;
			result.params.verbosity = take_verbosity(remaining);

			auto all = po::options_description{};
			all.add(visible_options()).add(positional_options());
			auto positionals = po::positional_options_description{};
			positionals.add("target", 1).add("bot", 1).add("id", 1);

			auto vm = po::variables_map{};
			po::store(po::command_line_parser(remaining).options(all).positional(positionals).run(), vm);
			po::notify(vm);

			if (vm.count("help")) {
				result.show_help = true;
				return result;
			}
			for (auto name : { "target", "bot", "id" }) {
				if (not vm.count(name))
					throw po::required_option(name);
			}

			split_target(vm["target"].as<std::string>(), result);
			result.ids = vm["id"].as<std::string>();
			result.batch = vm["batch"].as<bool>();
			result.nick = vm.count("nick") ? vm["nick"].as<std::string>() : current_user();

			auto& params = result.params;
			params.bot = vm["bot"].as<std::string>();
			params.pack_id = result.ids;
			params.output = vm["output"].as<std::string>();
			params.id_prefix = vm["id-prefix"].as<std::string>();
			params.verb = vm["verb"].as<std::string>();
			params.user_agent = vm["user-agent"].as<std::string>();
			params.force_response = vm["force-response"].as<bool>();
			params.sender = receiver::task::sender_policy::parse(vm["sender"].as<std::string>());
			params.disconnect_message = vm["disconnect-message"].as<std::string>();
			if (vm.count("channel"))
				params.channel = vm["channel"].as<std::string>();

			const auto timeout = vm["timeout"].as<int>();
			if (timeout <= 0)
				throw po::validation_error(po::validation_error::invalid_option_value,
					"timeout", std::to_string(timeout));
			params.timeout = std::chrono::seconds(timeout);

			if (vm.count("pre-message")) {
				for (auto& value : vm["pre-message"].as<std::vector<std::string>>())
					params.pre_messages.push_back(split_pre_message(value));
			}
			return result;
		}
	}
}
