#include "cli/options.hpp"

#include "boost/program_options/errors.hpp"
#include <gtest/gtest.h>

using namespace ya_xdcc;

TEST(options, positionals_and_defaults){
	auto inv = cli::parse({ "irc.example.net", "Bot", "42" });
	EXPECT_FALSE(inv.show_help);
	EXPECT_EQ(inv.host, "irc.example.net");
	EXPECT_EQ(inv.port, 6667u);
	EXPECT_EQ(inv.ids, "42");
	EXPECT_FALSE(inv.batch);
	EXPECT_EQ(inv.nick, cli::current_user());

	auto& params = inv.params;
	EXPECT_EQ(params.bot, "Bot");
	EXPECT_EQ(params.pack_id, "42");
	EXPECT_EQ(params.request_text(), "XDCC SEND #42");
	EXPECT_EQ(params.output, ".");
	EXPECT_EQ(params.timeout, std::chrono::seconds(30));
	EXPECT_EQ(params.verbosity, 0);
	EXPECT_FALSE(params.force_response);
	EXPECT_FALSE(params.channel);
	EXPECT_TRUE(params.sender.accept_target);
	EXPECT_FALSE(params.sender.accept_all);
	EXPECT_TRUE(params.pre_messages.empty());
}

TEST(options, every_option_lands_in_the_parameters){
	auto inv = cli::parse({ "irc.example.net:6697", "Bot", "1-3",
		"-o", "-", "-n", "leech", "-c", "#warez", "--id-prefix", "PACK", "--verb", "XDCC GET",
		"--user-agent", "tester", "-t", "5", "--force-response", "--sender", "target,relay",
		"--disconnect-message", "bye", "--pre-message", "NickServ=identify secret",
		"--pre-message", "#chat=hello=world", "--batch", "-vv", "--verbose" });

	EXPECT_EQ(inv.port, 6697u);
	EXPECT_EQ(inv.nick, "leech");
	EXPECT_TRUE(inv.batch);
	EXPECT_EQ(inv.ids, "1-3");

	auto& params = inv.params;
	EXPECT_EQ(params.output, "-");
	EXPECT_EQ(params.channel.value_or(""), "#warez");
	EXPECT_EQ(params.request_text(), "XDCC GET PACK1-3");
	EXPECT_EQ(params.user_agent, "tester");
	EXPECT_EQ(params.timeout, std::chrono::seconds(5));
	EXPECT_TRUE(params.force_response);
	EXPECT_TRUE(params.sender.accept_target);
	EXPECT_EQ(params.sender.names.count("relay"), 1u);
	EXPECT_EQ(params.disconnect_message, "bye");
	EXPECT_EQ(params.verbosity, 3);
	ASSERT_EQ(params.pre_messages.size(), 2u);
	EXPECT_EQ(params.pre_messages[0].target, "NickServ");
	EXPECT_EQ(params.pre_messages[0].text, "identify secret");
	EXPECT_EQ(params.pre_messages[1].target, "#chat");
	EXPECT_EQ(params.pre_messages[1].text, "hello=world");
}

TEST(options, help_needs_nothing_else){
	EXPECT_TRUE(cli::parse({ "--help" }).show_help);
	EXPECT_NE(cli::usage().find("--pre-message"), std::string::npos);
}

TEST(options, malformed_command_lines_throw){
	namespace po = boost::program_options;
	EXPECT_THROW(cli::parse({ "irc.example.net", "Bot" }), po::required_option);
	EXPECT_THROW(cli::parse({ "a:b:c", "Bot", "1" }), po::validation_error);
	EXPECT_THROW(cli::parse({ "irc.example.net:port", "Bot", "1" }), po::validation_error);
	EXPECT_THROW(cli::parse({ "irc.example.net:70000", "Bot", "1" }), po::validation_error);
	EXPECT_THROW(cli::parse({ "irc.example.net", "Bot", "1", "-t", "0" }), po::validation_error);
	EXPECT_THROW(cli::parse({ "irc.example.net", "Bot", "1", "--pre-message", "no-separator" }), po::validation_error);
	EXPECT_THROW(cli::parse({ "irc.example.net", "Bot", "1", "--unknown" }), po::error);
	EXPECT_THROW(cli::parse({ "irc.example.net", "Bot", "1", "extra" }), po::error);
}

TEST(options, argv_form_skips_the_program_name){
	const char* argv[] = { "ya_xdcc", "irc.example.net", "Bot", "9", "-v" };
	auto inv = cli::parse(5, argv);
	EXPECT_EQ(inv.params.pack_id, "9");
	EXPECT_EQ(inv.params.verbosity, 1);
}
