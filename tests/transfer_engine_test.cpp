#include "receiver/detail/transfer_engine.hpp"
#include "detail/logging.hpp"
#include "loopback_peer.hpp"

#include "spdlog/sinks/ostream_sink.h"
#include <gtest/gtest.h>

#include <sstream>

using namespace ya_xdcc::receiver;
using ya_xdcc::testing::loopback_peer;
using ya_xdcc::testing::temp_directory;
using engine = detail::transfer_engine;

namespace {
	struct recording_employer : engine::employer{
		std::shared_ptr<engine>				target;
		int									connects = 0;
		int									ends = 0;
		std::error_condition				reason;

		void on_transfer_connected() override { connects++; }
		void on_transfer_ended(std::error_condition why) override{
			ends++;
			reason = why;
			target->close();
		}
	};

	std::unique_ptr<detail::output_sink> open_sink(const temp_directory& dir, const std::string& name){
		auto opened = detail::output_sink::open(dir.path().string(), name);
		EXPECT_TRUE((api::holds_alternative<std::unique_ptr<detail::output_sink>>(opened)));
		return std::move(api::get<std::unique_ptr<detail::output_sink>>(opened));
	}

	std::uint16_t closed_port(){
		auto io_ctx = boost::asio::io_context{};
		auto acceptor = boost::asio::ip::tcp::acceptor{ io_ctx,
			boost::asio::ip::tcp::endpoint{ boost::asio::ip::address_v4::loopback(), 0 } };
		const auto port = acceptor.local_endpoint().port();
		acceptor.close();
		return port;
	}
}

TEST(transfer_engine, acknowledgements_are_big_endian){
	EXPECT_EQ(engine::encode_acknowledgement(0u), engine::acknowledgement({ 0, 0, 0, 0 }));
	EXPECT_EQ(engine::encode_acknowledgement(1u), engine::acknowledgement({ 0, 0, 0, 1 }));
	EXPECT_EQ(engine::encode_acknowledgement(0x01020304u), engine::acknowledgement({ 1, 2, 3, 4 }));
	EXPECT_EQ(engine::encode_acknowledgement(1048576u), engine::acknowledgement({ 0, 0x10, 0, 0 }));
}

TEST(transfer_engine, acknowledgements_wrap_past_four_gibibytes){
	EXPECT_EQ(engine::encode_acknowledgement(0x100000005ull), engine::acknowledgement({ 0, 0, 0, 5 }));
	EXPECT_EQ(engine::encode_acknowledgement(0xffffffffull), engine::acknowledgement({ 0xff, 0xff, 0xff, 0xff }));
}

TEST(transfer_engine, receives_and_acknowledges_everything){
	auto dir = temp_directory{};
	const auto payload = ya_xdcc::testing::make_payload(300000u);
	auto peer = loopback_peer{ payload };

	auto io_ctx = boost::asio::io_context{};
	auto params = task::parameters{};
	params.completion_grace = std::chrono::milliseconds(200);
	auto ctx = detail::session_context{ params };
	auto descriptor = detail::transfer_descriptor{ "engine.bin",
		boost::asio::ip::address_v4::loopback(), peer.port(), payload.size() };
	ctx.offer = descriptor;

	auto boss = std::make_shared<recording_employer>();
	boss->target = engine::create(io_ctx, ctx);
	boss->target->learn_employer(boss);
	boss->target->start(descriptor, open_sink(dir, "engine.bin"));
	io_ctx.run();
	peer.join();

	EXPECT_EQ(boss->connects, 1);
	EXPECT_EQ(boss->ends, 1);
	EXPECT_FALSE(boss->reason);
	EXPECT_FALSE(ctx.connected.load());
	EXPECT_EQ(ctx.received_bytes.load(), payload.size());
	EXPECT_EQ(ya_xdcc::testing::read_file(dir.path() / "engine.bin"), payload);

	const auto acks = peer.acknowledgements();
	ASSERT_FALSE(acks.empty());
	for (auto i = std::size_t(1u); i < acks.size(); ++i)
		EXPECT_GT(acks[i], acks[i - 1]);
	EXPECT_EQ(acks.back(), payload.size());
}

TEST(transfer_engine, busy_connection_skips_acknowledgements){
	auto dir = temp_directory{};
	const auto payload = ya_xdcc::testing::make_payload(100000u);
	auto peer = loopback_peer{ payload };

	auto io_ctx = boost::asio::io_context{};
	auto params = task::parameters{};
	params.completion_grace = std::chrono::milliseconds(200);
	params.force_response = false;
	auto ctx = detail::session_context{ params };
	auto descriptor = detail::transfer_descriptor{ "busy.bin",
		boost::asio::ip::address_v4::loopback(), peer.port(), payload.size() };
	ctx.offer = descriptor;

	auto checks = 0;
	auto boss = std::make_shared<recording_employer>();
	boss->target = engine::create(io_ctx, ctx);
	boss->target->learn_employer(boss);
	boss->target->check_outbound_with([&checks](boost::asio::ip::tcp::socket&){
		checks++;
		return false;
	});
	boss->target->start(descriptor, open_sink(dir, "busy.bin"));
	io_ctx.run();
	peer.join();

	EXPECT_GT(checks, 0);
	EXPECT_EQ(boss->ends, 1);
	EXPECT_FALSE(boss->reason);
	EXPECT_EQ(ctx.received_bytes.load(), payload.size());
	EXPECT_EQ(ya_xdcc::testing::read_file(dir.path() / "busy.bin"), payload);
	EXPECT_TRUE(peer.acknowledgements().empty());
	EXPECT_FALSE(ctx.reset_window.load());
	EXPECT_FALSE(ctx.take_warning());
}

TEST(transfer_engine, forced_acknowledgement_resets_the_window_and_warns){
	auto dir = temp_directory{};
	const auto payload = ya_xdcc::testing::make_payload(100000u);
	auto peer = loopback_peer{ payload };

	auto io_ctx = boost::asio::io_context{};
	auto params = task::parameters{};
	params.completion_grace = std::chrono::milliseconds(200);
	params.force_response = true;
	auto ctx = detail::session_context{ params };
	auto descriptor = detail::transfer_descriptor{ "forced.bin",
		boost::asio::ip::address_v4::loopback(), peer.port(), payload.size() };
	ctx.offer = descriptor;

	// each check sees the state left behind by the previous acknowledgement
	auto checks = 0;
	auto resets = 0;
	auto leftover_warnings = 0;
	auto boss = std::make_shared<recording_employer>();
	boss->target = engine::create(io_ctx, ctx);
	boss->target->learn_employer(boss);
	boss->target->check_outbound_with([&](boost::asio::ip::tcp::socket&){
		if (checks > 0 and ctx.reset_window.exchange(false))
			resets++;
		if (ctx.take_warning())
			leftover_warnings++;
		checks++;
		return false;
	});

	auto log_text = std::ostringstream{};
	auto logger = ya_xdcc::log::get();
	const auto previous_level = logger->level();
	logger->sinks().push_back(std::make_shared<spdlog::sinks::ostream_sink_mt>(log_text));
	logger->set_level(spdlog::level::debug);

	boss->target->start(descriptor, open_sink(dir, "forced.bin"));
	io_ctx.run();
	peer.join();

	logger->sinks().pop_back();
	logger->set_level(previous_level);

	EXPECT_GT(checks, 0);
	EXPECT_EQ(resets, checks - 1);
	EXPECT_TRUE(ctx.reset_window.load());
	EXPECT_EQ(leftover_warnings, 0);
	EXPECT_FALSE(ctx.take_warning());
	EXPECT_NE(log_text.str().find("on a busy connection"), std::string::npos);

	EXPECT_EQ(boss->ends, 1);
	EXPECT_EQ(ya_xdcc::testing::read_file(dir.path() / "forced.bin"), payload);
	const auto acks = peer.acknowledgements();
	EXPECT_EQ(acks.size(), static_cast<std::size_t>(checks));
	ASSERT_FALSE(acks.empty());
	EXPECT_EQ(acks.back(), payload.size());
}

TEST(transfer_engine, refused_connection_ends_the_transfer){
	auto dir = temp_directory{};
	auto io_ctx = boost::asio::io_context{};
	auto ctx = detail::session_context{ task::parameters{} };
	auto descriptor = detail::transfer_descriptor{ "refused.bin",
		boost::asio::ip::address_v4::loopback(), closed_port(), 10u };
	ctx.offer = descriptor;

	auto boss = std::make_shared<recording_employer>();
	boss->target = engine::create(io_ctx, ctx);
	boss->target->learn_employer(boss);
	boss->target->start(descriptor, open_sink(dir, "refused.bin"));
	io_ctx.run();

	EXPECT_EQ(boss->connects, 0);
	EXPECT_EQ(boss->ends, 1);
	EXPECT_EQ(boss->reason, std::errc::connection_refused);
	EXPECT_EQ(ctx.received_bytes.load(), 0u);
}

TEST(transfer_engine, close_is_idempotent){
	auto io_ctx = boost::asio::io_context{};
	auto ctx = detail::session_context{ task::parameters{} };
	auto e = engine::create(io_ctx, ctx);
	e->close();
	e->close();
	EXPECT_FALSE(ctx.connected.load());
}
