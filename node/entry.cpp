#include <csignal>
#include <iostream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <boost/thread.hpp>

#include "api/transport/impl/http/beast_http_client.hpp"
#include "application/bridge_service.hpp"
#include "application/config_loader.hpp"
#include "base/logger.hpp"
#include "clock/impl/clock_impl.hpp"
#include "clock/impl/interruptible_sleeper.hpp"
#include "cli.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"

int main (int argc, char * const * argv)
{
	boost::program_options::options_description description ("Command line options");
	// clang-format off
	description.add_options ()
		("help", "Print out options");
	// clang-format on
	chainrelay::add_bridge_options (description);
	boost::program_options::variables_map vm;
	try
	{
		boost::program_options::store (boost::program_options::parse_command_line (argc, argv, description), vm);
	}
	catch (boost::program_options::error const & err)
	{
		std::cerr << err.what () << std::endl;
		return 1;
	}
	boost::program_options::notify (vm);
	if (vm.count ("help"))
	{
		std::cout << description << std::endl;
		return 0;
	}

	chainrelay::application::BridgeConfig config;
	chainrelay::application::ConfigLoader loader;
	auto config_it (vm.find ("config"));
	if (config_it != vm.end ())
	{
		if (!loader.applyFile (config_it->second.as<std::string> (), config))
		{
			chainrelay::application::ConfigLoader::wipeSecret (config);
			return 1;
		}
	}
	if (!loader.applyEnvironment (config))
	{
		chainrelay::application::ConfigLoader::wipeSecret (config);
		return 1;
	}
	auto cli_result (chainrelay::apply_bridge_options (config, vm));
	if (!cli_result)
	{
		std::cerr << cli_result.error ().message () << std::endl;
		chainrelay::application::ConfigLoader::wipeSecret (config);
		return 1;
	}

	chainrelay::base::setDefaultLogFile (config.log_file);
	chainrelay::base::setLogLevel (config.log_level);
	auto logger = chainrelay::base::createLogger ("ChainRelay");
	logger->info ("Starting Cross-Chain Bridge Event Listener...");

	auto provider = std::make_shared<chainrelay::crypto::Secp256k1ProviderImpl> ();
	if (!loader.validate (config, *provider))
	{
		chainrelay::application::ConfigLoader::wipeSecret (config);
		return 1;
	}

	auto service = chainrelay::application::BridgeService::create (config,
	std::make_shared<chainrelay::api::BeastHttpClient> (),
	provider,
	std::make_shared<chainrelay::clock::InterruptibleSleeper> (),
	std::make_shared<chainrelay::clock::SystemClockImpl> ());
	chainrelay::application::ConfigLoader::wipeSecret (config);
	if (!service)
	{
		logger->critical ("An unhandled error occurred during initialization: {}", service.error ().message ());
		return 1;
	}

	// installed before start (), which blocks for the initial setup
	boost::asio::io_context io_context;
	boost::asio::signal_set signals (io_context, SIGINT, SIGTERM);
	signals.async_wait ([&service](boost::system::error_code const & ec, int) {
		if (!ec)
		{
			service.value ()->stop ();
		}
	});
	boost::thread signal_thread ([&io_context] () { io_context.run (); });

	auto started (service.value ()->start ());
	if (!started)
	{
		signals.cancel ();
		io_context.stop ();
		signal_thread.join ();
		return 1;
	}
	signal_thread.join ();

	logger->info ("Bridge relay stopped");
	return 0;
}
