#include "cli.hpp"

#include "application/config_loader.hpp"
#include "base/uint256.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3 (chainrelay, error_cli, e)
{
	using E = chainrelay::error_cli;
	switch (e)
	{
		case E::generic:
			return "Unknown error";
		case E::parse_error:
			return "Could not parse command line";
		case E::invalid_arguments:
			return "Invalid arguments";
		case E::reading_config:
			return "Config file read error";
	}

	return "Invalid error code";
}

namespace
{
template <typename T>
void apply_value (boost::program_options::variables_map const & vm, char const * name, T & target)
{
	auto it (vm.find (name));
	if (it != vm.end ())
	{
		target = it->second.as<T> ();
	}
}
}

void chainrelay::add_bridge_options (boost::program_options::options_description & description_a)
{
	// clang-format off
	description_a.add_options ()
	("config", boost::program_options::value<std::string> (), "JSON configuration file, overridden by environment variables and flags")
	("verbosity", boost::program_options::value<std::string> (), "Log level: trace, debug, info, warn, error, critical or off")
	("log_file", boost::program_options::value<std::string> (), "Write logs to <file> instead of stdout")
	("source_rpc", boost::program_options::value<std::string> (), "Source chain JSON-RPC endpoint")
	("source_chain_id", boost::program_options::value<uint64_t> (), "Expected source chain id")
	("source_contract", boost::program_options::value<std::string> (), "Source bridge contract address")
	("dest_rpc", boost::program_options::value<std::string> (), "Destination chain JSON-RPC endpoint")
	("dest_chain_id", boost::program_options::value<uint64_t> (), "Expected destination chain id")
	("dest_contract", boost::program_options::value<std::string> (), "Destination bridge contract address")
	("event", boost::program_options::value<std::string> (), "Source event to listen for")
	("poll_interval", boost::program_options::value<int64_t> (), "Seconds between polls")
	("validator_address", boost::program_options::value<std::string> (), "Address the validator key must belong to")
	("min_amount", boost::program_options::value<std::string> (), "Smallest relayed amount in base units")
	("price_floor", boost::program_options::value<double> (), "Minimum USD market price of the bridged asset");
	// clang-format on
}

outcome::result<void> chainrelay::apply_bridge_options (application::BridgeConfig & config_a, boost::program_options::variables_map const & vm)
{
	apply_value (vm, "log_file", config_a.log_file);
	apply_value (vm, "source_rpc", config_a.source.rpc_url);
	apply_value (vm, "source_chain_id", config_a.source.chain_id);
	apply_value (vm, "source_contract", config_a.source.contract);
	apply_value (vm, "dest_rpc", config_a.destination.rpc_url);
	apply_value (vm, "dest_chain_id", config_a.destination.chain_id);
	apply_value (vm, "dest_contract", config_a.destination.contract);
	apply_value (vm, "event", config_a.event_name);
	apply_value (vm, "validator_address", config_a.validator_address);
	apply_value (vm, "price_floor", config_a.price_floor_usd);

	auto poll_interval_it (vm.find ("poll_interval"));
	if (poll_interval_it != vm.end ())
	{
		config_a.poll_interval = std::chrono::seconds (poll_interval_it->second.as<int64_t> ());
	}
	auto verbosity_it (vm.find ("verbosity"));
	if (verbosity_it != vm.end ())
	{
		auto level (application::parseLogLevel (verbosity_it->second.as<std::string> ()));
		if (!level)
		{
			return error_cli::invalid_arguments;
		}
		config_a.log_level = level.value ();
	}
	auto min_amount_it (vm.find ("min_amount"));
	if (min_amount_it != vm.end ())
	{
		auto amount (base::parseDecimal (min_amount_it->second.as<std::string> ()));
		if (!amount)
		{
			return error_cli::invalid_arguments;
		}
		config_a.minimum_amount = amount.value ();
	}
	return outcome::success ();
}
