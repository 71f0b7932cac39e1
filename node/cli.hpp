#ifndef CHAINRELAY_NODE_CLI_HPP
#define CHAINRELAY_NODE_CLI_HPP

#include <boost/program_options.hpp>

#include "application/bridge_config.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay
{
/** Command line related error codes */
enum class error_cli
{
	generic = 1,
	parse_error = 2,
	invalid_arguments = 3,
	reading_config = 4
};

void add_bridge_options (boost::program_options::options_description &);
/** Applies every flag present in the map on top of the already loaded configuration */
outcome::result<void> apply_bridge_options (application::BridgeConfig &, boost::program_options::variables_map const &);
}

OUTCOME_HPP_DECLARE_ERROR_2 (chainrelay, error_cli);
#endif
