#ifndef CHAINRELAY_SRC_API_TRANSPORT_ERROR_HPP
#define CHAINRELAY_SRC_API_TRANSPORT_ERROR_HPP

#include "outcome/outcome.hpp"

namespace chainrelay::api {
  enum class HttpError {
    INVALID_URL = 1,     // url is not http(s)://host[:port][/target]
    RESOLVE_FAILED,      // host name could not be resolved
    CONNECT_FAILED,      // tcp connection refused or unreachable
    TLS_HANDSHAKE_FAILED,  // tls setup or handshake failed
    TIMEOUT,             // request did not complete within its deadline
    IO_FAILED,           // connection dropped while writing or reading
    BAD_STATUS,          // server answered with a non-2xx status
  };
}

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::api, HttpError)

#endif  // CHAINRELAY_SRC_API_TRANSPORT_ERROR_HPP
