#include "api/transport/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::api, HttpError, e) {
  using chainrelay::api::HttpError;
  switch (e) {
    case HttpError::INVALID_URL:
      return "invalid url, expected http(s)://host[:port][/target]";
    case HttpError::RESOLVE_FAILED:
      return "cannot resolve host";
    case HttpError::CONNECT_FAILED:
      return "cannot connect to host";
    case HttpError::TLS_HANDSHAKE_FAILED:
      return "tls handshake failed";
    case HttpError::TIMEOUT:
      return "request timed out";
    case HttpError::IO_FAILED:
      return "connection failed while exchanging data";
    case HttpError::BAD_STATUS:
      return "server answered with a non-2xx status";
  }
  return "unknown transport error";
}
