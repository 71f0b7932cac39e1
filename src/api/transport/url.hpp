#ifndef CHAINRELAY_SRC_API_TRANSPORT_URL_HPP
#define CHAINRELAY_SRC_API_TRANSPORT_URL_HPP

#include <string>

#include "outcome/outcome.hpp"

namespace chainrelay::api {

  struct Url {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;  ///< path and query, "/" when absent
  };

  /**
   * @brief Splits an http:// or https:// url. The port defaults to 80 or 443.
   * @return HttpError::INVALID_URL for any other scheme or shape
   */
  outcome::result<Url> parseUrl(const std::string &url);

}  // namespace chainrelay::api

#endif  // CHAINRELAY_SRC_API_TRANSPORT_URL_HPP
