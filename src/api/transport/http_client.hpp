#ifndef CHAINRELAY_SRC_API_TRANSPORT_HTTP_CLIENT_HPP
#define CHAINRELAY_SRC_API_TRANSPORT_HTTP_CLIENT_HPP

#include <chrono>
#include <string>

#include "outcome/outcome.hpp"

namespace chainrelay::api {

  struct HttpResponse {
    unsigned status = 0;
    std::string body;
  };

  /**
   * Blocking HTTP(S) client. Every call is bounded by its own timeout and
   * reports transport problems as HttpError; a non-2xx answer is returned as
   * a response so the caller can inspect the status.
   */
  class HttpClient {
   public:
    virtual ~HttpClient() = default;

    virtual outcome::result<HttpResponse> get(
        const std::string &url, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief POST with a JSON body
     */
    virtual outcome::result<HttpResponse> post(
        const std::string &url,
        const std::string &body,
        std::chrono::milliseconds timeout) = 0;
  };

}  // namespace chainrelay::api

#endif  // CHAINRELAY_SRC_API_TRANSPORT_HTTP_CLIENT_HPP
