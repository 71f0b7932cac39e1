#ifndef CHAINRELAY_SRC_API_TRANSPORT_IMPL_HTTP_BEAST_HTTP_CLIENT_HPP
#define CHAINRELAY_SRC_API_TRANSPORT_IMPL_HTTP_BEAST_HTTP_CLIENT_HPP

#include <boost/beast/http/verb.hpp>

#include "api/transport/http_client.hpp"
#include "api/transport/url.hpp"
#include "base/logger.hpp"

namespace chainrelay::api {

  /**
   * HttpClient over Boost.Beast. Each request opens its own connection on a
   * private io_context, so concurrent callers never share socket state.
   */
  class BeastHttpClient : public HttpClient {
   public:
    outcome::result<HttpResponse> get(
        const std::string &url, std::chrono::milliseconds timeout) override;

    outcome::result<HttpResponse> post(
        const std::string &url,
        const std::string &body,
        std::chrono::milliseconds timeout) override;

   private:
    outcome::result<HttpResponse> request(boost::beast::http::verb verb,
                                          const std::string &url,
                                          const std::string &body,
                                          std::chrono::milliseconds timeout);

    base::Logger logger_ = base::createLogger("HttpClient");
  };

}  // namespace chainrelay::api

#endif  // CHAINRELAY_SRC_API_TRANSPORT_IMPL_HTTP_BEAST_HTTP_CLIENT_HPP
