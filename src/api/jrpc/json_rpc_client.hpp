#ifndef CHAINRELAY_API_JRPC_JSON_RPC_CLIENT_HPP
#define CHAINRELAY_API_JRPC_JSON_RPC_CLIENT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <jsonrpc-lean/client.h>
#include <jsonrpc-lean/jsonformathandler.h>

#include "api/transport/http_client.hpp"
#include "base/logger.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::api {

  enum class JsonRpcError {
    TRANSPORT_FAILED = 1,  // http request could not be completed
    HTTP_STATUS,           // endpoint answered with a non-2xx status
    MALFORMED_RESPONSE,    // body is not a json-rpc 2.0 response
    NODE_ERROR,            // node answered with an error object
  };

  /**
   * Error object returned by the node for the last failed call
   */
  struct RpcFault {
    std::string method;
    std::string message;
  };

  /**
   * @brief JSON-RPC 2.0 client over HTTP POST. Request ids are sequenced by
   * the underlying jsonrpc::Client. Not thread safe: one instance serves one
   * worker.
   */
  class JsonRpcClient {
   public:
    JsonRpcClient(std::shared_ptr<HttpClient> http,
                  std::string url,
                  std::chrono::milliseconds timeout);

    /**
     * @brief Performs one call
     * @param method rpc method name, e.g. "eth_blockNumber"
     * @param params positional parameters
     * @return the "result" member of the response
     */
    outcome::result<jsonrpc::Value> call(
        const std::string &method, const jsonrpc::Request::Parameters &params);

    /// Error object of the most recent NODE_ERROR, cleared on success
    const std::optional<RpcFault> &lastFault() const {
      return last_fault_;
    }

    const std::string &url() const {
      return url_;
    }

   private:
    std::shared_ptr<HttpClient> http_;
    std::string url_;
    std::chrono::milliseconds timeout_;
    jsonrpc::JsonFormatHandler format_handler_{};
    jsonrpc::Client client_;
    std::optional<RpcFault> last_fault_;
    base::Logger logger_ = base::createLogger("JsonRpcClient");
  };

}  // namespace chainrelay::api

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::api, JsonRpcError)

#endif  // CHAINRELAY_API_JRPC_JSON_RPC_CLIENT_HPP
