#include "api/jrpc/json_rpc_client.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::api, JsonRpcError, e) {
  using chainrelay::api::JsonRpcError;
  switch (e) {
    case JsonRpcError::TRANSPORT_FAILED:
      return "json-rpc request could not be delivered";
    case JsonRpcError::HTTP_STATUS:
      return "json-rpc endpoint answered with a non-2xx status";
    case JsonRpcError::MALFORMED_RESPONSE:
      return "json-rpc response is malformed";
    case JsonRpcError::NODE_ERROR:
      return "node returned a json-rpc error";
  }
  return "unknown json-rpc error";
}

namespace chainrelay::api {

  JsonRpcClient::JsonRpcClient(std::shared_ptr<HttpClient> http,
                               std::string url,
                               std::chrono::milliseconds timeout)
      : http_(std::move(http)),
        url_(std::move(url)),
        timeout_(timeout),
        client_(format_handler_) {}

  outcome::result<jsonrpc::Value> JsonRpcClient::call(
      const std::string &method, const jsonrpc::Request::Parameters &params) {
    auto request = client_.BuildRequestData(method, params);
    std::string body(request->GetData(), request->GetSize());

    auto response = http_->post(url_, body, timeout_);
    if (!response) {
      logger_->debug("{} to {} failed: {}",
                     method,
                     url_,
                     response.error().message());
      return JsonRpcError::TRANSPORT_FAILED;
    }
    if (response.value().status < 200 || response.value().status >= 300) {
      logger_->debug(
          "{} to {} got HTTP {}", method, url_, response.value().status);
      return JsonRpcError::HTTP_STATUS;
    }

    try {
      auto parsed = client_.ParseResponse(response.value().body);
      if (parsed.IsFault()) {
        last_fault_ = RpcFault{method, "unspecified node error"};
        try {
          parsed.ThrowIfFault();
        } catch (const jsonrpc::Fault &fault) {
          last_fault_ = RpcFault{method, fault.what()};
          logger_->debug("{} returned error: {}", method, fault.what());
        }
        return JsonRpcError::NODE_ERROR;
      }
      last_fault_.reset();
      return parsed.GetResult();
    } catch (const std::exception &e) {
      logger_->debug("{} response is malformed: {}", method, e.what());
      return JsonRpcError::MALFORMED_RESPONSE;
    }
  }

}  // namespace chainrelay::api
