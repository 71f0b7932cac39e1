#ifndef CHAINRELAY_TEST_TESTUTIL_SCRIPTED_NODE_HPP
#define CHAINRELAY_TEST_TESTUTIL_SCRIPTED_NODE_HPP

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "api/transport/error.hpp"
#include "mock/src/api/http_client_mock.hpp"

namespace testutil {

  /**
   * Answers JSON-RPC posts made through an HttpClientMock from a per-method
   * script. A queued answer is used once; the last answer of a method
   * repeats. Unknown methods get a "method not found" error.
   */
  class ScriptedNode {
   public:
    explicit ScriptedNode(
        std::shared_ptr<chainrelay::api::HttpClientMock> http)
        : http_(std::move(http)) {
      ON_CALL(*http_, post(::testing::_, ::testing::_, ::testing::_))
          .WillByDefault(::testing::Invoke(
              [this](const std::string &,
                     const std::string &body,
                     std::chrono::milliseconds) { return answer(body); }));
    }

    /// result is raw JSON, e.g. "\"0x5\"" or "{...}"
    void result(const std::string &method, const std::string &json) {
      push(method, Answer{false, R"({"jsonrpc":"2.0","id":0,"result":)" + json + "}"});
    }

    void error(const std::string &method, const std::string &message) {
      push(method,
           Answer{false,
                  R"({"jsonrpc":"2.0","id":0,"error":{"code":-32000,"message":")"
                      + message + "\"}}"});
    }

    /// the request never reaches the node
    void unreachable(const std::string &method) {
      push(method, Answer{true, {}});
    }

    /// forgets the scripted answers of a method
    void clear(const std::string &method) {
      std::lock_guard<std::mutex> lock(mutex_);
      script_.erase(method);
    }

    size_t calls(const std::string &method) const {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = calls_.find(method);
      return it == calls_.end() ? 0 : it->second;
    }

    /// bodies of every request of a method, in order
    std::vector<std::string> requests(const std::string &method) const {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = requests_.find(method);
      return it == requests_.end() ? std::vector<std::string>{} : it->second;
    }

   private:
    struct Answer {
      bool unreachable;
      std::string body;
    };

    void push(const std::string &method, Answer answer) {
      std::lock_guard<std::mutex> lock(mutex_);
      script_[method].push_back(std::move(answer));
    }

    static std::string methodOf(const std::string &body) {
      static const std::string kKey = "\"method\":\"";
      auto begin = body.find(kKey);
      if (begin == std::string::npos) {
        return {};
      }
      begin += kKey.size();
      return body.substr(begin, body.find('"', begin) - begin);
    }

    outcome::result<chainrelay::api::HttpResponse> answer(
        const std::string &body) {
      std::lock_guard<std::mutex> lock(mutex_);
      auto method = methodOf(body);
      ++calls_[method];
      requests_[method].push_back(body);

      auto it = script_.find(method);
      if (it == script_.end() || it->second.empty()) {
        return chainrelay::api::HttpResponse{
            200,
            R"({"jsonrpc":"2.0","id":0,"error":{"code":-32601,"message":"method not found"}})"};
      }
      auto next = it->second.front();
      if (it->second.size() > 1) {
        it->second.pop_front();
      }
      if (next.unreachable) {
        return chainrelay::api::HttpError::CONNECT_FAILED;
      }
      return chainrelay::api::HttpResponse{200, next.body};
    }

    std::shared_ptr<chainrelay::api::HttpClientMock> http_;
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Answer>> script_;
    std::map<std::string, size_t> calls_;
    std::map<std::string, std::vector<std::string>> requests_;
  };

}  // namespace testutil

#endif  // CHAINRELAY_TEST_TESTUTIL_SCRIPTED_NODE_HPP
