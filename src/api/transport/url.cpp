#include "api/transport/url.hpp"

#include <regex>

#include <boost/algorithm/string/predicate.hpp>

#include "api/transport/error.hpp"

namespace chainrelay::api {

  outcome::result<Url> parseUrl(const std::string &url) {
    static const std::regex url_regex(
        R"(^(http|https)://([^/:?#]+)(?::(\d{1,5}))?([/?].*)?$)",
        std::regex::icase);
    std::smatch matches;

    if (!std::regex_match(url, matches, url_regex)) {
      return HttpError::INVALID_URL;
    }

    Url parsed;
    parsed.secure = boost::algorithm::iequals(matches[1].str(), "https");
    parsed.host = matches[2];
    if (matches[3].matched) {
      parsed.port = matches[3];
    } else {
      parsed.port = parsed.secure ? "443" : "80";
    }
    parsed.target = matches[4].matched ? std::string(matches[4]) : "/";
    if (parsed.target.front() == '?') {
      parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
  }

}  // namespace chainrelay::api
