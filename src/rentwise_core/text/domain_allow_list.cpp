#include "rentwise_core/text/domain_allow_list.hpp"

#include <algorithm>
#include <cctype>

namespace rentwise_core {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool ends_with(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

const std::vector<std::string> &default_allowed_domains() {
  static const std::vector<std::string> domains = {"gov.sg", "hdb.gov.sg", "cea.gov.sg",
                                                   "ura.gov.sg"};
  return domains;
}

std::string extract_host(const std::string &url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return "";
  }

  std::string authority = url.substr(scheme_end + 3);
  const auto authority_end = authority.find_first_of("/\\?#");
  if (authority_end != std::string::npos) {
    authority.resize(authority_end);
  }

  const auto at = authority.rfind('@');
  if (at != std::string::npos) {
    authority.erase(0, at + 1);
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    authority.resize(colon);
  }

  // A trailing dot names the same host
  if (!authority.empty() && authority.back() == '.') {
    authority.pop_back();
  }
  return to_lower(authority);
}

bool check_domain_allowed(const std::string &url, const std::vector<std::string> &allowed_domains) {
  const std::string host = extract_host(url);
  if (host.empty()) {
    return false;
  }

  for (const auto &domain : allowed_domains) {
    const std::string allowed = to_lower(domain);
    if (allowed.empty()) {
      continue;
    }
    if (host == allowed || ends_with(host, "." + allowed)) {
      return true;
    }
  }
  return false;
}

}  // namespace rentwise_core
