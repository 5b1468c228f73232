#pragma once

#include <string>
#include <vector>

namespace rentwise_core {

const std::vector<std::string> &default_allowed_domains();

// Lowercased host of an absolute http(s) URL without userinfo or port.
// Empty if the URL has no host.
std::string extract_host(const std::string &url);

// True when the URL's host equals an allowed domain or is a subdomain of one
bool check_domain_allowed(const std::string &url,
                          const std::vector<std::string> &allowed_domains = default_allowed_domains());

}  // namespace rentwise_core
