#include "chunkingest/identity.hpp"
#include <boost/algorithm/string.hpp>

namespace chunkingest {

TokenTable::TokenTable(std::map<std::string, std::string> tokens,
                       std::set<std::string> admin_tokens)
    : tokens_(std::move(tokens)), admin_tokens_(std::move(admin_tokens)) {}

std::optional<std::string> TokenTable::resolve(const std::string &token) const {
  if (token.empty())
    return std::nullopt;
  auto it = tokens_.find(token);
  if (it == tokens_.end())
    return std::nullopt;
  return it->second;
}

bool TokenTable::is_admin(const std::string &token) const {
  return !token.empty() && admin_tokens_.count(token) > 0;
}

std::string bearer_token(const std::string &authorization) {
  const std::string scheme = "bearer ";
  if (authorization.size() <= scheme.size() ||
      !boost::algorithm::istarts_with(authorization, scheme))
    return {};
  return boost::algorithm::trim_copy(authorization.substr(scheme.size()));
}

} // namespace chunkingest
