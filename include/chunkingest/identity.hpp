#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>

namespace chunkingest {

// Внешний сервис идентификации: bearer-токен → издатель.
// Выдача токенов и пароли — не наша зона.
class IdentityResolver {
public:
  virtual ~IdentityResolver() = default;

  virtual std::optional<std::string> resolve(const std::string &token) const = 0;
  virtual bool is_admin(const std::string &token) const = 0;
};

// Статическая таблица токенов из конфига
class TokenTable : public IdentityResolver {
public:
  TokenTable(std::map<std::string, std::string> tokens,
             std::set<std::string> admin_tokens);

  std::optional<std::string> resolve(const std::string &token) const override;
  bool is_admin(const std::string &token) const override;

private:
  std::map<std::string, std::string> tokens_;
  std::set<std::string> admin_tokens_;
};

// "Bearer abc" → "abc"; пусто, если схема другая
std::string bearer_token(const std::string &authorization);

} // namespace chunkingest
