#pragma once

#include <libsecret/secret.h>

#include <optional>
#include <string>

// Where the Todoist API token survives a restart.
class TokenStore {
  public:
    virtual ~TokenStore() = default;

    virtual bool SaveToken(const std::string &token) = 0;
    virtual std::optional<std::string> LoadToken() = 0;
    virtual bool ClearToken() = 0;
};

// Token kept in the desktop keyring under service "todoist", account "api_token".
class KeyringTokenStore : public TokenStore {
  public:
    KeyringTokenStore();

    bool SaveToken(const std::string &token) override;
    std::optional<std::string> LoadToken() override;
    bool ClearToken() override;

  private:
    bool Failed(GError *&error, const char *action);

    SecretSchema m_Schema;
};
