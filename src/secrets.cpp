#include "secrets.hpp"

#include <spdlog/spdlog.h>

namespace {
constexpr const char *kService = "todoist";
constexpr const char *kAccount = "api_token";
constexpr const char *kLabel = "taskagent: Todoist API token";
} // namespace

// ─────────────────────────────────────
KeyringTokenStore::KeyringTokenStore()
    : m_Schema{"io.taskagent.TodoistToken",
               SECRET_SCHEMA_NONE,
               {{"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {"account", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {nullptr, static_cast<SecretSchemaAttributeType>(0)}}} {}

// ─────────────────────────────────────
bool KeyringTokenStore::Failed(GError *&error, const char *action) {
    if (!error) {
        return false;
    }
    spdlog::error("Keyring: could not {} the Todoist token: {}", action, error->message);
    g_clear_error(&error);
    return true;
}

// ─────────────────────────────────────
bool KeyringTokenStore::SaveToken(const std::string &token) {
    if (token.empty()) {
        return ClearToken();
    }

    GError *error = nullptr;
    const gboolean stored =
        secret_password_store_sync(&m_Schema, SECRET_COLLECTION_DEFAULT, kLabel, token.c_str(),
                                   nullptr, &error, "service", kService, "account", kAccount,
                                   nullptr);
    if (Failed(error, "store")) {
        return false;
    }
    spdlog::debug("Keyring: Todoist token stored");
    return stored == TRUE;
}

// ─────────────────────────────────────
std::optional<std::string> KeyringTokenStore::LoadToken() {
    GError *error = nullptr;
    gchar *raw = secret_password_lookup_sync(&m_Schema, nullptr, &error, "service", kService,
                                             "account", kAccount, nullptr);
    if (Failed(error, "look up")) {
        return std::nullopt;
    }
    if (!raw) {
        return std::nullopt;
    }

    std::string token(raw);
    secret_password_free(raw);
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

// ─────────────────────────────────────
bool KeyringTokenStore::ClearToken() {
    GError *error = nullptr;
    const gboolean removed = secret_password_clear_sync(&m_Schema, nullptr, &error, "service",
                                                        kService, "account", kAccount, nullptr);
    if (Failed(error, "clear")) {
        return false;
    }
    spdlog::debug("Keyring: Todoist token {}", removed ? "removed" : "was not stored");
    return true;
}
