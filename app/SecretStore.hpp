// Secret storage for profile passwords and key passphrases.
#pragma once
#include <QString>
#include <optional>

// Minimal secret store abstraction.
// Current implementation: fallback with QSettings (not secure), only active when
// MIRRORSYNC_ENABLE_INSECURE_FALLBACK=1. Designed to be replaceable by Secret Service.
class SecretStore {
public:
    // Store a secret under a logical key (e.g. "profile:Name:password").
    void setSecret(const QString& key, const QString& value);

    // Retrieve a secret if present.
    std::optional<QString> getSecret(const QString& key) const;

    void removeSecret(const QString& key);

    // Whether the insecure fallback is active. Always false in secure-only builds.
    static bool insecureFallbackActive();

    static QString passwordKey(const QString& profile) { return QString("profile:%1:password").arg(profile); }
    static QString keyPassKey(const QString& profile) { return QString("profile:%1:keyPass").arg(profile); }
};
