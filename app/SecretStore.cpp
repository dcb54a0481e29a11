// SecretStore implementation: optional fallback with QSettings.
#include "SecretStore.hpp"
#include <QSettings>
#include <QVariant>
#include <cstdlib>

static bool fallbackEnabledEnv() {
    const char* v = std::getenv("MIRRORSYNC_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
}

void SecretStore::setSecret(const QString& key, const QString& value) {
#ifdef MIRRORSYNC_BUILD_SECURE_ONLY
    Q_UNUSED(key); Q_UNUSED(value);
    return; // disabled by secure build
#else
    if (!fallbackEnabledEnv()) return;
    QSettings s("MirrorSync", "Secrets");
    s.setValue(key, value);
#endif
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
#ifdef MIRRORSYNC_BUILD_SECURE_ONLY
    Q_UNUSED(key);
    return std::nullopt;
#else
    if (!fallbackEnabledEnv()) return std::nullopt;
    QSettings s("MirrorSync", "Secrets");
    QVariant v = s.value(key);
    if (!v.isValid()) return std::nullopt;
    return v.toString();
#endif
}

void SecretStore::removeSecret(const QString& key) {
#ifdef MIRRORSYNC_BUILD_SECURE_ONLY
    Q_UNUSED(key);
    return;
#else
    if (!fallbackEnabledEnv()) return;
    QSettings s("MirrorSync", "Secrets");
    s.remove(key);
#endif
}

bool SecretStore::insecureFallbackActive() {
#ifdef MIRRORSYNC_BUILD_SECURE_ONLY
    return false;
#else
    return fallbackEnabledEnv();
#endif
}
