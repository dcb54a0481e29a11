// Saved sync profiles (connection + folders + interval + direction) in QSettings.
// Secrets are never written here, see SecretStore.
#pragma once
#include <QString>
#include <QVector>
#include <optional>
#include "mirrorsync/SyncTypes.hpp"

struct Profile {
    QString name;
    mirrorsync::SyncConfig cfg;
};

class ProfileStore {
public:
    ProfileStore(QString organization = "MirrorSync", QString application = "MirrorSync")
        : org_(std::move(organization)), app_(std::move(application)) {}

    QVector<Profile> load() const;
    std::optional<Profile> find(const QString& name) const;
    // Insert or replace by name.
    void save(const Profile& profile);
    bool remove(const QString& name);

private:
    QString org_;
    QString app_;

    void saveAll(const QVector<Profile>& profiles);
};
