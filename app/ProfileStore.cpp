#include "ProfileStore.hpp"
#include <QSettings>
#include <algorithm>

using mirrorsync::Direction;
using mirrorsync::KnownHostsPolicy;
using mirrorsync::TransportKind;

QVector<Profile> ProfileStore::load() const {
    QVector<Profile> out;
    QSettings s(org_, app_);
    int n = s.beginReadArray("profiles");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        Profile p;
        p.name = s.value("name").toString();
        auto& cfg = p.cfg;
        cfg.transport = s.value("protocol", "sftp").toString() == "ftp" ? TransportKind::Ftp : TransportKind::Sftp;
        cfg.session.host = s.value("host").toString().toStdString();
        cfg.session.port = (std::uint16_t)s.value("port", (int)mirrorsync::defaultPort(cfg.transport)).toUInt();
        cfg.session.username = s.value("user").toString().toStdString();
        // Password and passphrase come from SecretStore when connecting
        const QString kp = s.value("keyPath").toString();
        if (!kp.isEmpty()) cfg.session.private_key_path = kp.toStdString();
        const QString kh = s.value("knownHosts").toString();
        if (!kh.isEmpty()) cfg.session.known_hosts_path = kh.toStdString();
        cfg.session.known_hosts_policy = (KnownHostsPolicy)s.value("khPolicy", (int)KnownHostsPolicy::Strict).toInt();
        cfg.remoteRoot = s.value("remote").toString().toStdString();
        cfg.localRoot = s.value("local").toString().toStdString();
        cfg.baseIntervalSec = s.value("interval", 60).toInt();
        cfg.direction = s.value("direction", "remote").toString() == "local" ? Direction::LocalToRemote
                                                                            : Direction::RemoteToLocal;
        out.push_back(p);
    }
    s.endArray();
    return out;
}

std::optional<Profile> ProfileStore::find(const QString& name) const {
    for (const auto& p : load()) {
        if (p.name == name) return p;
    }
    return std::nullopt;
}

void ProfileStore::save(const Profile& profile) {
    QVector<Profile> all = load();
    bool replaced = false;
    for (auto& p : all) {
        if (p.name == profile.name) {
            p = profile;
            replaced = true;
            break;
        }
    }
    if (!replaced) all.push_back(profile);
    saveAll(all);
}

bool ProfileStore::remove(const QString& name) {
    QVector<Profile> all = load();
    const int before = all.size();
    all.erase(std::remove_if(all.begin(), all.end(), [&](const Profile& p) { return p.name == name; }), all.end());
    if (all.size() == before) return false;
    saveAll(all);
    return true;
}

void ProfileStore::saveAll(const QVector<Profile>& profiles) {
    QSettings s(org_, app_);
    // Clear previous array to avoid stale entries after deletions
    s.remove("profiles");
    s.beginWriteArray("profiles");
    for (int i = 0; i < profiles.size(); ++i) {
        s.setArrayIndex(i);
        const auto& p = profiles[i];
        const auto& cfg = p.cfg;
        s.setValue("name", p.name);
        s.setValue("protocol", cfg.transport == TransportKind::Ftp ? "ftp" : "sftp");
        s.setValue("host", QString::fromStdString(cfg.session.host));
        s.setValue("port", (int)cfg.session.port);
        s.setValue("user", QString::fromStdString(cfg.session.username));
        s.setValue("keyPath", cfg.session.private_key_path ? QString::fromStdString(*cfg.session.private_key_path) : QString());
        s.setValue("knownHosts", cfg.session.known_hosts_path ? QString::fromStdString(*cfg.session.known_hosts_path) : QString());
        s.setValue("khPolicy", (int)cfg.session.known_hosts_policy);
        s.setValue("remote", QString::fromStdString(cfg.remoteRoot));
        s.setValue("local", QString::fromStdString(cfg.localRoot));
        s.setValue("interval", cfg.baseIntervalSec);
        s.setValue("direction", cfg.direction == Direction::LocalToRemote ? "local" : "remote");
    }
    s.endArray();
    s.sync();
}
