#include "CommandLine.hpp"
#include "ProfileStore.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>

using namespace mirrorsync;

static bool parseProtocol(const QString& v, TransportKind& out) {
    const QString s = v.toLower();
    if (s == "sftp") out = TransportKind::Sftp;
    else if (s == "ftp") out = TransportKind::Ftp;
    else return false;
    return true;
}

static bool parseDirection(const QString& v, Direction& out) {
    const QString s = v.toLower();
    if (s == "remote" || s == "remote-to-local") out = Direction::RemoteToLocal;
    else if (s == "local" || s == "local-to-remote") out = Direction::LocalToRemote;
    else return false;
    return true;
}

static bool parsePolicy(const QString& v, KnownHostsPolicy& out) {
    const QString s = v.toLower();
    if (s == "strict") out = KnownHostsPolicy::Strict;
    else if (s == "accept-new") out = KnownHostsPolicy::AcceptNew;
    else if (s == "off") out = KnownHostsPolicy::Off;
    else return false;
    return true;
}

bool parseCommandLine(const QStringList& args,
                      const ProfileStore* profiles,
                      SyncConfig& cfg,
                      CliRequest& req,
                      QString& err) {
    QCommandLineParser p;
    p.setApplicationDescription("Keep a local folder and a remote SFTP/FTP folder mirrored in one direction.");
    const QCommandLineOption helpOpt = p.addHelpOption();
    const QCommandLineOption versionOpt = p.addVersionOption();

    QCommandLineOption protocolOpt("protocol", "Transport: sftp or ftp (default sftp).", "sftp|ftp");
    QCommandLineOption hostOpt("host", "Server host name.", "host");
    QCommandLineOption portOpt("port", "Server port (default 22 for SFTP, 21 for FTP).", "port");
    QCommandLineOption userOpt("user", "User name.", "user");
    QCommandLineOption keyOpt("key", "Private key file (SFTP only).", "path");
    QCommandLineOption khOpt("known-hosts", "known_hosts file (default ~/.ssh/known_hosts).", "path");
    QCommandLineOption khPolicyOpt("kh-policy", "Host key policy: strict, accept-new or off.", "policy");
    QCommandLineOption remoteOpt("remote", "Remote folder.", "path");
    QCommandLineOption localOpt("local", "Local folder (created if missing).", "path");
    QCommandLineOption intervalOpt("interval",
                                   "Base check interval in seconds (presets: 60, 300, 1200, 3600; default 60).",
                                   "seconds");
    QCommandLineOption directionOpt("direction", "Authoritative side: remote or local (default remote).",
                                    "remote|local");
    QCommandLineOption profileOpt("profile", "Load a saved profile.", "name");
    QCommandLineOption saveOpt("save-profile", "Save the resulting configuration as a profile.", "name");
    QCommandLineOption browseOpt("browse", "Choose the remote folder interactively.");
    QCommandLineOption listOpt("list-profiles", "List saved profiles and exit.");
    p.addOptions({protocolOpt, hostOpt, portOpt, userOpt, keyOpt, khOpt, khPolicyOpt, remoteOpt, localOpt,
                  intervalOpt, directionOpt, profileOpt, saveOpt, browseOpt, listOpt});

    if (!p.parse(args)) {
        err = p.errorText();
        return false;
    }
    req.helpText = p.helpText();
    req.showHelp = p.isSet(helpOpt);
    req.showVersion = p.isSet(versionOpt);
    req.listProfiles = p.isSet(listOpt);
    req.browse = p.isSet(browseOpt);
    req.saveProfile = p.value(saveOpt);
    if (!p.positionalArguments().isEmpty()) {
        err = QString("Unexpected argument: %1").arg(p.positionalArguments().first());
        return false;
    }

    if (p.isSet(profileOpt)) {
        req.profile = p.value(profileOpt);
        std::optional<Profile> prof;
        if (profiles) prof = profiles->find(req.profile);
        if (!prof) {
            err = QString("Unknown profile: %1").arg(req.profile);
            return false;
        }
        cfg = prof->cfg;
    }

    if (p.isSet(protocolOpt)) {
        const bool portFollows = cfg.session.port == defaultPort(cfg.transport);
        if (!parseProtocol(p.value(protocolOpt), cfg.transport)) {
            err = QString("Invalid protocol: %1").arg(p.value(protocolOpt));
            return false;
        }
        if (portFollows) cfg.session.port = defaultPort(cfg.transport);
    }
    if (p.isSet(portOpt)) {
        bool ok = false;
        const uint port = p.value(portOpt).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            err = QString("Invalid port: %1").arg(p.value(portOpt));
            return false;
        }
        cfg.session.port = (std::uint16_t)port;
    }
    if (p.isSet(hostOpt)) cfg.session.host = p.value(hostOpt).toStdString();
    if (p.isSet(userOpt)) cfg.session.username = p.value(userOpt).toStdString();
    if (p.isSet(keyOpt)) cfg.session.private_key_path = QDir::cleanPath(p.value(keyOpt)).toStdString();
    if (p.isSet(khOpt)) cfg.session.known_hosts_path = p.value(khOpt).toStdString();
    if (p.isSet(khPolicyOpt) && !parsePolicy(p.value(khPolicyOpt), cfg.session.known_hosts_policy)) {
        err = QString("Invalid known_hosts policy: %1").arg(p.value(khPolicyOpt));
        return false;
    }
    if (p.isSet(remoteOpt)) cfg.remoteRoot = p.value(remoteOpt).toStdString();
    if (p.isSet(localOpt)) cfg.localRoot = QDir(p.value(localOpt)).absolutePath().toStdString();
    if (p.isSet(intervalOpt)) {
        bool ok = false;
        const int secs = p.value(intervalOpt).toInt(&ok);
        if (!ok || secs <= 0) {
            err = QString("Invalid interval: %1").arg(p.value(intervalOpt));
            return false;
        }
        cfg.baseIntervalSec = secs;
    }
    if (p.isSet(directionOpt) && !parseDirection(p.value(directionOpt), cfg.direction)) {
        err = QString("Invalid direction: %1").arg(p.value(directionOpt));
        return false;
    }
    return true;
}
