// Command line -> SyncConfig. Explicit options override the values of --profile.
#pragma once
#include <QString>
#include <QStringList>
#include "mirrorsync/SyncTypes.hpp"

class ProfileStore;

struct CliRequest {
    QString profile;      // --profile: start from a saved profile
    QString saveProfile;  // --save-profile: store the resulting config under this name
    bool browse = false;  // pick the remote folder interactively before starting
    bool listProfiles = false;
    bool showHelp = false;
    bool showVersion = false;
    QString helpText;
};

// Fill cfg and req from args (args[0] is the program name). profiles may be null.
// Returns false with a message on unknown options or invalid values.
bool parseCommandLine(const QStringList& args,
                      const ProfileStore* profiles,
                      mirrorsync::SyncConfig& cfg,
                      CliRequest& req,
                      QString& err);
