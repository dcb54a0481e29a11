// Console navigation over remote subdirectories to pick the remote root.
#pragma once
#include <QTextStream>
#include <optional>
#include <string>
#include "mirrorsync/TransportClient.hpp"

class RemoteFolderBrowser {
public:
    RemoteFolderBrowser(mirrorsync::TransportClient& client, QTextStream& in, QTextStream& out)
        : client_(client), in_(in), out_(out) {}

    // Interactive loop starting at `start`. Returns the chosen path, or nullopt
    // when the user cancels or input ends. Listing errors are shown and the
    // user stays in the previous folder.
    std::optional<std::string> choose(const std::string& start);

    static std::string parentPath(const std::string& path);

private:
    mirrorsync::TransportClient& client_;
    QTextStream& in_;
    QTextStream& out_;
};
