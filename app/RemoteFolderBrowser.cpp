#include "RemoteFolderBrowser.hpp"
#include <algorithm>
#include <vector>

std::string RemoteFolderBrowser::parentPath(const std::string& path) {
    if (path.empty() || path == "/") return "/";
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    const auto slash = p.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::optional<std::string> RemoteFolderBrowser::choose(const std::string& start) {
    std::string current = start.empty() ? "/" : start;
    std::vector<std::string> dirs;
    bool relist = true;
    for (;;) {
        if (relist) {
            std::string err;
            std::vector<std::string> fresh;
            if (!client_.listSubdirectories(current, fresh, err)) {
                out_ << "Cannot list " << QString::fromStdString(current) << ": " << QString::fromStdString(err)
                     << Qt::endl;
                if (current == "/") return std::nullopt;
                current = parentPath(current);
                continue;
            }
            dirs = std::move(fresh);
            std::sort(dirs.begin(), dirs.end());
            relist = false;
        }

        out_ << Qt::endl << "Remote folder: " << QString::fromStdString(current) << Qt::endl;
        for (std::size_t i = 0; i < dirs.size(); ++i) {
            out_ << "  [" << (i + 1) << "] " << QString::fromStdString(dirs[i]) << Qt::endl;
        }
        if (dirs.empty()) out_ << "  (no subfolders)" << Qt::endl;
        out_ << "Number to enter, '..' to go up, 's' to select this folder, 'q' to cancel: " << Qt::flush;

        const QString line = in_.readLine();
        if (line.isNull()) return std::nullopt;
        const QString cmd = line.trimmed();
        if (cmd == "q") return std::nullopt;
        if (cmd == "s") return current;
        if (cmd == "..") {
            current = parentPath(current);
            relist = true;
            continue;
        }
        bool ok = false;
        const int idx = cmd.toInt(&ok);
        if (ok && idx >= 1 && idx <= (int)dirs.size()) {
            current = mirrorsync::joinRemote(current, dirs[(std::size_t)idx - 1]);
            relist = true;
        } else {
            out_ << "Invalid choice" << Qt::endl;
        }
    }
}
