// Application entry point: build the session config, then run the sync engine
// on a worker thread until Ctrl+C.
#include <QCoreApplication>
#include <QMetaObject>
#include <QTextStream>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <pthread.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

#include "CommandLine.hpp"
#include "ProfileStore.hpp"
#include "RemoteFolderBrowser.hpp"
#include "SecretStore.hpp"
#include "mirrorsync/Log.hpp"
#include "mirrorsync/SyncEngine.hpp"

using namespace mirrorsync;

static std::string promptHidden(const char* prompt) {
    std::fprintf(stderr, "%s", prompt);
    std::fflush(stderr);
    termios oldt{};
    const bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        termios newt = oldt;
        newt.c_lflag &= ~(tcflag_t)ECHO;
        ::tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }
    std::string line;
    std::getline(std::cin, line);
    if (tty) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
        std::fprintf(stderr, "\n");
    }
    return line;
}

// Password: environment, then secret store (profiles), then prompt.
static void resolveSecrets(SyncConfig& cfg, const CliRequest& req, SecretStore& secrets) {
    auto& s = cfg.session;
    if (const char* env = std::getenv("MIRRORSYNC_PASSWORD")) {
        s.password = std::string(env);
    } else if (!req.profile.isEmpty()) {
        if (auto pw = secrets.getSecret(SecretStore::passwordKey(req.profile))) s.password = pw->toStdString();
        if (auto kp = secrets.getSecret(SecretStore::keyPassKey(req.profile)))
            s.private_key_passphrase = kp->toStdString();
    }
    if (s.private_key_path && !s.private_key_passphrase && ::isatty(STDIN_FILENO)) {
        const std::string kp = promptHidden("Key passphrase (empty for none): ");
        if (!kp.empty()) s.private_key_passphrase = kp;
    }
    if (!s.password && !s.private_key_path) {
        s.password = promptHidden(("Password for " + s.username + "@" + s.host + ": ").c_str());
    }
}

static void installHostKeyPrompt(SessionOptions& s) {
    if (!::isatty(STDIN_FILENO)) return;
    s.hostkey_confirm_cb = [](const std::string& host, std::uint16_t port, const std::string& alg,
                              const std::string& fp) {
        std::fprintf(stderr, "Unknown host key for %s:%u\n  %s %s\nTrust it and save to known_hosts? [y/N] ",
                     host.c_str(), (unsigned)port, alg.c_str(), fp.c_str());
        std::string answer;
        std::getline(std::cin, answer);
        return answer == "y" || answer == "Y" || answer == "yes";
    };
}

static bool browseRemote(SyncConfig& cfg) {
    auto client = makeTransport(cfg.transport);
    std::string err;
    if (!client->connect(cfg.session, err)) {
        std::fprintf(stderr, "Failed to connect to remote server: %s\n", err.c_str());
        return false;
    }
    QTextStream in(stdin);
    QTextStream out(stdout);
    RemoteFolderBrowser browser(*client, in, out);
    auto chosen = browser.choose(cfg.remoteRoot.empty() ? "/" : cfg.remoteRoot);
    client->disconnect();
    if (!chosen) return false;
    cfg.remoteRoot = *chosen;
    return true;
}

int main(int argc, char* argv[]) {
    // Signals are taken by a dedicated thread; block them before any other thread starts.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("MirrorSync");
    QCoreApplication::setOrganizationName("MirrorSync");
    QCoreApplication::setApplicationVersion("1.0.0");

    ProfileStore profiles;
    SyncConfig cfg;
    CliRequest req;
    QString perr;
    if (!parseCommandLine(app.arguments(), &profiles, cfg, req, perr)) {
        std::fprintf(stderr, "%s\n", qPrintable(perr));
        return 1;
    }
    if (req.showHelp) {
        std::fprintf(stdout, "%s", qPrintable(req.helpText));
        return 0;
    }
    if (req.showVersion) {
        std::fprintf(stdout, "%s %s\n", qPrintable(QCoreApplication::applicationName()),
                     qPrintable(QCoreApplication::applicationVersion()));
        return 0;
    }
    if (req.listProfiles) {
        for (const auto& p : profiles.load()) {
            std::fprintf(stdout, "%s\t%s@%s:%u\t%s -> %s\n", qPrintable(p.name), p.cfg.session.username.c_str(),
                         p.cfg.session.host.c_str(), (unsigned)p.cfg.session.port, p.cfg.remoteRoot.c_str(),
                         p.cfg.localRoot.c_str());
        }
        return 0;
    }

    SecretStore secrets;
    resolveSecrets(cfg, req, secrets);
    installHostKeyPrompt(cfg.session);

    if (req.browse && !browseRemote(cfg)) return 1;

    std::string err;
    if (!validateConfig(cfg, err)) {
        std::fprintf(stderr, "Invalid configuration: %s\n", err.c_str());
        return 1;
    }

    if (!req.saveProfile.isEmpty()) {
        profiles.save(Profile{req.saveProfile, cfg});
        if (cfg.session.password) {
            if (SecretStore::insecureFallbackActive())
                secrets.setSecret(SecretStore::passwordKey(req.saveProfile), QString::fromStdString(*cfg.session.password));
            else
                std::fprintf(stderr, "Password not saved: no secret store available\n");
        }
        std::fprintf(stdout, "Profile '%s' saved\n", qPrintable(req.saveProfile));
    }

    SessionLogReporter reporter;
    if (!reporter.open(cfg.localRoot, err)) {
        std::fprintf(stderr, "%s\n", err.c_str());
        return 1;
    }
    reporter.info("Session log: " + reporter.logPath());

    SessionContext ctx(cfg.tuning.sleepTick);
    std::atomic<bool> engineDone{false};

    std::thread signalThread([&] {
        const timespec timeout{0, 200 * 1000 * 1000};
        while (!engineDone) {
            const int sig = sigtimedwait(&sigs, nullptr, &timeout);
            if (sig == SIGINT || sig == SIGTERM) {
                reporter.info("Stop requested, finishing current operation...");
                ctx.requestStop();
                return;
            }
        }
    });

    std::thread engineThread([&] {
        SyncEngine engine(cfg, reporter, ctx);
        const int code = exitCodeFor(engine.run());
        engineDone = true;
        QMetaObject::invokeMethod(&app, [code] { QCoreApplication::exit(code); }, Qt::QueuedConnection);
    });

    const int rc = app.exec();
    engineThread.join();
    signalThread.join();
    return rc;
}
