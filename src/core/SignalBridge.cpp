#include "SignalBridge.hpp"
#include "Logger.hpp"
#include <QSocketNotifier>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

namespace usb_audio {

namespace {

int g_signalFd[2] = {-1, -1};

const int HANDLED_SIGNALS[] = {SIGINT, SIGTERM, SIGQUIT, SIGHUP};

void forwardSignal(int signalNumber) {
    const int savedErrno = errno;
    unsigned char value = static_cast<unsigned char>(signalNumber);
    ssize_t ignored = ::write(g_signalFd[0], &value, sizeof(value));
    (void)ignored;
    errno = savedErrno;
}

}

class SignalBridge::Private {
public:
    QSocketNotifier* notifier{nullptr};
    bool installed{false};
};

SignalBridge::SignalBridge(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
}

SignalBridge::~SignalBridge() {
    if (!d->installed) {
        return;
    }
    for (int sig : HANDLED_SIGNALS) {
        std::signal(sig, SIG_DFL);
    }
    ::close(g_signalFd[0]);
    ::close(g_signalFd[1]);
    g_signalFd[0] = g_signalFd[1] = -1;
}

bool SignalBridge::install() {
    if (d->installed) {
        return true;
    }
    if (g_signalFd[0] != -1) {
        LOG_ERROR("Another signal bridge is already installed");
        return false;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, g_signalFd) != 0) {
        LOG_ERROR(std::string("Cannot create signal socket pair: ") + std::strerror(errno));
        g_signalFd[0] = g_signalFd[1] = -1;
        return false;
    }

    d->notifier = new QSocketNotifier(g_signalFd[1], QSocketNotifier::Read, this);
    connect(d->notifier, &QSocketNotifier::activated, this, &SignalBridge::handleSignal);

    struct sigaction action {};
    action.sa_handler = forwardSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    for (int sig : HANDLED_SIGNALS) {
        if (::sigaction(sig, &action, nullptr) != 0) {
            LOG_WARNING("Cannot install handler for signal " + std::to_string(sig) + ": " +
                        std::strerror(errno));
        }
    }

    d->installed = true;
    return true;
}

void SignalBridge::handleSignal() {
    d->notifier->setEnabled(false);
    unsigned char value = 0;
    if (::read(g_signalFd[1], &value, sizeof(value)) == sizeof(value)) {
        const int signalNumber = value;
        if (signalNumber == SIGHUP) {
            LOG_INFO("Received SIGHUP, rescanning devices");
            emit reloadRequested();
        } else {
            LOG_INFO("Received signal " + std::to_string(signalNumber) + ", shutting down");
            emit terminationRequested(signalNumber);
        }
    }
    d->notifier->setEnabled(true);
}

}
