#include "ProcessScanner.hpp"
#include "Logger.hpp"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <signal.h>
#include <unistd.h>

namespace usb_audio {

std::string ProcessEntry::program() const {
    if (arguments.empty()) {
        return {};
    }
    const std::string& first = arguments.front();
    auto slash = first.rfind('/');
    return slash == std::string::npos ? first : first.substr(slash + 1);
}

std::string ProcessEntry::commandLine() const {
    std::string line;
    for (const auto& argument : arguments) {
        if (!line.empty()) line += ' ';
        line += argument;
    }
    return line;
}

class ProcessScanner::Private {
public:
    QString procRoot;

    bool exists(long long pid) const {
        return QFileInfo(QDir(procRoot).filePath(QString::number(pid))).isDir();
    }

    bool sendSignal(long long pid, int sig) const {
        if (::kill(static_cast<pid_t>(pid), sig) == 0) {
            return true;
        }
        if (errno != ESRCH) {
            LOG_WARNING("Cannot signal process " + std::to_string(pid) + ": " + std::strerror(errno));
        }
        return false;
    }
};

ProcessScanner::ProcessScanner(const QString& procRoot)
    : d(std::make_unique<Private>()) {
    d->procRoot = procRoot;
}

ProcessScanner::~ProcessScanner() = default;

std::vector<ProcessEntry> ProcessScanner::listProcesses() const {
    std::vector<ProcessEntry> processes;
    const long long self = ::getpid();

    QDir root(d->procRoot);
    const QStringList entries = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        bool numeric = false;
        long long pid = entry.toLongLong(&numeric);
        if (!numeric || pid == self) {
            continue;
        }

        // Processes may exit between listing and reading.
        QFile cmdline(root.filePath(entry + QStringLiteral("/cmdline")));
        if (!cmdline.open(QIODevice::ReadOnly)) {
            continue;
        }
        auto arguments = parseCommandLine(cmdline.readAll());
        if (arguments.empty()) {
            continue;
        }
        processes.push_back({pid, std::move(arguments)});
    }
    return processes;
}

std::vector<ProcessEntry> ProcessScanner::findByCommandLine(const std::string& text,
                                                            const std::string& program) const {
    std::vector<ProcessEntry> matches;
    for (auto& process : listProcesses()) {
        if (!program.empty() && process.program() != program) {
            continue;
        }
        if (process.commandLine().find(text) != std::string::npos) {
            matches.push_back(std::move(process));
        }
    }
    return matches;
}

std::vector<ProcessEntry> ProcessScanner::findByArgument(const std::string& argument,
                                                         const std::string& program) const {
    std::vector<ProcessEntry> matches;
    for (auto& process : listProcesses()) {
        if (process.program() != program) {
            continue;
        }
        const auto& arguments = process.arguments;
        if (std::find(arguments.begin() + 1, arguments.end(), argument) != arguments.end()) {
            matches.push_back(std::move(process));
        }
    }
    return matches;
}

int ProcessScanner::terminate(const std::vector<ProcessEntry>& processes, int timeoutMs) const {
    std::vector<long long> signalled;
    for (const auto& process : processes) {
        if (d->sendSignal(process.pid, SIGTERM)) {
            LOG_INFO("Terminating process " + std::to_string(process.pid) + ": " +
                     process.commandLine());
            signalled.push_back(process.pid);
        }
    }

    QElapsedTimer timer;
    timer.start();
    auto anyAlive = [&]() {
        for (long long pid : signalled) {
            if (d->exists(pid)) return true;
        }
        return false;
    };
    while (anyAlive() && timer.elapsed() < timeoutMs) {
        QThread::msleep(50);
    }

    for (long long pid : signalled) {
        if (d->exists(pid) && d->sendSignal(pid, SIGKILL)) {
            LOG_WARNING("Process " + std::to_string(pid) + " ignored SIGTERM, killed");
        }
    }
    return static_cast<int>(signalled.size());
}

std::vector<std::string> ProcessScanner::parseCommandLine(const QByteArray& raw) {
    std::vector<std::string> arguments;
    const QList<QByteArray> parts = raw.split('\0');
    for (const QByteArray& part : parts) {
        if (!part.isEmpty()) {
            arguments.push_back(part.toStdString());
        }
    }
    return arguments;
}

}
