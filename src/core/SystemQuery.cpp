#include "SystemQuery.hpp"
#include "Logger.hpp"
#include <QProcess>

namespace usb_audio {

QString ProcessSystemQuery::run(const QString& program, const QStringList& arguments) const {
    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(program, arguments);

    if (!process.waitForStarted()) {
        LOG_DEBUG("Could not start " + program.toStdString() + ": " +
                  process.errorString().toStdString());
        return {};
    }
    if (!process.waitForFinished()) {
        LOG_DEBUG(program.toStdString() + " did not finish");
        process.kill();
        process.waitForFinished();
        return {};
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        LOG_DEBUG(program.toStdString() + " " + arguments.join(' ').toStdString() +
                  " exited with code " + std::to_string(process.exitCode()));
        return {};
    }

    return QString::fromLocal8Bit(process.readAllStandardOutput());
}

bool ProcessSystemQuery::execute(const QString& program, const QStringList& arguments) const {
    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted() || !process.waitForFinished()) {
        LOG_ERROR("Failed to run " + program.toStdString() + ": " +
                  process.errorString().toStdString());
        return false;
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        QString stderrText = QString::fromLocal8Bit(process.readAllStandardError()).trimmed();
        LOG_ERROR(program.toStdString() + " " + arguments.join(' ').toStdString() +
                  " failed: " + stderrText.toStdString());
        return false;
    }
    return true;
}

}
