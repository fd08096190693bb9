#include "StreamLauncher.hpp"
#include "Logger.hpp"
#include "../utils/ConfigManager.hpp"
#include <usb-audio/Constants.hpp>
#include <QProcess>

namespace usb_audio {

namespace {

class ProcessStreamHandle : public StreamHandle {
public:
    explicit ProcessStreamHandle(std::unique_ptr<QProcess> process)
        : m_process(std::move(process)) {}

    ~ProcessStreamHandle() override {
        if (m_process->state() != QProcess::NotRunning) {
            m_process->kill();
            m_process->waitForFinished(1000);
        }
    }

    long long pid() const override { return m_process->processId(); }
    bool isAlive() const override { return m_process->state() != QProcess::NotRunning; }
    void terminate() override { m_process->terminate(); }
    void kill() override { m_process->kill(); }

    bool waitForExit(int timeoutMs) override {
        if (m_process->state() == QProcess::NotRunning) {
            return true;
        }
        return m_process->waitForFinished(timeoutMs);
    }

private:
    std::unique_ptr<QProcess> m_process;
};

}

std::unique_ptr<StreamHandle> ProcessStreamLauncher::launch(const StreamCommand& command) {
    auto process = std::make_unique<QProcess>();
    // ffmpeg runs with -loglevel warning; its stderr joins ours.
    process->setProcessChannelMode(QProcess::ForwardedErrorChannel);
    process->setStandardOutputFile(QProcess::nullDevice());
    process->setStandardInputFile(QProcess::nullDevice());
    process->start(command.program, command.arguments);

    if (!process->waitForStarted(SPAWN_TIMEOUT)) {
        LOG_ERROR("Failed to start " + command.program.toStdString() + ": " +
                  process->errorString().toStdString());
        return nullptr;
    }
    return std::make_unique<ProcessStreamHandle>(std::move(process));
}

StreamCommand buildStreamCommand(const CaptureDevice& device, const StreamSettings& settings) {
    StreamCommand command;
    command.program = settings.ffmpegPath;
    command.arguments
        << QStringLiteral("-nostdin")
        << QStringLiteral("-hide_banner")
        << QStringLiteral("-loglevel") << QStringLiteral("warning")
        << QStringLiteral("-f") << QStringLiteral("alsa")
        << QStringLiteral("-ac") << QString::number(settings.inputChannels)
        << QStringLiteral("-i")
        << QStringLiteral("plughw:CARD=%1,DEV=%2")
               .arg(QString::fromStdString(device.cardId))
               .arg(device.captureDeviceIndex)
        << QStringLiteral("-acodec") << QString::fromStdString(settings.audioCodec)
        << QStringLiteral("-b:a") << QString::fromStdString(settings.audioBitrate)
        << QStringLiteral("-ac") << QString::number(settings.outputChannels)
        << QStringLiteral("-content_type") << QStringLiteral("audio/mpeg")
        << QStringLiteral("-f") << QStringLiteral("rtsp")
        << QStringLiteral("-rtsp_transport") << QString::fromStdString(settings.rtspTransport)
        << QString::fromStdString(device.endpointUrl);
    return command;
}

StreamSettings streamSettingsFor(const ConfigManager& config, const CaptureDevice& device) {
    StreamSettings settings;
    settings.ffmpegPath = QString::fromStdString(config.getString("ffmpegPath", "ffmpeg"));
    settings.rtspTransport = config.getString("rtspTransport", "tcp");

    std::string vendor = device.usb ? device.usb->vendorId : std::string();
    std::string product = device.usb ? device.usb->productId : std::string();
    settings.inputChannels = config.deviceInt(vendor, product, "inputChannels");
    settings.outputChannels = config.deviceInt(vendor, product, "outputChannels");
    settings.audioCodec = config.deviceString(vendor, product, "audioCodec");
    settings.audioBitrate = config.deviceString(vendor, product, "audioBitrate");

    if (settings.inputChannels <= 0) settings.inputChannels = 1;
    if (settings.outputChannels <= 0) settings.outputChannels = 2;
    return settings;
}

}
