#pragma once
#include <usb-audio/Types.hpp>
#include <QString>
#include <QStringList>
#include <memory>
#include <string>

namespace usb_audio {

class ConfigManager;

struct StreamSettings {
    QString ffmpegPath{QStringLiteral("ffmpeg")};
    int inputChannels{1};
    int outputChannels{2};
    std::string audioCodec{"libmp3lame"};
    std::string audioBitrate{"160k"};
    std::string rtspTransport{"tcp"};
};

struct StreamCommand {
    QString program;
    QStringList arguments;
};

// A spawned streaming process. Destroying a handle does not stop the process
// gracefully; callers terminate it first.
class StreamHandle {
public:
    virtual ~StreamHandle() = default;

    virtual long long pid() const = 0;
    virtual bool isAlive() const = 0;
    virtual void terminate() = 0;
    virtual void kill() = 0;
    virtual bool waitForExit(int timeoutMs) = 0;
};

class StreamLauncher {
public:
    virtual ~StreamLauncher() = default;

    // Returns nullptr when the process could not be started.
    virtual std::unique_ptr<StreamHandle> launch(const StreamCommand& command) = 0;
};

class ProcessStreamLauncher : public StreamLauncher {
public:
    std::unique_ptr<StreamHandle> launch(const StreamCommand& command) override;
};

StreamCommand buildStreamCommand(const CaptureDevice& device, const StreamSettings& settings);

// Global settings with any "vvvv:pppp" section for the card's USB device applied.
StreamSettings streamSettingsFor(const ConfigManager& config, const CaptureDevice& device);

}
