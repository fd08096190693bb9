#pragma once
#include <usb-audio/Types.hpp>
#include <usb-audio/Constants.hpp>
#include <QObject>
#include <QString>
#include <memory>
#include <string>
#include <vector>

namespace usb_audio {

class ConfigManager;
class ProcessScanner;
class StreamLauncher;

struct SupervisorOptions {
    int staggerDelayMs{STAGGER_DELAY};
    int stopTimeoutMs{STOP_TIMEOUT};
    std::string streamHost{"localhost"};
    int streamPort{DEFAULT_STREAM_PORT};
};

// Keeps exactly one streaming process per present capture device.
//
// Each card id moves Absent -> Starting -> Running -> Stopping -> Absent.
// reconcile() compares the given device set with the owned processes and
// applies the smallest set of starts and stops. Passes are serialized.
class StreamSupervisor : public QObject {
    Q_OBJECT

public:
    // scanner and config are optional. Without a scanner no stale or
    // leftover processes are swept; without a config the stream settings
    // are the built-in defaults.
    StreamSupervisor(const SupervisorOptions& options,
                     StreamLauncher& launcher,
                     const ProcessScanner* scanner = nullptr,
                     const ConfigManager* config = nullptr,
                     QObject* parent = nullptr);
    ~StreamSupervisor();

    void reconcile(const std::vector<CaptureDevice>& currentDevices);

    // Stops every owned stream, then sweeps remaining streaming processes
    // for this server. Only the first call does anything; returns whether
    // this call performed the shutdown.
    bool shutdown();
    bool isShuttingDown() const;

    std::vector<StreamProcess> activeStreams() const;

signals:
    void streamStarted(const QString& cardId, const QString& endpointUrl);
    void streamStopped(const QString& cardId);
    void streamDied(const QString& cardId);
    void spawnFailed(const QString& cardId, const QString& reason);
    void streamsChanged();
    void shutdownComplete();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
