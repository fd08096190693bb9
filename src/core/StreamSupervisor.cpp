#include "StreamSupervisor.hpp"
#include "Logger.hpp"
#include "ProcessScanner.hpp"
#include "StreamLauncher.hpp"
#include "../utils/ConfigManager.hpp"
#include <QThread>
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>

namespace usb_audio {

namespace {

struct OwnedStream {
    StreamProcess process;
    CaptureDevice device;
    std::unique_ptr<StreamHandle> handle;
};

std::string describe(const CaptureDevice& device) {
    return "card " + std::to_string(device.cardNumber) + " [" + device.cardId + "]";
}

}

class StreamSupervisor::Private {
public:
    SupervisorOptions options;
    StreamLauncher& launcher;
    const ProcessScanner* scanner;
    const ConfigManager* config;

    std::mutex reconcileMutex;
    mutable std::mutex streamsMutex;
    std::map<std::string, OwnedStream> streams;
    std::atomic<bool> shutdownStarted{false};

    Private(const SupervisorOptions& o, StreamLauncher& l,
            const ProcessScanner* s, const ConfigManager* c)
        : options(o), launcher(l), scanner(s), config(c) {}

    StreamSettings settingsFor(const CaptureDevice& device) const {
        if (config) {
            return streamSettingsFor(*config, device);
        }
        return StreamSettings{};
    }

    bool isOwnedPid(long long pid) const {
        std::lock_guard<std::mutex> lock(streamsMutex);
        for (const auto& [_, stream] : streams) {
            if (stream.process.pid == pid) return true;
        }
        return false;
    }

    // Leftovers of an earlier supervisor instance streaming to the same URL.
    void clearStaleProcesses(const CaptureDevice& device) const {
        if (!scanner) {
            return;
        }
        std::vector<ProcessEntry> stale;
        for (auto& entry : scanner->findByArgument(device.endpointUrl, STREAM_PROGRAM)) {
            if (!isOwnedPid(entry.pid)) {
                stale.push_back(std::move(entry));
            }
        }
        if (!stale.empty()) {
            LOG_WARNING("Found " + std::to_string(stale.size()) +
                        " stale process(es) for " + device.endpointUrl);
            scanner->terminate(stale, options.stopTimeoutMs);
        }
    }

    void stopHandle(OwnedStream& stream) const {
        stream.process.state = StreamState::Stopping;
        if (!stream.handle || !stream.handle->isAlive()) {
            return;
        }
        stream.handle->terminate();
        if (!stream.handle->waitForExit(options.stopTimeoutMs)) {
            LOG_WARNING("Stream " + stream.process.endpointUrl + " (pid " +
                        std::to_string(stream.process.pid) + ") did not stop, killing");
            stream.handle->kill();
            stream.handle->waitForExit(options.stopTimeoutMs);
        }
    }

    static bool sameStream(const CaptureDevice& a, const CaptureDevice& b) {
        return a.endpointUrl == b.endpointUrl &&
               a.captureDeviceIndex == b.captureDeviceIndex &&
               a.cardNumber == b.cardNumber;
    }
};

StreamSupervisor::StreamSupervisor(const SupervisorOptions& options,
                                   StreamLauncher& launcher,
                                   const ProcessScanner* scanner,
                                   const ConfigManager* config,
                                   QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>(options, launcher, scanner, config)) {
}

StreamSupervisor::~StreamSupervisor() {
    blockSignals(true);
    shutdown();
}

void StreamSupervisor::reconcile(const std::vector<CaptureDevice>& currentDevices) {
    std::lock_guard<std::mutex> passLock(d->reconcileMutex);
    if (d->shutdownStarted) {
        return;
    }

    bool changed = false;

    // Liveness of what was spawned on earlier passes.
    std::vector<std::string> died;
    {
        std::lock_guard<std::mutex> lock(d->streamsMutex);
        for (auto it = d->streams.begin(); it != d->streams.end();) {
            if (it->second.handle && it->second.handle->isAlive()) {
                ++it;
                continue;
            }
            LOG_WARNING("Stream for " + describe(it->second.device) + " (pid " +
                        std::to_string(it->second.process.pid) + ") has exited");
            it->second.process.state = StreamState::Dead;
            died.push_back(it->first);
            it = d->streams.erase(it);
        }
    }
    for (const auto& cardId : died) {
        emit streamDied(QString::fromStdString(cardId));
        changed = true;
    }

    // Desired set, one stream per endpoint; the first card to claim an endpoint keeps it.
    std::vector<CaptureDevice> desired;
    std::set<std::string> endpoints;
    std::set<std::string> cardIds;
    for (const auto& device : currentDevices) {
        if (cardIds.count(device.cardId) > 0) {
            continue;
        }
        if (!endpoints.insert(device.endpointUrl).second) {
            LOG_WARNING("Skipping " + describe(device) + ": endpoint " + device.endpointUrl +
                        " is already used by another card");
            continue;
        }
        cardIds.insert(device.cardId);
        desired.push_back(device);
    }

    // Stop streams whose device went away or now streams differently.
    std::vector<OwnedStream> toStop;
    {
        std::lock_guard<std::mutex> lock(d->streamsMutex);
        for (auto it = d->streams.begin(); it != d->streams.end();) {
            auto wanted = std::find_if(desired.begin(), desired.end(),
                [&](const CaptureDevice& device) { return device.cardId == it->first; });
            if (wanted != desired.end() && Private::sameStream(*wanted, it->second.device)) {
                ++it;
                continue;
            }
            toStop.push_back(std::move(it->second));
            it = d->streams.erase(it);
        }
    }
    for (auto& stream : toStop) {
        LOG_INFO("Stopping stream for " + describe(stream.device) + " at " + stream.process.endpointUrl);
        d->stopHandle(stream);
        emit streamStopped(QString::fromStdString(stream.process.capturedBy));
        changed = true;
    }

    // Start streams for devices without one.
    bool first = true;
    for (const auto& device : desired) {
        {
            std::lock_guard<std::mutex> lock(d->streamsMutex);
            if (d->streams.count(device.cardId) > 0) {
                continue;
            }
        }

        if (!first && d->options.staggerDelayMs > 0) {
            QThread::msleep(static_cast<unsigned long>(d->options.staggerDelayMs));
        }
        first = false;

        d->clearStaleProcesses(device);

        OwnedStream stream;
        stream.device = device;
        stream.process.capturedBy = device.cardId;
        stream.process.endpointUrl = device.endpointUrl;
        stream.process.cardNumber = device.cardNumber;
        stream.process.captureDeviceIndex = device.captureDeviceIndex;
        stream.process.usbDescription = device.usbInfo.value_or(device.description);
        stream.process.state = StreamState::Starting;

        StreamCommand command = buildStreamCommand(device, d->settingsFor(device));
        LOG_INFO("Starting stream for " + describe(device) + " at " + device.endpointUrl);
        LOG_DEBUG(command.program.toStdString() + " " + command.arguments.join(' ').toStdString());

        stream.handle = d->launcher.launch(command);
        if (!stream.handle) {
            std::string reason = "could not start " + command.program.toStdString();
            LOG_ERROR("Failed to start stream for " + describe(device) + ": " + reason +
                      ", will retry on the next pass");
            emit spawnFailed(QString::fromStdString(device.cardId), QString::fromStdString(reason));
            continue;
        }

        stream.process.pid = stream.handle->pid();
        stream.process.startedAt = std::chrono::system_clock::now();
        stream.process.state = StreamState::Running;
        {
            std::lock_guard<std::mutex> lock(d->streamsMutex);
            d->streams[device.cardId] = std::move(stream);
        }
        emit streamStarted(QString::fromStdString(device.cardId),
                           QString::fromStdString(device.endpointUrl));
        changed = true;
    }

    if (changed) {
        emit streamsChanged();
    }
}

bool StreamSupervisor::shutdown() {
    if (d->shutdownStarted.exchange(true)) {
        return false;
    }

    std::lock_guard<std::mutex> passLock(d->reconcileMutex);
    LOG_INFO("Stopping all audio streams");

    std::map<std::string, OwnedStream> owned;
    {
        std::lock_guard<std::mutex> lock(d->streamsMutex);
        owned.swap(d->streams);
    }
    for (auto& [cardId, stream] : owned) {
        d->stopHandle(stream);
        emit streamStopped(QString::fromStdString(cardId));
    }

    if (d->scanner) {
        std::string prefix = std::string(STREAM_SCHEME) + "://" + d->options.streamHost + ":" +
                             std::to_string(d->options.streamPort) + "/";
        auto leftovers = d->scanner->findByCommandLine(prefix, STREAM_PROGRAM);
        if (!leftovers.empty()) {
            LOG_INFO("Sweeping " + std::to_string(leftovers.size()) +
                     " remaining streaming process(es)");
            d->scanner->terminate(leftovers, d->options.stopTimeoutMs);
        }
    }

    if (!owned.empty()) {
        emit streamsChanged();
    }
    emit shutdownComplete();
    return true;
}

bool StreamSupervisor::isShuttingDown() const {
    return d->shutdownStarted;
}

std::vector<StreamProcess> StreamSupervisor::activeStreams() const {
    std::vector<StreamProcess> result;
    std::lock_guard<std::mutex> lock(d->streamsMutex);
    result.reserve(d->streams.size());
    for (const auto& [_, stream] : d->streams) {
        result.push_back(stream.process);
    }
    return result;
}

}
