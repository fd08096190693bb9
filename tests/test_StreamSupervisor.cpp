// tests/test_StreamSupervisor.cpp
#include "TestSupport.hpp"
#include "core/CaptureEnumerator.hpp"
#include "core/Logger.hpp"
#include "core/ProcessScanner.hpp"
#include "core/StreamLauncher.hpp"
#include "core/StreamSupervisor.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace usb_audio {
namespace testing {

struct FakeProcess {
    long long pid{0};
    StreamCommand command;
    bool alive{true};
    bool terminated{false};
    bool killed{false};
    bool ignoresTerminate{false};
};

class FakeHandle : public StreamHandle {
public:
    explicit FakeHandle(std::shared_ptr<FakeProcess> process) : p(std::move(process)) {}

    long long pid() const override { return p->pid; }
    bool isAlive() const override { return p->alive; }
    void terminate() override {
        p->terminated = true;
        if (!p->ignoresTerminate) p->alive = false;
    }
    void kill() override {
        p->killed = true;
        p->alive = false;
    }
    bool waitForExit(int) override { return !p->alive; }

private:
    std::shared_ptr<FakeProcess> p;
};

class FakeLauncher : public StreamLauncher {
public:
    std::unique_ptr<StreamHandle> launch(const StreamCommand& command) override {
        if (failNext > 0) {
            --failNext;
            return nullptr;
        }
        auto process = std::make_shared<FakeProcess>();
        process->pid = nextPid++;
        process->command = command;
        process->ignoresTerminate = ignoreTerminate;
        launched.push_back(process);
        return std::make_unique<FakeHandle>(process);
    }

    std::shared_ptr<FakeProcess> forUrl(const QString& url) const {
        for (auto it = launched.rbegin(); it != launched.rend(); ++it) {
            if ((*it)->command.arguments.last() == url) return *it;
        }
        return nullptr;
    }

    std::vector<std::shared_ptr<FakeProcess>> launched;
    long long nextPid{1000};
    int failNext{0};
    bool ignoreTerminate{false};
};

CaptureDevice makeDevice(int card, const std::string& id) {
    CaptureDevice device;
    device.cardNumber = card;
    device.cardId = id;
    device.description = "USB-Audio - " + id;
    device.captureDeviceIndex = 0;
    device.resolvedStreamName = CaptureEnumerator::sanitizeStreamName(id);
    device.endpointUrl = CaptureEnumerator::endpointUrl("localhost", 8554, device.resolvedStreamName);
    return device;
}

class StreamSupervisorTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        options.staggerDelayMs = 0;
        options.stopTimeoutMs = 0;
        supervisor = std::make_unique<StreamSupervisor>(options, launcher);
    }

    void TearDown() override {
        supervisor.reset();
        QtTest::TearDown();
    }

    // Records the card ids carried by a signal.
    template<typename Signal>
    std::shared_ptr<QStringList> record(Signal signal) {
        auto ids = std::make_shared<QStringList>();
        QObject::connect(supervisor.get(), signal, [ids](const QString& cardId) {
            ids->append(cardId);
        });
        return ids;
    }

    std::shared_ptr<int> count(void (StreamSupervisor::*signal)()) {
        auto n = std::make_shared<int>(0);
        QObject::connect(supervisor.get(), signal, [n]() { ++*n; });
        return n;
    }

    std::vector<std::string> activeIds() const {
        std::vector<std::string> ids;
        for (const auto& stream : supervisor->activeStreams()) {
            ids.push_back(stream.capturedBy);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    SupervisorOptions options;
    FakeLauncher launcher;
    std::unique_ptr<StreamSupervisor> supervisor;
};

TEST_F(StreamSupervisorTest, StartsOneStreamPerDevice) {
    auto started = std::make_shared<int>(0);
    QObject::connect(supervisor.get(), &StreamSupervisor::streamStarted,
        [started](const QString&, const QString&) { ++*started; });

    supervisor->reconcile({makeDevice(1, "USBAudio"), makeDevice(2, "Yeti")});

    EXPECT_EQ(launcher.launched.size(), 2u);
    EXPECT_EQ(*started, 2);
    EXPECT_EQ(activeIds(), (std::vector<std::string>{"USBAudio", "Yeti"}));

    auto streams = supervisor->activeStreams();
    for (const auto& stream : streams) {
        EXPECT_EQ(stream.state, StreamState::Running);
        EXPECT_GE(stream.pid, 1000);
    }
    EXPECT_TRUE(launcher.forUrl("rtsp://localhost:8554/usbaudio") != nullptr);
}

TEST_F(StreamSupervisorTest, ReconcileIsIdempotent) {
    std::vector<CaptureDevice> devices{makeDevice(1, "USBAudio"), makeDevice(2, "Yeti")};
    supervisor->reconcile(devices);

    auto changed = count(&StreamSupervisor::streamsChanged);
    supervisor->reconcile(devices);
    supervisor->reconcile(devices);

    EXPECT_EQ(launcher.launched.size(), 2u);
    EXPECT_EQ(*changed, 0);
    for (const auto& process : launcher.launched) {
        EXPECT_FALSE(process->terminated);
    }
}

TEST_F(StreamSupervisorTest, RemovingDeviceStopsOnlyItsStream) {
    supervisor->reconcile({makeDevice(1, "USBAudio"), makeDevice(2, "Yeti")});
    auto usbAudio = launcher.forUrl("rtsp://localhost:8554/usbaudio");
    auto yeti = launcher.forUrl("rtsp://localhost:8554/yeti");

    auto stopped = record(&StreamSupervisor::streamStopped);
    supervisor->reconcile({makeDevice(2, "Yeti")});

    EXPECT_TRUE(usbAudio->terminated);
    EXPECT_FALSE(yeti->terminated);
    EXPECT_EQ(*stopped, QStringList{QStringLiteral("USBAudio")});
    EXPECT_EQ(activeIds(), (std::vector<std::string>{"Yeti"}));
    EXPECT_EQ(launcher.launched.size(), 2u);
}

TEST_F(StreamSupervisorTest, AddingDeviceStartsExactlyOne) {
    supervisor->reconcile({makeDevice(1, "USBAudio")});
    supervisor->reconcile({makeDevice(1, "USBAudio"), makeDevice(3, "Codec")});

    ASSERT_EQ(launcher.launched.size(), 2u);
    EXPECT_FALSE(launcher.launched[0]->terminated);
    EXPECT_EQ(launcher.launched[1]->command.arguments.last(),
              QStringLiteral("rtsp://localhost:8554/codec"));
}

TEST_F(StreamSupervisorTest, ChangedCaptureIndexRestartsStream) {
    supervisor->reconcile({makeDevice(1, "USBAudio")});

    CaptureDevice moved = makeDevice(4, "USBAudio");
    supervisor->reconcile({moved});

    ASSERT_EQ(launcher.launched.size(), 2u);
    EXPECT_TRUE(launcher.launched[0]->terminated);
    auto streams = supervisor->activeStreams();
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_EQ(streams[0].cardNumber, 4);
}

TEST_F(StreamSupervisorTest, SpawnFailureIsRetriedNextPass) {
    launcher.failNext = 1;
    auto failed = std::make_shared<int>(0);
    QObject::connect(supervisor.get(), &StreamSupervisor::spawnFailed,
        [failed](const QString&, const QString&) { ++*failed; });

    supervisor->reconcile({makeDevice(1, "USBAudio")});
    EXPECT_EQ(*failed, 1);
    EXPECT_TRUE(supervisor->activeStreams().empty());

    supervisor->reconcile({makeDevice(1, "USBAudio")});
    EXPECT_EQ(activeIds(), (std::vector<std::string>{"USBAudio"}));
    EXPECT_EQ(*failed, 1);
}

TEST_F(StreamSupervisorTest, DeadStreamIsRestarted) {
    supervisor->reconcile({makeDevice(1, "USBAudio")});
    launcher.launched[0]->alive = false;

    auto died = record(&StreamSupervisor::streamDied);
    supervisor->reconcile({makeDevice(1, "USBAudio")});

    EXPECT_EQ(died->size(), 1);
    ASSERT_EQ(launcher.launched.size(), 2u);
    EXPECT_TRUE(launcher.launched[1]->alive);
    auto streams = supervisor->activeStreams();
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_EQ(streams[0].pid, launcher.launched[1]->pid);
}

TEST_F(StreamSupervisorTest, EndpointCollisionKeepsFirstCard) {
    // "USB-Audio" and "USBAudio" both sanitize to "usbaudio".
    supervisor->reconcile({makeDevice(1, "USBAudio"), makeDevice(2, "USB-Audio")});

    EXPECT_EQ(launcher.launched.size(), 1u);
    EXPECT_EQ(activeIds(), (std::vector<std::string>{"USBAudio"}));
}

TEST_F(StreamSupervisorTest, StubbornProcessIsKilled) {
    launcher.ignoreTerminate = true;
    supervisor->reconcile({makeDevice(1, "USBAudio")});
    supervisor->reconcile({});

    EXPECT_TRUE(launcher.launched[0]->terminated);
    EXPECT_TRUE(launcher.launched[0]->killed);
    EXPECT_TRUE(supervisor->activeStreams().empty());
}

TEST_F(StreamSupervisorTest, ShutdownRunsOnce) {
    supervisor->reconcile({makeDevice(1, "USBAudio"), makeDevice(2, "Yeti")});
    auto complete = count(&StreamSupervisor::shutdownComplete);

    EXPECT_TRUE(supervisor->shutdown());
    EXPECT_FALSE(supervisor->shutdown());

    EXPECT_EQ(*complete, 1);
    EXPECT_TRUE(supervisor->isShuttingDown());
    EXPECT_TRUE(supervisor->activeStreams().empty());
    for (const auto& process : launcher.launched) {
        EXPECT_FALSE(process->alive);
    }

    // No new streams once shutdown has begun.
    supervisor->reconcile({makeDevice(3, "Codec")});
    EXPECT_EQ(launcher.launched.size(), 2u);
}

// Supervisor backed by a scanner over a scratch /proc. The pids are above
// any kernel pid_max, so the signals the scanner sends fail harmlessly.
class StreamSupervisorSweepTest : public StreamSupervisorTest {
protected:
    void SetUp() override {
        StreamSupervisorTest::SetUp();
        scanner = std::make_unique<ProcessScanner>(path("proc"));
        supervisor = std::make_unique<StreamSupervisor>(options, launcher, scanner.get());
        Logger::instance().clear();
    }

    void addProcess(long long pid, const QList<QByteArray>& arguments) {
        QByteArray raw;
        for (const auto& argument : arguments) {
            raw += argument;
            raw += '\0';
        }
        writeFile(path(QStringLiteral("proc/%1/cmdline").arg(pid)), raw);
    }

    std::vector<std::string> logsContaining(const std::string& text) const {
        std::vector<std::string> matches;
        for (const auto& entry : Logger::instance().getRecentLogs()) {
            if (entry.find(text) != std::string::npos) matches.push_back(entry);
        }
        return matches;
    }

    std::unique_ptr<ProcessScanner> scanner;
};

TEST_F(StreamSupervisorSweepTest, ShutdownSweepsLeftoverStreams) {
    addProcess(99999901, {"/usr/bin/ffmpeg", "-f", "alsa", "-i", "plughw:CARD=Old,DEV=0",
                          "-f", "rtsp", "rtsp://localhost:8554/old"});
    addProcess(99999902, {"ffplay", "rtsp://localhost:8554/old"});
    addProcess(99999903, {"ffmpeg", "-i", "plughw:CARD=Far,DEV=0", "rtsp://otherhost:8554/far"});

    supervisor->reconcile({makeDevice(1, "USBAudio")});
    EXPECT_TRUE(supervisor->shutdown());

    auto sweep = logsContaining("remaining streaming process");
    ASSERT_EQ(sweep.size(), 1u);
    EXPECT_NE(sweep[0].find("Sweeping 1 remaining"), std::string::npos) << sweep[0];
    EXPECT_TRUE(launcher.launched[0]->terminated);
}

TEST_F(StreamSupervisorSweepTest, StaleSweepMatchesExactEndpoint) {
    addProcess(99999911, {"/usr/bin/ffmpeg", "-i", "plughw:CARD=USBAudio,DEV=0",
                          "rtsp://localhost:8554/usbaudio"});
    addProcess(99999912, {"ffplay", "rtsp://localhost:8554/usb"});
    addProcess(99999913, {"/usr/bin/ffmpeg", "-i", "plughw:CARD=USB,DEV=0",
                          "-f", "rtsp", "rtsp://localhost:8554/usb"});

    supervisor->reconcile({makeDevice(1, "USB"), makeDevice(2, "Yeti")});

    auto stale = logsContaining("stale process");
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_NE(stale[0].find("Found 1 stale process(es) for rtsp://localhost:8554/usb"),
              std::string::npos) << stale[0];
    EXPECT_EQ(launcher.launched.size(), 2u);
}

// Holds the first launch until released, counting launches in flight.
class GatedLauncher : public FakeLauncher {
public:
    std::unique_ptr<StreamHandle> launch(const StreamCommand& command) override {
        std::unique_lock<std::mutex> lock(mutex);
        ++inFlight;
        maxInFlight = std::max(maxInFlight, inFlight);
        ++calls;
        changed.notify_all();
        changed.wait(lock, [this]() { return released; });
        --inFlight;
        return FakeLauncher::launch(command);
    }

    void waitForCalls(int n) {
        std::unique_lock<std::mutex> lock(mutex);
        changed.wait(lock, [&]() { return calls >= n; });
    }

    int callCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        changed.notify_all();
    }

    std::mutex mutex;
    std::condition_variable changed;
    int inFlight{0};
    int maxInFlight{0};
    int calls{0};
    bool released{false};
};

TEST_F(StreamSupervisorTest, ConcurrentPassesDoNotInterleave) {
    GatedLauncher gated;
    StreamSupervisor serial(options, gated);

    std::thread first([&]() { serial.reconcile({makeDevice(1, "USBAudio")}); });
    gated.waitForCalls(1);

    std::thread second([&]() {
        serial.reconcile({makeDevice(1, "USBAudio"), makeDevice(2, "Yeti")});
    });
    // The second pass must wait for the first to finish before launching.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(gated.callCount(), 1);

    gated.release();
    first.join();
    second.join();

    EXPECT_EQ(gated.maxInFlight, 1);
    ASSERT_EQ(gated.launched.size(), 2u);
    EXPECT_EQ(gated.launched[0]->command.arguments.last(),
              QStringLiteral("rtsp://localhost:8554/usbaudio"));
    EXPECT_EQ(gated.launched[1]->command.arguments.last(),
              QStringLiteral("rtsp://localhost:8554/yeti"));

    std::vector<std::string> ids;
    for (const auto& stream : serial.activeStreams()) ids.push_back(stream.capturedBy);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"USBAudio", "Yeti"}));
}

TEST(StreamCommandTest, ArgumentsEndWithEndpoint) {
    CaptureDevice device = makeDevice(1, "USBAudio");
    device.captureDeviceIndex = 2;

    StreamCommand command = buildStreamCommand(device, StreamSettings{});

    EXPECT_EQ(command.program, QStringLiteral("ffmpeg"));
    EXPECT_TRUE(command.arguments.contains(QStringLiteral("plughw:CARD=USBAudio,DEV=2")));
    EXPECT_TRUE(command.arguments.contains(QStringLiteral("libmp3lame")));
    EXPECT_TRUE(command.arguments.contains(QStringLiteral("160k")));
    EXPECT_EQ(command.arguments.last(), QStringLiteral("rtsp://localhost:8554/usbaudio"));
}

} // namespace testing
} // namespace usb_audio
