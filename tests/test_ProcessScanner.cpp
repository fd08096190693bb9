// tests/test_ProcessScanner.cpp
#include "TestSupport.hpp"
#include "core/ProcessScanner.hpp"

namespace usb_audio {
namespace testing {

class ProcessScannerTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        QDir().mkpath(path("proc/self"));
        QDir().mkpath(path("proc/sys"));
    }

    void addProcess(long long pid, const QList<QByteArray>& arguments) {
        QByteArray raw;
        for (const auto& argument : arguments) {
            raw += argument;
            raw += '\0';
        }
        writeFile(path(QStringLiteral("proc/%1/cmdline").arg(pid)), raw);
    }
};

TEST_F(ProcessScannerTest, ParseCommandLine) {
    QByteArray raw("ffmpeg\0-f\0alsa\0-i\0plughw:1,0\0", 29);
    auto arguments = ProcessScanner::parseCommandLine(raw);

    ASSERT_EQ(arguments.size(), 5u);
    EXPECT_EQ(arguments[0], "ffmpeg");
    EXPECT_EQ(arguments[4], "plughw:1,0");
    EXPECT_TRUE(ProcessScanner::parseCommandLine(QByteArray()).empty());
}

TEST_F(ProcessScannerTest, ListsNumericEntriesOnly) {
    addProcess(101, {"/usr/bin/ffmpeg", "-i", "plughw:1,0", "rtsp://localhost:8554/usbaudio"});
    addProcess(102, {"/usr/sbin/sshd", "-D"});
    // Kernel threads have an empty command line.
    writeFile(path("proc/2/cmdline"), QByteArray());

    ProcessScanner processes(path("proc"));
    auto list = processes.listProcesses();

    ASSERT_EQ(list.size(), 2u);
    for (const auto& entry : list) {
        EXPECT_TRUE(entry.pid == 101 || entry.pid == 102);
    }
}

TEST_F(ProcessScannerTest, FindByCommandLineWithProgramFilter) {
    addProcess(201, {"/usr/bin/ffmpeg", "-f", "alsa", "-i", "plughw:1,0",
                     "-f", "rtsp", "rtsp://localhost:8554/usbaudio"});
    addProcess(202, {"ffmpeg", "-i", "plughw:2,0", "rtsp://localhost:8554/yeti"});
    addProcess(203, {"/usr/bin/tail", "-f", "rtsp://localhost:8554/usbaudio.log"});

    ProcessScanner processes(path("proc"));

    auto byUrl = processes.findByCommandLine("rtsp://localhost:8554/usbaudio", "ffmpeg");
    ASSERT_EQ(byUrl.size(), 1u);
    EXPECT_EQ(byUrl[0].pid, 201);
    EXPECT_EQ(byUrl[0].program(), "ffmpeg");

    auto anyProgram = processes.findByCommandLine("rtsp://localhost:8554/usbaudio");
    EXPECT_EQ(anyProgram.size(), 2u);

    auto allStreams = processes.findByCommandLine("rtsp://localhost:8554/", "ffmpeg");
    EXPECT_EQ(allStreams.size(), 2u);
}

TEST_F(ProcessScannerTest, FindByArgumentIsExact) {
    addProcess(301, {"/usr/bin/ffmpeg", "-i", "plughw:CARD=USB,DEV=0", "rtsp://localhost:8554/usb"});
    addProcess(302, {"/usr/bin/ffmpeg", "-i", "plughw:CARD=USBAudio,DEV=0",
                     "rtsp://localhost:8554/usbaudio"});
    addProcess(303, {"ffplay", "rtsp://localhost:8554/usb"});
    // argv[0] alone never counts as an argument.
    addProcess(304, {"rtsp://localhost:8554/usb"});

    ProcessScanner processes(path("proc"));

    auto matches = processes.findByArgument("rtsp://localhost:8554/usb", "ffmpeg");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].pid, 301);

    EXPECT_TRUE(processes.findByArgument("rtsp://localhost:8554/", "ffmpeg").empty());
    EXPECT_EQ(processes.findByArgument("rtsp://localhost:8554/usb", "ffplay").size(), 1u);
}

TEST_F(ProcessScannerTest, EntryHelpers) {
    ProcessEntry entry{7, {"/opt/bin/ffmpeg", "-re", "-i", "x"}};
    EXPECT_EQ(entry.program(), "ffmpeg");
    EXPECT_EQ(entry.commandLine(), "/opt/bin/ffmpeg -re -i x");
    EXPECT_EQ(ProcessEntry{}.program(), "");
}

TEST_F(ProcessScannerTest, TerminateSkipsMissingProcesses) {
    ProcessScanner processes(path("proc"));
    ProcessEntry gone{99999999, {"ffmpeg"}};
    EXPECT_EQ(processes.terminate({gone}, 0), 0);
}

} // namespace testing
} // namespace usb_audio
