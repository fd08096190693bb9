// tests/test_CaptureEnumerator.cpp
#include "TestSupport.hpp"
#include "core/CaptureEnumerator.hpp"
#include "core/Logger.hpp"
#include "core/RuleStore.hpp"
#include "core/TopologyResolver.hpp"

namespace usb_audio {
namespace testing {

class CaptureEnumeratorTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        options.asoundRoot = path("asound");
        options.arecordPath = QStringLiteral("arecord");
        QDir().mkpath(options.asoundRoot);
    }

    void writeCards(const QByteArray& contents) {
        writeFile(options.asoundRoot + "/cards", contents);
    }

    void addPcm(int card, const QString& name) {
        QDir().mkpath(options.asoundRoot + QStringLiteral("/card%1/%2").arg(card).arg(name));
    }

    EnumeratorOptions options;
    FakeSystemQuery query;
};

TEST_F(CaptureEnumeratorTest, SystemCardExcludedUsbCardStreamed) {
    writeCards(" 0 [bcm2835_headpho]: bcm2835_headpho - bcm2835 Headphones\n"
               "                      bcm2835 Headphones\n"
               " 1 [USBAudio       ]: USB-Audio - USB Audio Device\n"
               "                      Generic USB Audio Device at usb-0000:01:00.0-1.4, full speed\n");
    addPcm(0, "pcm0p");
    addPcm(1, "pcm0c");
    addPcm(1, "pcm0p");

    CaptureEnumerator enumerator(options, query);
    auto devices = enumerator.listCaptureDevices();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].cardNumber, 1);
    EXPECT_EQ(devices[0].cardId, "USBAudio");
    EXPECT_EQ(devices[0].captureDeviceIndex, 0);
    EXPECT_EQ(devices[0].resolvedStreamName, "usbaudio");
    EXPECT_EQ(devices[0].endpointUrl, "rtsp://localhost:8554/usbaudio");
    EXPECT_EQ(devices[0].usbInfo.value_or(""), "USB Audio Device");
    EXPECT_EQ(devices[0].usbPath.value_or(""), "usb-0000:01:00.0-1.4");
    EXPECT_FALSE(devices[0].mapped);
}

TEST_F(CaptureEnumeratorTest, EitherCaptureSignalIsEnough) {
    writeCards(" 1 [Mic            ]: USB-Audio - Yeti Stereo Microphone\n"
               "                      Blue Microphones Yeti Stereo Microphone at usb-0000:01:00.0-1.2, full speed\n"
               " 2 [Speaker        ]: USB-Audio - USB Speaker\n"
               "                      Generic USB Speaker at usb-0000:01:00.0-1.3, full speed\n"
               " 3 [Codec          ]: USB-Audio - USB Codec\n"
               "                      Burr-Brown USB Codec at usb-0000:01:00.0-1.1, full speed\n");
    // Card 1 is only visible to arecord, card 3 only through its pcm directory.
    query.script("arecord", {"-l"},
                 "card 1: Mic [Yeti Stereo Microphone], device 2: USB Audio [USB Audio #2]\n");
    addPcm(2, "pcm0p");
    addPcm(3, "pcm1c");

    CaptureEnumerator enumerator(options, query);
    auto devices = enumerator.listCaptureDevices();

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].cardId, "Mic");
    EXPECT_EQ(devices[0].captureDeviceIndex, 2);
    EXPECT_EQ(devices[1].cardId, "Codec");
    EXPECT_EQ(devices[1].captureDeviceIndex, 1);
}

TEST_F(CaptureEnumeratorTest, LowestCaptureDirectoryWins) {
    writeCards(" 4 [Interface      ]: USB-Audio - Scarlett 2i2 USB\n"
               "                      Focusrite Scarlett 2i2 USB at usb-0000:01:00.0-1.1, high speed\n");
    addPcm(4, "pcm10c");
    addPcm(4, "pcm2c");

    CaptureEnumerator enumerator(options, query);
    auto devices = enumerator.listCaptureDevices();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].captureDeviceIndex, 2);
}

TEST_F(CaptureEnumeratorTest, MissingCardListYieldsNothing) {
    CaptureEnumerator enumerator(options, query);
    EXPECT_TRUE(enumerator.listCaptureDevices().empty());
}

TEST_F(CaptureEnumeratorTest, ConfiguredDenylistAndEndpoint) {
    writeCards(" 0 [vc4-hdmi       ]: vc4-hdmi - vc4-hdmi\n"
               "                      vc4-hdmi\n"
               " 1 [Loopback       ]: Loopback - Loopback\n"
               "                      Loopback 1\n"
               " 2 [USB_Audio-2    ]: USB-Audio - USB Audio Device\n"
               "                      Generic USB Audio Device at usb-0000:01:00.0-1.4, full speed\n");
    addPcm(0, "pcm0c");
    addPcm(1, "pcm0c");
    addPcm(2, "pcm0c");

    options.extraDenylist = {"Loopback"};
    options.streamHost = "10.0.0.5";
    options.streamPort = 9554;

    CaptureEnumerator enumerator(options, query);
    auto devices = enumerator.listCaptureDevices();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].resolvedStreamName, "usbaudio2");
    EXPECT_EQ(devices[0].endpointUrl, "rtsp://10.0.0.5:9554/usbaudio2");
}

TEST_F(CaptureEnumeratorTest, MappedThroughRules) {
    writeCards(" 1 [USBAudio       ]: USB-Audio - USB Audio Device\n"
               "                      Generic USB Audio Device at usb-0000:00:14.0-1.4, full speed\n");
    addPcm(1, "pcm0c");
    writeFile(options.asoundRoot + "/card1/usbbus", "003/007\n");
    writeFile(options.asoundRoot + "/card1/usbid", "0d8c:0014\n");

    QString node = path("sys/devices/pci0000:00/0000:00:14.0/usb3/3-1/3-1.4");
    writeFile(node + "/busnum", "3\n");
    writeFile(node + "/devnum", "7\n");
    writeFile(node + "/devpath", "1.4\n");
    QDir().mkpath(path("sys/bus/usb/devices"));
    ASSERT_TRUE(QFile::link(node, path("sys/bus/usb/devices/3-1.4")));

    ResolverPaths paths;
    paths.sysfsUsbRoot = path("sys/bus/usb/devices");
    TopologyResolver resolver(paths, query);

    RuleStore rules(path("99-usb-soundcards.rules").toStdString());
    rules.addRule("0d8c", "0014", std::string("3-1.2"), MatchMode::PortPattern, "right-mic");
    rules.addRule("0d8c", "0014", std::string("3-1.4"), MatchMode::PortPattern, "left-mic");

    CaptureEnumerator enumerator(options, query, &rules, &resolver);
    auto devices = enumerator.listCaptureDevices();

    ASSERT_EQ(devices.size(), 1u);
    ASSERT_TRUE(devices[0].usb.has_value());
    EXPECT_EQ(devices[0].usb->busNumber, 3);
    EXPECT_EQ(devices[0].usb->deviceNumber, 7);
    EXPECT_EQ(devices[0].usb->vendorId, "0d8c");
    EXPECT_EQ(devices[0].usb->productId, "0014");
    EXPECT_TRUE(devices[0].mapped);
    EXPECT_EQ(devices[0].friendlyName.value_or(""), "left-mic");
}

TEST_F(CaptureEnumeratorTest, BasicRulesSkipPortLookup) {
    writeCards(" 1 [USBAudio       ]: USB-Audio - USB Audio Device\n"
               "                      Generic USB Audio Device at usb-0000:00:14.0-1.4, full speed\n"
               " 2 [Codec          ]: USB-Audio - USB Codec\n"
               "                      Burr-Brown USB Codec at usb-0000:00:14.0-1.1, full speed\n");
    addPcm(1, "pcm0c");
    addPcm(2, "pcm0c");
    writeFile(options.asoundRoot + "/card1/usbbus", "003/007\n");
    writeFile(options.asoundRoot + "/card1/usbid", "0d8c:0014\n");
    writeFile(options.asoundRoot + "/card2/usbbus", "003/008\n");
    writeFile(options.asoundRoot + "/card2/usbid", "08bb:2902\n");

    // No sysfs topology at all: a port lookup would fall through to udevadm.
    ResolverPaths paths;
    paths.sysfsUsbRoot = path("sys/bus/usb/devices");
    TopologyResolver resolver(paths, query);

    RuleStore rules(path("99-usb-soundcards.rules").toStdString());
    rules.addRule("0d8c", "0014", std::nullopt, MatchMode::Basic, "desk-mic");

    Logger::instance().clear();
    CaptureEnumerator enumerator(options, query, &rules, &resolver);
    auto devices = enumerator.listCaptureDevices();

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_TRUE(devices[0].mapped);
    EXPECT_EQ(devices[0].friendlyName.value_or(""), "desk-mic");
    EXPECT_FALSE(devices[1].mapped);

    for (const auto& call : query.calls) {
        EXPECT_NE(call.value(0), paths.udevadmPath) << call.join(' ').toStdString();
    }
    for (const auto& entry : Logger::instance().getRecentLogs()) {
        EXPECT_EQ(entry.find("No topology information"), std::string::npos) << entry;
    }
}

TEST(StreamNameTest, Sanitize) {
    EXPECT_EQ(CaptureEnumerator::sanitizeStreamName("USBAudio"), "usbaudio");
    EXPECT_EQ(CaptureEnumerator::sanitizeStreamName("left-mic_2"), "leftmic2");
    EXPECT_EQ(CaptureEnumerator::sanitizeStreamName("--"), "");
    EXPECT_EQ(CaptureEnumerator::endpointUrl("localhost", 8554, "mic"), "rtsp://localhost:8554/mic");
}

} // namespace testing
} // namespace usb_audio
