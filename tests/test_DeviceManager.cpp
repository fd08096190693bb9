// tests/test_DeviceManager.cpp
#include "TestSupport.hpp"
#include "core/DeviceManager.hpp"
#include "core/UsbDevice.hpp"
#include <memory>

namespace usb_audio {
namespace testing {

class DeviceManagerTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        manager = std::make_unique<DeviceManager>();
    }

    void TearDown() override {
        manager.reset();
        QtTest::TearDown();
    }

    std::unique_ptr<DeviceManager> manager;
};

TEST_F(DeviceManagerTest, CreationTest) {
    ASSERT_NE(manager, nullptr);
    if (!manager->isAvailable()) {
        EXPECT_FALSE(manager->hotplugSupported());
        EXPECT_TRUE(manager->getConnectedDevices().empty());
    }
}

TEST_F(DeviceManagerTest, ConnectedDevicesHaveIdentity) {
    manager->pollDevices();
    for (const auto& device : manager->getConnectedDevices()) {
        auto info = device->info();
        EXPECT_GT(info.busNumber, 0);
        EXPECT_EQ(info.vendorId.size(), 4u);
        EXPECT_EQ(info.productId.size(), 4u);
    }
}

TEST_F(DeviceManagerTest, SignalTest) {
    bool deviceRemovedEmitted = false;

    QObject::connect(manager.get(), &DeviceManager::deviceRemoved,
        [&deviceRemovedEmitted](std::shared_ptr<UsbDevice>) {
            deviceRemovedEmitted = true;
        });

    // The first poll only discovers devices.
    manager->pollDevices();
    app->processEvents();

    EXPECT_FALSE(deviceRemovedEmitted);
}

TEST_F(DeviceManagerTest, StopWithoutStart) {
    manager->stopMonitoring();
    manager->startMonitoring();
    manager->stopMonitoring();
    SUCCEED();
}

} // namespace testing
} // namespace usb_audio
