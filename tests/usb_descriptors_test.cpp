#include <gtest/gtest.h>

#include "fake_usb_backend.hpp"
#include "usb_descriptors.hpp"
#include "usb_error.hpp"

TEST(USBDescriptorsTest, ParsesDeviceDescriptor)
{
    std::vector<uint8_t> raw = BuildDeviceDescriptor(0x1d6b, 0x0002, 2, USB1_CLASS_HUB);

    USBDeviceDescriptor desc = ParseDeviceDescriptor(raw.data(), raw.size());

    EXPECT_EQ(desc.bLength, USB1_DT_DEVICE_SIZE);
    EXPECT_EQ(desc.bDescriptorType, USB1_DT_DEVICE);
    EXPECT_EQ(desc.bcdUSB, 0x0200);
    EXPECT_EQ(desc.bDeviceClass, USB1_CLASS_HUB);
    EXPECT_EQ(desc.bMaxPacketSize0, 64);
    EXPECT_EQ(desc.idVendor, 0x1d6b);
    EXPECT_EQ(desc.idProduct, 0x0002);
    EXPECT_EQ(desc.bcdDevice, 0x0100);
    EXPECT_EQ(desc.iManufacturer, 1);
    EXPECT_EQ(desc.iProduct, 2);
    EXPECT_EQ(desc.iSerialNumber, 3);
    EXPECT_EQ(desc.bNumConfigurations, 2);
}

TEST(USBDescriptorsTest, RejectsShortDeviceDescriptor)
{
    std::vector<uint8_t> raw = BuildDeviceDescriptor(0x1234, 0x5678);
    raw.resize(10);

    try {
        ParseDeviceDescriptor(raw.data(), raw.size());
        FAIL() << "Expected USBError";
    } catch (const USBError &e) {
        EXPECT_EQ(e.GetCode(), USB1_ERROR_IO);
    }
}

TEST(USBDescriptorsTest, ParsesConfigurationTree)
{
    FakeDeviceConfig device = MakeFakeDevice(0x1234, 0x5678);
    const std::vector<uint8_t> &raw = device.configDescriptors.front();

    USBConfiguration config = ParseConfigDescriptor(raw.data(), raw.size());

    EXPECT_EQ(config.bConfigurationValue, 1);
    EXPECT_EQ(config.wTotalLength, raw.size());
    ASSERT_EQ(config.interfaces.size(), 1u);
    ASSERT_EQ(config.interfaces[0].altsettings.size(), 1u);

    const USBInterfaceSetting &setting = config.interfaces[0].altsettings[0];
    EXPECT_EQ(setting.bInterfaceClass, USB1_CLASS_VENDOR_SPEC);
    ASSERT_EQ(setting.endpoints.size(), 4u);

    EXPECT_EQ(setting.endpoints[0].bEndpointAddress, 0x81);
    EXPECT_TRUE(setting.endpoints[0].IsIn());
    EXPECT_EQ(setting.endpoints[0].GetTransferType(), USB1_TRANSFER_TYPE_BULK);
    EXPECT_EQ(setting.endpoints[0].wMaxPacketSize, 512);

    EXPECT_FALSE(setting.endpoints[1].IsIn());
    EXPECT_EQ(setting.endpoints[2].GetTransferType(), USB1_TRANSFER_TYPE_INTERRUPT);
    EXPECT_EQ(setting.endpoints[2].bInterval, 4);
    EXPECT_EQ(setting.endpoints[3].GetTransferType(), USB1_TRANSFER_TYPE_ISOCHRONOUS);
}

TEST(USBDescriptorsTest, GroupsAlternateSettings)
{
    std::vector<uint8_t> body = BuildInterfaceDescriptor(0, 0, 0);
    std::vector<uint8_t> alt = BuildInterfaceDescriptor(0, 1, 1);
    std::vector<uint8_t> endpoint = BuildEndpointDescriptor(0x81, USB1_TRANSFER_TYPE_ISOCHRONOUS, 256, 1);
    std::vector<uint8_t> second = BuildInterfaceDescriptor(1, 0, 0, USB1_CLASS_HID);
    body.insert(body.end(), alt.begin(), alt.end());
    body.insert(body.end(), endpoint.begin(), endpoint.end());
    body.insert(body.end(), second.begin(), second.end());
    std::vector<uint8_t> raw = BuildConfigDescriptor(1, 2, body);

    USBConfiguration config = ParseConfigDescriptor(raw.data(), raw.size());

    ASSERT_EQ(config.interfaces.size(), 2u);
    ASSERT_EQ(config.interfaces[0].altsettings.size(), 2u);
    EXPECT_EQ(config.interfaces[0].altsettings[1].bAlternateSetting, 1);
    EXPECT_EQ(config.interfaces[0].altsettings[1].endpoints.size(), 1u);
    ASSERT_EQ(config.interfaces[1].altsettings.size(), 1u);
    EXPECT_EQ(config.interfaces[1].altsettings[0].GetClassTuple(), std::make_tuple(uint8_t(USB1_CLASS_HID), uint8_t(0)));
}

TEST(USBDescriptorsTest, KeepsClassSpecificDescriptorsAsExtra)
{
    // HID descriptor after the interface, endpoint companion after the endpoint
    std::vector<uint8_t> hid = { 0x09, USB1_DT_HID, 0x11, 0x01, 0x00, 0x01, USB1_DT_REPORT, 0x22, 0x00 };
    std::vector<uint8_t> companion = { 0x06, USB1_DT_SS_ENDPOINT_COMPANION, 0x00, 0x00, 0x00, 0x00 };
    std::vector<uint8_t> vendor = { 0x04, 0x41, 0xaa, 0xbb };

    std::vector<uint8_t> body = vendor;
    std::vector<uint8_t> interface = BuildInterfaceDescriptor(0, 0, 1, USB1_CLASS_HID);
    std::vector<uint8_t> endpoint = BuildEndpointDescriptor(0x81, USB1_TRANSFER_TYPE_INTERRUPT, 8, 10);
    body.insert(body.end(), interface.begin(), interface.end());
    body.insert(body.end(), hid.begin(), hid.end());
    body.insert(body.end(), endpoint.begin(), endpoint.end());
    body.insert(body.end(), companion.begin(), companion.end());
    std::vector<uint8_t> raw = BuildConfigDescriptor(1, 1, body);

    USBConfiguration config = ParseConfigDescriptor(raw.data(), raw.size());

    EXPECT_EQ(config.extra, vendor);
    const USBInterfaceSetting &setting = config.interfaces[0].altsettings[0];
    EXPECT_EQ(setting.extra, hid);
    ASSERT_EQ(setting.endpoints.size(), 1u);
    EXPECT_EQ(setting.endpoints[0].extra, companion);
}

TEST(USBDescriptorsTest, ParsesAudioEndpointFields)
{
    std::vector<uint8_t> endpoint = { USB1_DT_ENDPOINT_AUDIO_SIZE, USB1_DT_ENDPOINT, 0x82, 0x05, 0xc0, 0x00, 0x01,
        0x03, 0x83 };
    std::vector<uint8_t> body = BuildInterfaceDescriptor(0, 0, 1, USB1_CLASS_AUDIO, 2);
    body.insert(body.end(), endpoint.begin(), endpoint.end());
    std::vector<uint8_t> raw = BuildConfigDescriptor(1, 1, body);

    USBConfiguration config = ParseConfigDescriptor(raw.data(), raw.size());

    const USBEndpointDescriptor &desc = config.interfaces[0].altsettings[0].endpoints[0];
    EXPECT_EQ(desc.bLength, USB1_DT_ENDPOINT_AUDIO_SIZE);
    EXPECT_EQ(desc.wMaxPacketSize, 192);
    EXPECT_EQ(desc.bRefresh, 3);
    EXPECT_EQ(desc.bSynchAddress, 0x83);
}

TEST(USBDescriptorsTest, RejectsMissingEndpoint)
{
    std::vector<uint8_t> body = BuildInterfaceDescriptor(0, 0, 2);
    std::vector<uint8_t> endpoint = BuildEndpointDescriptor(0x81, USB1_TRANSFER_TYPE_BULK, 64);
    body.insert(body.end(), endpoint.begin(), endpoint.end());
    std::vector<uint8_t> raw = BuildConfigDescriptor(1, 1, body);

    EXPECT_THROW(ParseConfigDescriptor(raw.data(), raw.size()), USBError);
}

TEST(USBDescriptorsTest, RejectsZeroLengthDescriptor)
{
    std::vector<uint8_t> body = { 0x00, 0x24 };
    std::vector<uint8_t> raw = BuildConfigDescriptor(1, 0, body);

    try {
        ParseConfigDescriptor(raw.data(), raw.size());
        FAIL() << "Expected USBError";
    } catch (const USBError &e) {
        EXPECT_EQ(e.GetCode(), USB1_ERROR_IO);
    }
}

TEST(USBDescriptorsTest, RejectsMissingInterface)
{
    std::vector<uint8_t> raw = BuildConfigDescriptor(1, 2, BuildInterfaceDescriptor(0, 0, 0));

    EXPECT_THROW(ParseConfigDescriptor(raw.data(), raw.size()), USBError);
}

TEST(USBDescriptorsTest, MaxPowerDependsOnSpeed)
{
    std::vector<uint8_t> raw = BuildConfigDescriptor(1, 0, std::vector<uint8_t>(), 50);

    USBConfiguration config = ParseConfigDescriptor(raw.data(), raw.size());

    EXPECT_EQ(config.GetMaxPowerMilliAmps(USB1_SPEED_HIGH), 100u);
    EXPECT_EQ(config.GetMaxPowerMilliAmps(USB1_SPEED_SUPER), 400u);
}
