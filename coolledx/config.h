#ifndef __COOLLEDX_CONFIG_H__
#define __COOLLEDX_CONFIG_H__

#include <string>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace coolledx {

// panel fallback when the advertisement carries no usable size
const std::uint16_t kDefaultWidth  = 96;
const std::uint16_t kDefaultHeight = 16;

// text rendering
const std::string kDefaultFont             = "arial";
const int         kDefaultFontSize         = 13;
const std::string kDefaultColor            = "white";
const std::string kDefaultBackgroundColor  = "black";
const std::string kDefaultStartColorMarker = "<";
const std::string kDefaultEndColorMarker   = ">";

const int kDefaultAnimationSpeed = 512;

// link
const std::chrono::milliseconds kDefaultConnectionTimeout(10000);
const std::chrono::milliseconds kDefaultAckTimeout(1000);
const int                       kDefaultConnectionRetries = 5;
const std::chrono::milliseconds kDefaultRetryDelay(1000);

const std::string kDefaultDeviceName         = "CoolLEDX";
const std::string kDefaultCharacteristicUuid = "0000fff1-0000-1000-8000-00805f9b34fb";

// manufacturer data: height at byte 6, width at byte 8
const std::size_t kMinManufacturerDataLength = 9;
const std::size_t kManufacturerHeightOffset  = 6;
const std::size_t kManufacturerWidthOffset   = 8;

}

#endif
