#pragma once

#include "models/DeviceInfo.hpp"
#include "services/IDeviceClassifier.hpp"

#include <format>

namespace device_policy {

/**
 * @brief Last gate before any destructive command touches a device
 *
 * Re-checks that the path is still block-special (the classification may be
 * stale by the time the device is reached) and refuses mounted devices.
 */
inline auto validate_sanitize_target(IDeviceClassifier& classifier, const DeviceInfo& device)
    -> std::expected<void, util::Error> {
    if (device.path.empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::DEVICE_NOT_FOUND, "Device path is empty"});
    }

    if (auto valid = classifier.ensure_block_device(device.path); !valid) {
        return std::unexpected(valid.error());
    }

    if (device.is_mounted) {
        return std::unexpected(util::Error{
            util::ErrorKind::DEVICE_BUSY,
            std::format("{} is mounted at {}. Unmount before sanitizing.", device.path,
                        device.mount_point.empty() ? "an unknown location" : device.mount_point)});
    }

    return {};
}

} // namespace device_policy
