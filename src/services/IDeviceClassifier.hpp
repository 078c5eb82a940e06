/**
 * @file IDeviceClassifier.hpp
 * @brief Interface for device classification and the block-device safety check
 */

#pragma once

#include "models/DeviceInfo.hpp"
#include "util/Error.hpp"

#include <expected>
#include <string>

/**
 * @class IDeviceClassifier
 * @brief Query-only view of storage devices
 *
 * Implementations never modify the device. classify() and
 * ensure_block_device() are the gate every destructive operation passes
 * through.
 */
class IDeviceClassifier {
public:
    virtual ~IDeviceClassifier() = default;

    /**
     * @brief Classify a device path
     * @param path Device path (e.g., /dev/nvme0n1)
     * @return DeviceInfo, or DEVICE_NOT_FOUND / NOT_A_BLOCK_DEVICE
     */
    [[nodiscard]] virtual auto classify(const std::string& path)
        -> std::expected<DeviceInfo, util::Error> = 0;

    /**
     * @brief Verify that a path is an existing block-special file
     * @param path Device path
     * @return Empty on success, DEVICE_NOT_FOUND or NOT_A_BLOCK_DEVICE otherwise
     */
    [[nodiscard]] virtual auto ensure_block_device(const std::string& path)
        -> std::expected<void, util::Error> = 0;
};
