/**
 * @file DeviceInfo.hpp
 * @brief Data model for a classified storage device
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * @enum DeviceCategory
 * @brief Device family, derived from the kernel device name
 */
enum class DeviceCategory {
    NVME,   ///< nvme* namespaces
    SATA,   ///< sd* / hd* devices (SATA, SAS, USB-SATA bridges)
    OTHER   ///< Everything else (virtio, mmc, loop, ...)
};

/**
 * @enum RotationalState
 * @brief Media type as reported by the block layer
 */
enum class RotationalState {
    ROTATIONAL,   ///< Spinning magnetic media
    SOLID_STATE,  ///< Flash media
    UNKNOWN       ///< Indicator missing or unreadable
};

[[nodiscard]] constexpr auto to_string(DeviceCategory category) -> std::string_view {
    switch (category) {
        case DeviceCategory::NVME:
            return "NVMe";
        case DeviceCategory::SATA:
            return "SATA";
        case DeviceCategory::OTHER:
            return "Other";
    }
    return "Other";
}

[[nodiscard]] constexpr auto to_string(RotationalState state) -> std::string_view {
    switch (state) {
        case RotationalState::ROTATIONAL:
            return "HDD";
        case RotationalState::SOLID_STATE:
            return "SSD";
        case RotationalState::UNKNOWN:
            return "Unknown";
    }
    return "Unknown";
}

/**
 * @struct DeviceInfo
 * @brief A device as seen at the start of a job
 *
 * Re-derived by the classifier on every job start and never mutated while
 * the job runs.
 */
struct DeviceInfo {
    std::string path;           ///< Device path (e.g., /dev/sda)
    std::string vendor;         ///< Vendor string from sysfs, trimmed (often empty for NVMe)
    std::string model;          ///< Model string from sysfs, trimmed
    std::string serial;         ///< Serial number from sysfs, trimmed
    uint64_t size_bytes = 0;    ///< Capacity in bytes
    bool is_mounted = false;    ///< Device or one of its partitions is mounted
    std::string mount_point;    ///< First mount point found
    DeviceCategory category = DeviceCategory::OTHER;
    RotationalState rotational = RotationalState::UNKNOWN;

    auto operator==(const DeviceInfo&) const -> bool = default;
};
