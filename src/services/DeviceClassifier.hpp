#pragma once

#include "services/IDeviceClassifier.hpp"

#include <sys/stat.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief One line of the mount table
 */
struct MountEntry {
    std::string device;       // e.g., "/dev/sda1"
    std::string mount_point;  // e.g., "/home"
    std::string filesystem;   // e.g., "ext4"
};

/**
 * @brief stat(2)-compatible lookup of a device node: 0 on success, -1 with errno set
 */
using NodeStat = std::function<int(const char* path, struct stat* st)>;

class DeviceClassifier : public IDeviceClassifier {
public:
    static constexpr auto DEFAULT_SYSFS_BLOCK_DIR = "/sys/block";
    static constexpr auto DEFAULT_MOUNT_TABLE = "/proc/mounts";

    /**
     * @param sysfs_block_dir Directory holding one entry per block device
     * @param mount_table File in /proc/mounts format
     * @param node_stat Lookup used for the block-special check; stat(2) when empty
     */
    explicit DeviceClassifier(std::filesystem::path sysfs_block_dir = DEFAULT_SYSFS_BLOCK_DIR,
                              std::filesystem::path mount_table = DEFAULT_MOUNT_TABLE,
                              NodeStat node_stat = {});

    /**
     * @brief Whether @p candidate names a partition of the kernel device @p device
     *
     * "sda" owns "sda1"; "nvme0n1" and "mmcblk0" own "nvme0n1p2" and
     * "mmcblk0p1". A sibling such as "nvme0n10" or "loop10" is not a partition.
     */
    [[nodiscard]] static auto is_partition_of(std::string_view device, std::string_view candidate)
        -> bool;

    [[nodiscard]] auto classify(const std::string& path)
        -> std::expected<DeviceInfo, util::Error> override;
    [[nodiscard]] auto ensure_block_device(const std::string& path)
        -> std::expected<void, util::Error> override;

    /**
     * @brief Category from the kernel device name ("nvme0n1", "sda", "vdb")
     */
    [[nodiscard]] static auto category_for_name(std::string_view device_name) -> DeviceCategory;

    /**
     * @brief Read queue/rotational for a device name
     * @return UNKNOWN when the indicator is missing or unreadable
     */
    [[nodiscard]] auto read_rotational(const std::string& device_name) const -> RotationalState;

private:
    [[nodiscard]] auto read_attribute(const std::string& device_name,
                                      std::string_view attribute) const
        -> std::optional<std::string>;

    [[nodiscard]] auto parse_mount_table() const -> std::vector<MountEntry>;

    [[nodiscard]] static auto find_mount(const std::vector<MountEntry>& entries,
                                         const std::string& device_path)
        -> std::optional<MountEntry>;

    std::filesystem::path sysfs_block_dir_;
    std::filesystem::path mount_table_;
    NodeStat node_stat_;
};
