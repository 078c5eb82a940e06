#include "services/DeviceClassifier.hpp"

#include "util/Logger.hpp"

// Standard library
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <utility>

// System headers
#include <sys/stat.h>

#include <mntent.h>

namespace fs = std::filesystem;

namespace {
constexpr auto BYTES_PER_SECTOR = uint64_t{512};

auto is_digit(char c) noexcept -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto trim(std::string value) -> std::string {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

// Kernel name for a device path; follows /dev/disk/by-id style symlinks.
auto kernel_name(const std::string& path) -> std::string {
    std::error_code ec;
    const auto resolved = fs::canonical(path, ec);
    return (ec ? fs::path{path} : resolved).filename().string();
}

}  // namespace

DeviceClassifier::DeviceClassifier(fs::path sysfs_block_dir, fs::path mount_table, NodeStat node_stat)
    : sysfs_block_dir_(std::move(sysfs_block_dir)), mount_table_(std::move(mount_table)),
      node_stat_(std::move(node_stat)) {
    if (!node_stat_) {
        node_stat_ = [](const char* path, struct stat* st) { return ::stat(path, st); };
    }
}

auto DeviceClassifier::is_partition_of(std::string_view device, std::string_view candidate) -> bool {
    if (device.empty() || candidate.size() <= device.size() || !candidate.starts_with(device)) {
        return false;
    }
    auto suffix = candidate.substr(device.size());
    // Names ending in a digit separate the partition number with 'p'
    if (is_digit(device.back())) {
        if (suffix.front() != 'p') {
            return false;
        }
        suffix.remove_prefix(1);
    }
    return !suffix.empty() && std::ranges::all_of(suffix, is_digit);
}

auto DeviceClassifier::ensure_block_device(const std::string& path)
    -> std::expected<void, util::Error> {
    if (path.empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::DEVICE_NOT_FOUND, "Device path is empty"});
    }

    struct stat st{};
    if (node_stat_(path.c_str(), &st) != 0) {
        const int err = errno;
        return std::unexpected(util::Error{
            util::ErrorKind::DEVICE_NOT_FOUND,
            std::format("Device {} not found: {}", path, std::strerror(err)), err});
    }
    if (!S_ISBLK(st.st_mode)) {
        LOG_ERROR("DeviceClassifier",
                  std::format("Refusing {}: not a block device (mode {:o})", path, st.st_mode));
        return std::unexpected(util::Error{util::ErrorKind::NOT_A_BLOCK_DEVICE,
                                           std::format("{} is not a block device", path)});
    }
    return {};
}

auto DeviceClassifier::classify(const std::string& path) -> std::expected<DeviceInfo, util::Error> {
    if (auto valid = ensure_block_device(path); !valid) {
        return std::unexpected(valid.error());
    }

    const auto name = kernel_name(path);

    DeviceInfo info{.path = path,
                    .vendor = {},
                    .model = {},
                    .serial = {},
                    .size_bytes = 0,
                    .is_mounted = false,
                    .mount_point = {},
                    .category = category_for_name(name),
                    .rotational = read_rotational(name)};

    info.vendor = read_attribute(name, "device/vendor").value_or("");
    info.model = read_attribute(name, "device/model").value_or("");
    info.serial = read_attribute(name, "device/serial").value_or("");

    if (const auto sectors = read_attribute(name, "size")) {
        try {
            const auto count = std::stoull(*sectors);
            if (count <= UINT64_MAX / BYTES_PER_SECTOR) {
                info.size_bytes = count * BYTES_PER_SECTOR;
            }
        } catch (const std::exception& e) {
            LOG_WARNING("DeviceClassifier",
                        std::format("Unreadable size for {}: {}", path, e.what()));
        }
    }

    const auto mounts = parse_mount_table();
    auto mount = find_mount(mounts, (fs::path{"/dev"} / name).string());
    if (!mount) {
        mount = find_mount(mounts, path);
    }
    if (mount) {
        info.is_mounted = true;
        info.mount_point = mount->mount_point;
    }

    LOG_DEBUG("DeviceClassifier",
              std::format("{}: category={} media={} model='{}' size={} mounted={}", path,
                          to_string(info.category), to_string(info.rotational), info.model,
                          info.size_bytes, info.is_mounted));
    return info;
}

auto DeviceClassifier::category_for_name(std::string_view device_name) -> DeviceCategory {
    if (device_name.starts_with("nvme")) {
        return DeviceCategory::NVME;
    }
    if (device_name.starts_with("sd") || device_name.starts_with("hd")) {
        return DeviceCategory::SATA;
    }
    return DeviceCategory::OTHER;
}

auto DeviceClassifier::read_rotational(const std::string& device_name) const -> RotationalState {
    const auto value = read_attribute(device_name, "queue/rotational");
    if (!value) {
        return RotationalState::UNKNOWN;
    }
    if (*value == "1") {
        return RotationalState::ROTATIONAL;
    }
    if (*value == "0") {
        return RotationalState::SOLID_STATE;
    }
    return RotationalState::UNKNOWN;
}

auto DeviceClassifier::read_attribute(const std::string& device_name,
                                      std::string_view attribute) const
    -> std::optional<std::string> {
    std::ifstream file{sysfs_block_dir_ / device_name / attribute};
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string value;
    if (!std::getline(file, value)) {
        return std::nullopt;
    }
    return trim(std::move(value));
}

auto DeviceClassifier::parse_mount_table() const -> std::vector<MountEntry> {
    std::vector<MountEntry> entries;

    auto mtab_deleter = [](FILE* f) {
        if (f)
            ::endmntent(f);
    };

    std::unique_ptr<FILE, decltype(mtab_deleter)> mtab{::setmntent(mount_table_.c_str(), "r"),
                                                       mtab_deleter};
    if (!mtab) {
        LOG_WARNING("DeviceClassifier",
                    std::format("Cannot read mount table {}", mount_table_.string()));
        return entries;
    }

    while (auto* entry = ::getmntent(mtab.get())) {
        entries.push_back(MountEntry{
            .device = entry->mnt_fsname,
            .mount_point = entry->mnt_dir,
            .filesystem = entry->mnt_type,
        });
    }
    return entries;
}

auto DeviceClassifier::find_mount(const std::vector<MountEntry>& entries,
                                  const std::string& device_path) -> std::optional<MountEntry> {
    for (const auto& entry : entries) {
        if (entry.device == device_path || is_partition_of(device_path, entry.device)) {
            return entry;
        }
    }
    return std::nullopt;
}
