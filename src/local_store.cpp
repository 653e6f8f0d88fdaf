#include "local_store.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

LocalStore::LocalStore(fs::path temp_dir, fs::path download_dir)
    : temp_dir_(std::move(temp_dir)), download_dir_(std::move(download_dir)) {}

void LocalStore::prepare() const {
    ensure_dir_exists(temp_dir_);
    ensure_dir_exists(download_dir_);
}

fs::path LocalStore::path_for(const std::string& name, Location location) const {
    return (location == Location::TEMP ? temp_dir_ : download_dir_) / name;
}

std::uint64_t LocalStore::existing_bytes(const std::string& name, Location location) const {
    std::error_code ec;
    const fs::path path = path_for(name, location);
    if (!fs::is_regular_file(path, ec)) {
        return 0;
    }
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::ofstream LocalStore::open(const std::string& name, std::ios::openmode mode) const {
    ensure_dir_exists(temp_dir_);
    const fs::path path = path_for(name, Location::TEMP);
    std::ofstream file(path, mode);
    if (!file) {
        throw RdlException(string_format("error.create_file_failed", path.string()) + ": " + strerror(errno));
    }
    return file;
}

std::ofstream LocalStore::open_for_append(const std::string& name) const {
    return open(name, std::ios::binary | std::ios::app);
}

std::ofstream LocalStore::open_for_write(const std::string& name) const {
    return open(name, std::ios::binary | std::ios::trunc);
}

void LocalStore::finalize(const std::string& name) const {
    ensure_dir_exists(download_dir_);
    const fs::path from = path_for(name, Location::TEMP);
    const fs::path to = path_for(name, Location::FINAL);

    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw RdlException(string_format("error.finalize_failed", from.string(), to.string(), ec.message()));
    }

    // Different filesystems: stage a copy beside the destination so the
    // final name still appears in a single rename.
    const fs::path staging = download_dir_ / ("." + name + ".part");
    try {
        fs::copy_file(from, staging, fs::copy_options::overwrite_existing);
        fs::rename(staging, to);
        fs::remove(from);
    } catch (const fs::filesystem_error& e) {
        fs::remove(staging, ec);
        throw RdlException(string_format("error.finalize_failed", from.string(), to.string(), e.what()));
    }
}

void LocalStore::discard_partial(const std::string& name) const {
    std::error_code ec;
    fs::remove(path_for(name, Location::TEMP), ec);
    if (ec) {
        throw RdlException(string_format("error.remove_file_failed", path_for(name, Location::TEMP).string(), ec.message()));
    }
}

bool LocalStore::discard_final(const std::string& name) const {
    const fs::path path = path_for(name, Location::FINAL);
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        throw RdlException(string_format("error.remove_file_failed", path.string(), ec.message()));
    }
    return removed;
}

bool LocalStore::is_already_complete(const std::string& name, std::uint64_t total_size) const {
    if (total_size == 0) {
        return false;
    }
    std::error_code ec;
    if (!fs::exists(path_for(name, Location::FINAL), ec)) {
        return false;
    }
    return existing_bytes(name, Location::FINAL) == total_size;
}
