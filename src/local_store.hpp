#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

enum class Location {
    TEMP,
    FINAL
};

// Partial files live in the temp directory and are moved into the download
// directory in one rename once complete. Both use the target's display name.
class LocalStore {
public:
    LocalStore(std::filesystem::path temp_dir, std::filesystem::path download_dir);

    void prepare() const;

    std::filesystem::path path_for(const std::string& name, Location location) const;
    std::uint64_t existing_bytes(const std::string& name, Location location) const;

    std::ofstream open_for_append(const std::string& name) const;
    std::ofstream open_for_write(const std::string& name) const;

    void finalize(const std::string& name) const;
    void discard_partial(const std::string& name) const;
    // Removes a final file that does not belong to a completed download.
    // Returns whether there was one.
    bool discard_final(const std::string& name) const;
    bool is_already_complete(const std::string& name, std::uint64_t total_size) const;

private:
    std::ofstream open(const std::string& name, std::ios::openmode mode) const;

    std::filesystem::path temp_dir_;
    std::filesystem::path download_dir_;
};
