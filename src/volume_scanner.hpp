#pragma once

#include <filesystem>
#include <string>
#include <vector>

//! \brief Finds every volume header file (BACKUPID.@@@) below a directory.
//!
//! \return The header paths, sorted.
//!
//! \exception std::invalid_argument Thrown when the directory does not exist.
auto gather_volume_headers(const std::filesystem::path& directory)
   -> std::vector<std::filesystem::path>;

//! \brief Lists the fragment record files of a volume directory.
//!
//! Every regular file below the directory is a fragment record except the volume
//! header itself, disk images (*.img) and cmd.sh.
//!
//! \return The fragment file paths, sorted.
auto list_fragment_files(const std::filesystem::path& volume_directory)
   -> std::vector<std::filesystem::path>;

bool is_volume_header_file(const std::filesystem::path& path);

//! \brief Builds the list of volume headers to process.
//!
//! The headers gathered below folder come first, sorted, followed by the header of
//! every directory in volumes in the order given. An empty folder is not searched.
auto collect_volume_headers(const std::filesystem::path& folder,
                            const std::vector<std::string>& volumes)
   -> std::vector<std::filesystem::path>;
