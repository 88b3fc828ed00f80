#include "volume_scanner.hpp"
#include "record_layout.hpp"
#include "synced_cout.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

bool is_ignored_file(const fs::path& path)
{
   if (is_volume_header_file(path)) return true;
   if (path.extension() == ".img") return true;

   return path.filename() == "cmd.sh";
}

void check_directory(const fs::path& directory)
{
   if (!fs::is_directory(directory)) {
      throw std::invalid_argument{
         fmt::format("Directory '{}' does not exist.", directory.string())};
   }
}
}

bool is_volume_header_file(const fs::path& path)
{
   return path.filename() == fs::path{record_layout::header::file_name};
}

auto gather_volume_headers(const fs::path& directory) -> std::vector<fs::path>
{
   check_directory(directory);

   std::vector<fs::path> headers;

   for (const auto& entry : fs::recursive_directory_iterator{directory}) {
      if (entry.is_regular_file() && is_volume_header_file(entry.path())) {
         headers.push_back(entry.path());
      }
   }

   std::sort(headers.begin(), headers.end());

   return headers;
}

auto list_fragment_files(const fs::path& volume_directory) -> std::vector<fs::path>
{
   check_directory(volume_directory);

   std::vector<fs::path> files;

   for (const auto& entry : fs::recursive_directory_iterator{volume_directory}) {
      if (entry.is_regular_file() && !is_ignored_file(entry.path())) {
         files.push_back(entry.path());
      }
   }

   std::sort(files.begin(), files.end());

   return files;
}

auto collect_volume_headers(const fs::path& folder, const std::vector<std::string>& volumes)
   -> std::vector<fs::path>
{
   std::vector<fs::path> headers;

   if (!folder.empty()) {
      headers = gather_volume_headers(folder);

      if (headers.empty()) {
         synced_cout::print("Warning: No volume found under '"s, folder.string(), "'.\n"s);
      }
   }

   for (const auto& volume : volumes) {
      headers.push_back(fs::path{volume} / fs::path{record_layout::header::file_name});
   }

   return headers;
}
