#include "app_options.hpp"
#include "file_writer.hpp"
#include "restore_session.hpp"
#include "volume_scanner.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;
using namespace std::literals;

const auto usage = R"(Usage: dos-unbackup <options>

Restores files from the volumes of a DOS 2.x BACKUP set.

Options:)"s;

void restore_volumes(const App_options& options, const std::vector<fs::path>& headers)
{
   File_writer writer{options.output_directory(), options.verbose()};
   Restore_session session{writer, options.verbose()};

   for (const auto& header : headers) {
      session.restore_volume(header);
   }

   session.print_report();
}

void list_records(const App_options&, const std::vector<fs::path>& headers)
{
   list_volumes(headers);
}

auto get_volume_processor(const Tool_mode mode)
   -> std::function<void(const App_options&, const std::vector<fs::path>&)>
{
   if (mode == Tool_mode::restore) return restore_volumes;
   if (mode == Tool_mode::list) return list_records;

   throw std::invalid_argument{"Unknown tool mode."};
}

int main(int argc, char* argv[])
{
   std::ios_base::sync_with_stdio(false);

   if (argc == 1) {
      std::cout << usage;
      App_options{0, nullptr}.print_arguments(std::cout);
      std::cout << '\n';

      return EXIT_FAILURE;
   }

   try {
      const App_options app_options{argc, argv};

      const auto headers =
         collect_volume_headers(app_options.folder(), app_options.volumes());

      if (headers.empty()) {
         std::cout << "Error: No input volume specified.\n"s;

         return EXIT_FAILURE;
      }

      get_volume_processor(app_options.tool_mode())(app_options, headers);
   }
   catch (std::exception& e) {
      std::cout << "Error: "s << e.what() << '\n';

      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}
