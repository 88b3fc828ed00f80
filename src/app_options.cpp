#include "app_options.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std::literals;

namespace {

std::stringstream create_arg_stream(int argc, const char* const argv[])
{
   std::stringstream arg_stream;

   for (auto i = 1; i < argc; ++i) {
      arg_stream << std::quoted(argv[i]) << ' ';
   }

   return arg_stream;
}

std::string read_value(std::istream& istream, std::string_view option)
{
   std::string str;

   if (!(istream >> std::quoted(str))) {
      throw std::invalid_argument{fmt::format("Option {} expects a value.", option)};
   }

   return str;
}

void append_directory_list(std::istream& istream, std::vector<std::string>& out)
{
   const auto list = read_value(istream, "-volumes"sv);

   for_each_substr(std::string_view{list}, ';',
                   [&out](std::string_view directory) { out.emplace_back(directory); });
}

std::istream& operator>>(std::istream& istream, Tool_mode& mode)
{
   const auto str = read_value(istream, "-mode"sv);

   if (str == "restore"sv) {
      mode = Tool_mode::restore;
   }
   else if (str == "list"sv) {
      mode = Tool_mode::list;
   }
   else {
      throw std::invalid_argument{"Invalid tool mode specified."};
   }

   return istream;
}
}

constexpr auto folder_opt_description{
   R"(<folder> Restore every volume found under this folder. A volume is a directory
   holding a BACKUPID.@@@ file, volumes are processed in path order.)"sv};

constexpr auto volume_opt_description{
   R"(<directory> Specify a single volume directory to restore.)"sv};

constexpr auto volumes_opt_description{
   R"(<directories> Specify a list of volume directories, delimited by ';'.
   Example: "-volumes disks/disk1;disks/disk2")"sv};

constexpr auto output_opt_description{
   R"(<directory> Set the directory restored files are written to. Default is the
   current directory.)"sv};

constexpr auto mode_opt_description{
   R"(<mode> Set the mode of operation for the tool. Can be 'restore' or 'list'.
   'restore' (default) - Reassemble the backed up files and write them out.
   'list' - Decode and print every volume header and file record without writing anything.)"sv};

constexpr auto verbose_opt_description{R"(Enable verbose output.)"sv};

App_options::App_options()
{
   using Istr = std::istream;

   _options = {
      {"-folder"s, [this](Istr& istr) { _folder = read_value(istr, "-folder"sv); },
       folder_opt_description},
      {"-volume"s,
       [this](Istr& istr) { _volumes.emplace_back(read_value(istr, "-volume"sv)); },
       volume_opt_description},
      {"-volumes"s, [this](Istr& istr) { append_directory_list(istr, _volumes); },
       volumes_opt_description},
      {"-output"s,
       [this](Istr& istr) { _output_directory = read_value(istr, "-output"sv); },
       output_opt_description},
      {"-mode"s, [this](Istr& istr) { istr >> _tool_mode; }, mode_opt_description},
      {"-verbose"s, [this](Istr&) { _verbose = true; }, verbose_opt_description}};
}

App_options::App_options(const int argc, const char* const argv[]) : App_options()
{
   auto arg_stream = create_arg_stream(argc, argv);

   while (arg_stream) {
      std::string arg;

      if (!(arg_stream >> std::quoted(arg))) break;

      const auto handler = find_option_handler(arg);

      if (!handler) {
         throw std::invalid_argument{fmt::format("Unknown option '{}'.", arg)};
      }

      (*handler)(arg_stream);
   }
}

auto App_options::volumes() const noexcept -> const std::vector<std::string>&
{
   return _volumes;
}

Tool_mode App_options::tool_mode() const noexcept
{
   return _tool_mode;
}

std::string App_options::folder() const noexcept
{
   return _folder;
}

std::string App_options::output_directory() const noexcept
{
   return _output_directory;
}

bool App_options::verbose() const noexcept
{
   return _verbose;
}

void App_options::print_arguments(std::ostream& ostream) noexcept
{
   ostream << '\n';

   for (const auto& option : _options) {
      ostream << ' ' << option.name << ' ';
      ostream.write(option.description.data(), option.description.length());
      ostream << '\n';
   }

   ostream << '\n';
}

auto App_options::find_option_handler(std::string_view name) noexcept
   -> App_options::Option_handler*
{
   const auto result =
      std::find_if(std::begin(_options), std::end(_options),
                   [name](const Option& option) { return (option.name == name); });

   if (result == std::end(_options)) return nullptr;

   return &result->handler;
}
