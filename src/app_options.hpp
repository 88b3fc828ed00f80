#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

enum class Tool_mode { restore, list };

class App_options {
public:
   App_options(const App_options&) = delete;
   App_options& operator=(const App_options&) = delete;
   App_options(App_options&&) = delete;
   App_options& operator=(App_options&&) = delete;

   //! \exception std::invalid_argument Thrown on an unknown option or a bad value.
   App_options(const int argc, const char* const argv[]);

   //! \brief Volume directories named directly on the command line.
   auto volumes() const noexcept -> const std::vector<std::string>&;

   Tool_mode tool_mode() const noexcept;

   std::string folder() const noexcept;

   std::string output_directory() const noexcept;

   bool verbose() const noexcept;

   void print_arguments(std::ostream& ostream) noexcept;

private:
   App_options();

   using Option_handler = std::function<void(std::istream&)>;

   struct Option {
      std::string name;
      Option_handler handler;
      std::string_view description;
   };

   auto find_option_handler(std::string_view name) noexcept -> Option_handler*;

   std::vector<Option> _options;

   std::vector<std::string> _volumes;
   Tool_mode _tool_mode = Tool_mode::restore;
   std::string _folder;
   std::string _output_directory = ".";
   bool _verbose = false;
};
