#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

template<typename Char_type, typename Function,
         typename Char_traits = std::char_traits<Char_type>>
inline void for_each_substr(
   typename std::common_type<std::basic_string_view<Char_type, Char_traits>>::type string,
   const Char_type delimiter, Function function)
{
   for (auto offset = string.find(delimiter); (offset != string.npos);
        offset = string.find(delimiter)) {
      if (offset != 0) function(string.substr(0, offset));

      string.remove_prefix(offset + 1);
   }

   if (!string.empty()) function(string);
}

constexpr char to_lower_ascii(const char c) noexcept
{
   if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');

   return c;
}

inline auto to_lower_ascii(std::string string) -> std::string
{
   std::transform(string.begin(), string.end(), string.begin(),
                  [](const char c) { return to_lower_ascii(c); });

   return string;
}

inline void replace_char(std::string& string, const char from, const char to) noexcept
{
   std::replace(string.begin(), string.end(), from, to);
}

//! Appends " ## (first, second)" to a description when there are any warnings.
inline void append_warnings(std::string& description,
                            const std::vector<std::string>& warnings)
{
   if (warnings.empty()) return;

   description += " ## (";

   for (std::size_t i = 0; i < warnings.size(); ++i) {
      if (i != 0) description += ", ";

      description += warnings[i];
   }

   description += ')';
}
