#pragma once

#include <fmt/format.h>

#include <iostream>
#include <mutex>
#include <utility>

// Console output shared by the decode workers and the restore loop. Messages carry
// their level as a prefix: "Info: ", "Warning: " or "Error: ".

namespace synced_cout {

namespace detail {
inline std::mutex& cout_mutex() noexcept
{
   static std::mutex mutex;

   return mutex;
}

inline std::ostream*& output_stream() noexcept
{
   static std::ostream* stream = &std::cout;

   return stream;
}
}

//! \brief Sends all further output to another stream, std::cout by default.
inline void redirect(std::ostream& stream) noexcept
{
   std::lock_guard<std::mutex> lock{detail::cout_mutex()};

   detail::output_stream() = &stream;
}

template<typename... Args>
inline void print(Args&&... args)
{
   std::lock_guard<std::mutex> lock{detail::cout_mutex()};

   auto& stream = *detail::output_stream();

   (stream << ... << std::forward<Args>(args));
}

template<typename... Args>
inline void print_line(fmt::format_string<Args...> format, Args&&... args)
{
   auto line = fmt::format(format, std::forward<Args>(args)...);
   line += '\n';

   print(line);
}
}
