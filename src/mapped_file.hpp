#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <filesystem>
#include <memory>

//! \brief A read-only memory mapping of a whole file.
//!
//! Copies share the mapping, which is released with the last copy. Empty files are
//! valid and map to an empty span.
class Mapped_file {

public:
    Mapped_file() = default;
    explicit Mapped_file(const std::filesystem::path& path);

    gsl::span<const std::byte> bytes() const noexcept;

private:
    std::size_t _size = 0;
    std::shared_ptr<const std::byte> _view;
};
