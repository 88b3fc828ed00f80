#pragma once

#include <stdexcept>

//! \brief Thrown when a record is structurally unrecognisable and can not be decoded
//! at all, as opposed to a record that decodes with warnings.
class Format_error : public std::runtime_error {
public:
   using std::runtime_error::runtime_error;
};
