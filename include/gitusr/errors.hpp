#pragma once
#include <stdexcept>
#include <string>

namespace gitusr {

// Base of every error the tool reports to the user.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Profiles file could not be read or written.
class IoError : public Error {
public:
  using Error::Error;
};

// Profiles file is not a JSON object of profiles.
class ParseError : public Error {
public:
  using Error::Error;
};

// Unknown profile name.
class NotFoundError : public Error {
public:
  using Error::Error;
};

// Missing or unsupported user input.
class ValidationError : public Error {
public:
  using Error::Error;
};

// git could not be launched or exited with a failure status.
class ExternalToolError : public Error {
public:
  using Error::Error;
};

} // namespace gitusr
