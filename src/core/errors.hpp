#ifndef ERRORS_H
#define ERRORS_H

#include <exception>
#include <stdexcept>
#include <string>

/** Exceptions raised by PeakMers components. */
namespace error {

/** Invalid or inconsistent user parameters (e.g. even window width). */
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Input file content could not be interpreted. */
class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
};

/** A genomic window lies (partly) outside its chromosome. */
class BoundsError : public std::runtime_error {
public:
  explicit BoundsError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Not enough data (rows or label classes) to train or evaluate. */
class InsufficientDataError : public std::runtime_error {
public:
  explicit InsufficientDataError(const std::string& msg) : std::runtime_error(msg) {}
};

/** A file could not be opened, read or written. */
class IOError : public std::runtime_error {
public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Name of an error type, used when reporting errors to the user. */
inline const char* errorName(const std::exception& e) {
  if (dynamic_cast<const ConfigurationError*>(&e))    return "ConfigurationError";
  if (dynamic_cast<const ParseError*>(&e))            return "ParseError";
  if (dynamic_cast<const BoundsError*>(&e))           return "BoundsError";
  if (dynamic_cast<const InsufficientDataError*>(&e)) return "InsufficientDataError";
  if (dynamic_cast<const IOError*>(&e))               return "IOError";
  return "Error";
}

} /* namespace error */

#endif /* ERRORS_H */
