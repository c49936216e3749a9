#ifndef STRINGIO_H
#define STRINGIO_H

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace stringio {

/** String formatting. */
template<typename ... Args>
std::string format(const std::string& format, Args ... args);
/** Splits a string by a delimiter into an existing vector */
std::vector<std::string> &split(const std::string&, char, std::vector<std::string>&);
/** Splits a string by a delimiter into a new vector */
std::vector<std::string> split(const std::string&, char);
/** Splits a string into tokens separated by runs of whitespace. */
std::vector<std::string> splitWhitespace(const std::string&);
/** Joins strings using a separator. */
std::string join(const std::vector<std::string>&, const std::string& sep);
/** Checks if a string starts with a given prefix. */
bool startsWith(const std::string& s, const std::string& prefix);
/** Reads a line from a stream, dealing with different styles of line endings. */
std::istream& safeGetline(std::istream& is, std::string& t);
/**
 * Converts a string to a signed integer.
 * \returns true if the whole string was consumed, false otherwise.
 */
bool strToLong(const std::string& s, long& val);

/* Templated function definitions. */

template<typename ... Args>
std::string format( const std::string& format, Args ... args )
{
  size_t size = std::snprintf( nullptr, 0, format.c_str(), args ... ) + 1; // Extra space for '\0'
  std::unique_ptr<char[]> buf( new char[ size ] );
  std::snprintf( buf.get(), size, format.c_str(), args ... );
  return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
}

} /* namespace stringio */

#endif /*STRINGIO_H */
