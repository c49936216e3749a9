#include "stringio.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

using namespace std;

namespace stringio {

vector<string> &split(const string &s, char delim, vector<string> &elems) {
    stringstream ss(s);
    string item;
    while (std::getline(ss, item, delim)) {
        elems.push_back(item);
    }
    return elems;
}

vector<string> split(const string &s, char delim) {
    vector<string> elems;
    split(s, delim, elems);
    return elems;
}

vector<string> splitWhitespace(const string &s) {
  vector<string> tokens;
  size_t pos = 0;
  while (pos < s.length()) {
    while (pos < s.length() && isspace(static_cast<unsigned char>(s[pos])))
      ++pos;
    size_t start = pos;
    while (pos < s.length() && !isspace(static_cast<unsigned char>(s[pos])))
      ++pos;
    if (pos > start)
      tokens.push_back(s.substr(start, pos-start));
  }
  return tokens;
}

string join(const vector<string>& parts, const string& sep) {
  string res;
  for (size_t i=0; i<parts.size(); ++i) {
    if (i > 0) res += sep;
    res += parts[i];
  }
  return res;
}

bool startsWith(const string& s, const string& prefix) {
  return s.compare(0, prefix.length(), prefix) == 0;
}

/** Deals with different line endings used on Linux, Mac, Windows platforms */
istream& safeGetline(istream& is, string& t)
{
    t.clear();

    // The characters in the stream are read one-by-one using a std::streambuf.
    // That is faster than reading them one-by-one using the std::istream.
    // Code that uses streambuf this way must be guarded by a sentry object.
    // The sentry object performs various tasks,
    // such as thread synchronization and updating the stream state.

    istream::sentry se(is, true);
    streambuf* sb = is.rdbuf();

    for(;;) {
        int c = sb->sbumpc();
        switch (c) {
        case '\n':
            return is;
        case '\r':
            if(sb->sgetc() == '\n')
                sb->sbumpc();
            return is;
        case EOF:
            // Also handle the case when the last line has no line ending
            if(t.empty())
                is.setstate(ios::eofbit | ios::failbit);
            return is;
        default:
            t += (char)c;
        }
    }
}

bool strToLong(const string& s, long& val) {
  if (s.empty())
    return false;
  const char* begin = s.c_str();
  char* end = nullptr;
  errno = 0;
  long res = strtol(begin, &end, 10);
  if (errno != 0 || end == begin || *end != '\0')
    return false;
  val = res;
  return true;
}

} /* namespace stringio */
