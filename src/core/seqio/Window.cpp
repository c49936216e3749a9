#include "Window.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"

using namespace std;

namespace seqio {

Window::Window() : start(0), end(0) {}

Window::Window(const string& id_chr, TCoord start, TCoord end)
: id_chr(id_chr), start(start), end(end) {}

TCoord Window::width() const {
  return end - start + 1;
}

string Window::id() const {
  return stringio::format("%s:%ld-%ld", id_chr.c_str(), start, end);
}

bool Window::overlaps(const Window& other) const {
  return id_chr == other.id_chr && start <= other.end && other.start <= end;
}

bool Window::fromId(const string& id, Window& out) {
  size_t pos_colon = id.rfind(':');
  if (pos_colon == string::npos || pos_colon == 0)
    return false;
  string coords = id.substr(pos_colon+1);
  // start may not be negative, so the first '-' separates start and end
  size_t pos_dash = coords.find('-');
  if (pos_dash == string::npos)
    return false;
  long start, end;
  if (!stringio::strToLong(coords.substr(0, pos_dash), start) ||
      !stringio::strToLong(coords.substr(pos_dash+1), end))
    return false;
  if (end < start)
    return false;
  out = Window(id.substr(0, pos_colon), start, end);
  return true;
}

bool operator==(const Window& lhs, const Window& rhs) {
  return lhs.id_chr == rhs.id_chr && lhs.start == rhs.start && lhs.end == rhs.end;
}

Peak::Peak() : start(0), end(0), summit(0) {}

Peak::Peak(const string& id_chr, TCoord start, TCoord end, TCoord summit)
: id_chr(id_chr), start(start), end(end), summit(summit) {}

Window Peak::centeredWindow(TCoord width) const {
  checkWindowWidth(width);
  TCoord center = start + summit;
  TCoord half = (width-1) / 2;
  return Window(id_chr, center-half, center+half);
}

void checkWindowWidth(TCoord width) {
  if (width < 1 || width % 2 == 0)
    throw error::ConfigurationError(
      stringio::format("window width must be a positive odd number (got %ld)", width));
}

} // namespace seqio
