#include "PeakFile.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"
#include <fstream>

using namespace std;

namespace seqio {

PeakParseResult::PeakParseResult(PeakSchema schema)
: success(false), schema(schema), line_num(0) {}

PeakFile::PeakFile() : m_schema(SCHEMA_SUMMIT) {}

PeakFile::PeakFile(const string& filename) :
  m_filename(filename),
  m_schema(SCHEMA_SUMMIT)
{
  ifstream inputFile;
  inputFile.open(filename, ios::in);
  if (!inputFile.good())
    throw error::IOError("could not open peak file '" + filename + "'");
  this->read(inputFile, filename);
  inputFile.close();
}

void
PeakFile::read(istream& input, const string& name) {
  vector<string> lines;
  vector<size_t> line_nums;
  string line;
  size_t line_num = 0;

  while (stringio::safeGetline(input, line)) {
    line_num++;
    // skip header and empty lines
    if (line.find_first_not_of(" \t") == string::npos) continue;
    if (line[0] == '#') continue;
    if (stringio::startsWith(line, "track") || stringio::startsWith(line, "browser")) continue;
    lines.push_back(line);
    line_nums.push_back(line_num);
  }
  if (input.bad())
    throw error::IOError("error reading peak file '" + name + "'");

  PeakParseResult res = parseLines(lines, line_nums, SCHEMA_SUMMIT);
  if (!res.success) {
    PeakParseResult res_basic = parseLines(lines, line_nums, SCHEMA_BASIC);
    if (!res_basic.success) {
      throw error::ParseError(stringio::format(
        "could not parse peak file '%s' (line %lu: %s)",
        name.c_str(), res_basic.line_num, res_basic.message.c_str()));
    }
    res = res_basic;
  }

  m_schema = res.schema;
  m_vec_peaks = res.peaks;
}

PeakParseResult
PeakFile::parseLines (
  const vector<string>& lines,
  const vector<size_t>& line_nums,
  const PeakSchema schema
) {
  PeakParseResult res(schema);
  size_t min_cols = (schema == SCHEMA_SUMMIT ? 10 : 3);

  for (size_t i=0; i<lines.size(); ++i) {
    vector<string> row = stringio::splitWhitespace(lines[i]);
    long start, end, summit = 0;
    if (row.size() < min_cols) {
      res.line_num = line_nums[i];
      res.message = stringio::format("expected at least %lu columns, found %lu", min_cols, row.size());
      res.peaks.clear();
      return res;
    }
    if (!stringio::strToLong(row[1], start) || !stringio::strToLong(row[2], end) ||
        (schema == SCHEMA_SUMMIT && !stringio::strToLong(row[9], summit))) {
      res.line_num = line_nums[i];
      res.message = "non-integer coordinate";
      res.peaks.clear();
      return res;
    }
    if (end < start) {
      res.line_num = line_nums[i];
      res.message = "end coordinate lies before start coordinate";
      res.peaks.clear();
      return res;
    }
    res.peaks.push_back(Peak(row[0], start, end, summit));
  }

  res.success = true;
  return res;
}

size_t
PeakFile::filterChromosomes(const set<string>& chr_allowlist) {
  vector<Peak> keep;
  for (auto const & peak : m_vec_peaks)
    if (chr_allowlist.count(peak.id_chr) > 0)
      keep.push_back(peak);
  size_t num_removed = m_vec_peaks.size() - keep.size();
  m_vec_peaks.swap(keep);
  return num_removed;
}

vector<Window>
PeakFile::getWindows(const TCoord width) const {
  vector<Window> windows;
  for (auto const & peak : m_vec_peaks)
    windows.push_back(peak.centeredWindow(width));
  return windows;
}

} /* namespace seqio */
