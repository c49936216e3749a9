#include "seqio.hpp"
#include "errors.hpp"
#include <fstream>

using namespace std;

namespace seqio {

void readFasta (
  vector<shared_ptr<SeqRecord>> &records, 
  const string& filename,
  const bool use_allowlist,
  const TChromSet& chr_allowlist
) {
  ifstream inputFile;
  inputFile.open(filename, ios::in);
  if (!inputFile.good())
    throw error::IOError("could not open FASTA file '" + filename + "'");
  readFasta(records, inputFile, use_allowlist, chr_allowlist);
  if (inputFile.bad())
    throw error::IOError("error reading FASTA file '" + filename + "'");
  inputFile.close();
}

void readFasta (
  vector<shared_ptr<SeqRecord>> &records, 
  istream &input,
  const bool use_allowlist,
  const TChromSet& chr_allowlist
) {
  string header;
  string seq;
  string line;

  // skip leading empty lines, first non-empty line must be a header
  while (stringio::safeGetline(input, header) && header.empty()) {}
  if (header.empty())
    return;
  if (header[0] != '>')
    throw error::ParseError("FASTA input does not start with a header line ('>')");

  bool done = false;
  while (!done) {
    // read sequence data
    done = true;
    while (stringio::safeGetline(input, line)) {
      if (line.length()>0 && line[0]=='>') {
        done = false;
        break;
      }
      seq += line;
    }

    // parse header line
    size_t space_pos = header.find_first_of(" \t");
    string seq_id = header.substr(1, space_pos == string::npos ? string::npos : space_pos-1);
    string seq_desc = (space_pos == string::npos ? "" : header.substr(space_pos+1));
    if (seq_id.empty())
      throw error::ParseError("FASTA header without sequence identifier");

    // check if record in list of sequences to import
    if (!use_allowlist || chr_allowlist.count(seq_id) > 0) {
      records.push_back(make_shared<SeqRecord>(seq_id, seq_desc, seq));
    }

    header = line;
    seq = "";
  }
}

SeqCollection readSeqCollection(const string& filename) {
  vector<shared_ptr<SeqRecord>> records;
  readFasta(records, filename);
  SeqCollection coll;
  for (auto const & rec : records)
    coll.add(rec);
  return coll;
}

SeqCollection readSeqCollection(istream& input) {
  vector<shared_ptr<SeqRecord>> records;
  readFasta(records, input);
  SeqCollection coll;
  for (auto const & rec : records)
    coll.add(rec);
  return coll;
}

/** Write SeqRecords to FASTA file, using a defined line width. */
int writeFasta(
  const vector<shared_ptr<SeqRecord>>& sequences,
  const string filename,
  int line_width)
{
  int num_records = 0;
  ofstream ofs;
  ofs.open(filename);
  if (!ofs.good())
    throw error::IOError("could not open file '" + filename + "' for writing");
  num_records = writeFasta(sequences, ofs, line_width);
  ofs.close();
  if (ofs.fail())
    throw error::IOError("error writing file '" + filename + "'");

  return num_records;
}

/** Write SeqRecords to FASTA file, using a defined line width. */
int writeFasta(
  const vector<shared_ptr<SeqRecord>>& seqs,
  ostream &output,
  int line_width)
{
  int recCount = 0;
  for (auto const & rec : seqs) {
    output << '>' << rec->id << '\n';
    string::const_iterator it_seq = rec->seq.begin();
    while (it_seq != rec->seq.end()) {
      for (int i=0; i<line_width && it_seq!=rec->seq.end(); ++i)
        output << *it_seq++;
      output << '\n';
    }
    recCount++;
  }
  return recCount;
}

int writeWindows(const vector<Window>& windows, const string filename)
{
  ofstream ofs;
  ofs.open(filename);
  if (!ofs.good())
    throw error::IOError("could not open file '" + filename + "' for writing");
  int num_windows = writeWindows(windows, ofs);
  ofs.close();
  if (ofs.fail())
    throw error::IOError("error writing file '" + filename + "'");

  return num_windows;
}

int writeWindows(const vector<Window>& windows, ostream& output)
{
  int num_windows = 0;
  for (auto const & win : windows) {
    output << win.id_chr << '\t' << win.start << '\t' << win.end << '\n';
    num_windows++;
  }
  return num_windows;
}

vector<Window> readWindows(istream& input)
{
  vector<Window> windows;
  string line;
  size_t line_num = 0;
  while (stringio::safeGetline(input, line)) {
    line_num++;
    if (line.empty()) continue;
    vector<string> row = stringio::split(line, '\t');
    long start, end;
    if (row.size() < 3 ||
        !stringio::strToLong(row[1], start) ||
        !stringio::strToLong(row[2], end)) {
      throw error::ParseError(stringio::format("malformed window record in line %lu", line_num));
    }
    windows.push_back(Window(row[0], start, end));
  }
  return windows;
}

SeqCollection
extractSequences (
  const GenomeReference& genome,
  const vector<Window>& windows
) {
  SeqCollection coll;
  for (auto const & win : windows) {
    coll.add(win.id(), genome.getSequence(win));
  }
  return coll;
}

} /* namespace seqio */
