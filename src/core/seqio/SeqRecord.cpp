#include "SeqRecord.hpp"

using namespace std;

namespace seqio {

SeqRecord::SeqRecord(const string& id, const string& desc, const string& seq)
: id(id), description(desc), seq(seq) {}

SeqRecord::SeqRecord(const string& id, const string& seq)
: id(id), seq(seq) {}

TCoord SeqRecord::length() const {
  return static_cast<TCoord>(seq.length());
}

} // namespace seqio
