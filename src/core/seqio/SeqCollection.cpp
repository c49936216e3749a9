#include "SeqCollection.hpp"
#include <stdexcept>

using namespace std;

namespace seqio {

SeqCollection::SeqCollection() {}

bool
SeqCollection::add(shared_ptr<SeqRecord> rec) {
  auto it = m_idx_id.find(rec->id);
  if (it != m_idx_id.end()) {
    m_vec_records[it->second] = rec;
    return false;
  }
  m_idx_id[rec->id] = m_vec_records.size();
  m_vec_records.push_back(rec);
  return true;
}

bool
SeqCollection::add(const string& id, const string& seq) {
  return add(make_shared<SeqRecord>(id, seq));
}

size_t SeqCollection::size() const {
  return m_vec_records.size();
}

bool SeqCollection::empty() const {
  return m_vec_records.empty();
}

bool SeqCollection::contains(const string& id) const {
  return m_idx_id.count(id) > 0;
}

const SeqRecord& SeqCollection::at(size_t idx) const {
  return *m_vec_records.at(idx);
}

const SeqRecord& SeqCollection::at(const string& id) const {
  auto it = m_idx_id.find(id);
  if (it == m_idx_id.end())
    throw out_of_range("unknown sequence id: '" + id + "'");
  return *m_vec_records[it->second];
}

vector<string> SeqCollection::ids() const {
  vector<string> res;
  res.reserve(m_vec_records.size());
  for (auto const & rec : m_vec_records)
    res.push_back(rec->id);
  return res;
}

vector<string> SeqCollection::sequences() const {
  vector<string> res;
  res.reserve(m_vec_records.size());
  for (auto const & rec : m_vec_records)
    res.push_back(rec->seq);
  return res;
}

SeqCollection::const_iterator SeqCollection::begin() const {
  return m_vec_records.begin();
}

SeqCollection::const_iterator SeqCollection::end() const {
  return m_vec_records.end();
}

const vector<shared_ptr<SeqRecord>>& SeqCollection::records() const {
  return m_vec_records;
}

} // namespace seqio
