#ifndef SEQCOLLECTION_H
#define SEQCOLLECTION_H

#include "SeqRecord.hpp"
#include <map>
#include <memory> // shared_ptr
#include <string>
#include <vector>

namespace seqio {

/**
 * Ordered collection of sequence records, addressable by identifier.
 *
 * Records are kept in insertion order (iteration and index access follow
 * that order). Adding a record whose identifier is already present
 * replaces the stored sequence in place, keeping its original position.
 */
class SeqCollection
{
public:
  typedef std::vector<std::shared_ptr<SeqRecord>>::const_iterator const_iterator;

  SeqCollection();

  /** Add a record. \returns false if the id was present and got replaced. */
  bool add(std::shared_ptr<SeqRecord> rec);
  /** Add a record created from id and sequence. */
  bool add(const std::string& id, const std::string& seq);

  /** Number of records. */
  size_t size() const;
  bool empty() const;
  /** Is a record with the given id present? */
  bool contains(const std::string& id) const;

  /** Record at insertion position. */
  const SeqRecord& at(size_t idx) const;
  /** Record by identifier (throws std::out_of_range if missing). */
  const SeqRecord& at(const std::string& id) const;

  /** Identifiers in insertion order. */
  std::vector<std::string> ids() const;
  /** Sequences in insertion order. */
  std::vector<std::string> sequences() const;

  const_iterator begin() const;
  const_iterator end() const;

  const std::vector<std::shared_ptr<SeqRecord>>& records() const;

private:
  std::vector<std::shared_ptr<SeqRecord>> m_vec_records;
  std::map<std::string, size_t> m_idx_id;
};

} // namespace seqio

#endif // SEQCOLLECTION_H
