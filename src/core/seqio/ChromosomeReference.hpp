#ifndef CHROMOSOMEREFERENCE_H
#define CHROMOSOMEREFERENCE_H

#include "SeqRecord.hpp"
#include "types.hpp"
#include <memory>
#include <string>

namespace seqio {

/** A chromosome of the reference genome; windows are extracted from its record. */
struct ChromosomeReference {
  std::string id;
  TCoord length;
  std::shared_ptr<SeqRecord> record;

  ChromosomeReference();
  explicit ChromosomeReference(std::shared_ptr<SeqRecord> rec);

  /** Is the window located on this chromosome and within its limits? */
  bool contains(const TCoord start, const TCoord end) const;
};

} // namespace seqio

#endif // CHROMOSOMEREFERENCE_H
