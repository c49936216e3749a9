#ifndef SEQIO_TYPES_H
#define SEQIO_TYPES_H

#include <map>
#include <string>

namespace seqio {

/** Represents genomic coordinates.
 *  Signed, so that windows re-centered near a chromosome start can be
 *  represented (and rejected) instead of wrapping around.
 */
typedef
long
TCoord;

/** Chromosome lengths indexed by chromosome id. */
typedef
std::map<std::string, TCoord>
TChromLengths;

} // namespace seqio

#endif // SEQIO_TYPES_H
