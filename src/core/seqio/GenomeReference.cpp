#include "GenomeReference.hpp"
#include "../errors.hpp"
#include "../seqio.hpp"
#include "../stringio.hpp"

using namespace std;

namespace seqio {

ChromosomeReference::ChromosomeReference() : length(0) {}

ChromosomeReference::ChromosomeReference(shared_ptr<SeqRecord> rec)
: id(rec->id), length(rec->length()), record(rec) {}

bool ChromosomeReference::contains(const TCoord start, const TCoord end) const {
  return start >= 0 && end < length && start <= end;
}

GenomeReference::GenomeReference() : num_records(0), length(0) {}

GenomeReference::GenomeReference(const string& fn_fasta)
: num_records(0), length(0)
{
  vector<shared_ptr<SeqRecord>> records;
  readFasta(records, fn_fasta);
  for (auto const & rec : records)
    addChromosome(rec);
}

GenomeReference::GenomeReference(
  const string& fn_fasta,
  const set<string>& chr_allowlist
)
: num_records(0), length(0)
{
  vector<shared_ptr<SeqRecord>> records;
  readFasta(records, fn_fasta, true, chr_allowlist);
  for (auto const & rec : records)
    addChromosome(rec);
}

void
GenomeReference::addChromosome(shared_ptr<SeqRecord> rec)
{
  shared_ptr<ChromosomeReference> sp_chr = make_shared<ChromosomeReference>(rec);
  if (chromosomes.count(sp_chr->id) > 0) {
    fprintf(stderr, "[WARN] Duplicate chromosome '%s' in genome, keeping the first one.\n", sp_chr->id.c_str());
    return;
  }
  chromosomes[sp_chr->id] = sp_chr;
  vec_chr_id.push_back(sp_chr->id);
  vec_chr_len.push_back(sp_chr->length);
  length += sp_chr->length;
  num_records++;
}

bool
GenomeReference::hasChromosome(const string& id_chr) const
{
  return chromosomes.count(id_chr) > 0;
}

TChromLengths
GenomeReference::getChromosomeLengths() const
{
  TChromLengths res;
  for (size_t i=0; i<vec_chr_id.size(); ++i)
    res[vec_chr_id[i]] = vec_chr_len[i];
  return res;
}

string
GenomeReference::getSequence(const Window& win) const
{
  auto it_chr = chromosomes.find(win.id_chr);
  if (it_chr == chromosomes.end()) {
    throw error::BoundsError(stringio::format(
      "window %s: chromosome '%s' not found in genome",
      win.id().c_str(), win.id_chr.c_str()));
  }
  shared_ptr<ChromosomeReference> chr = it_chr->second;
  // do coordinates exceed chromosome limits?
  if (!chr->contains(win.start, win.end)) {
    throw error::BoundsError(stringio::format(
      "window %s exceeds limits of chromosome '%s' (length %ld)",
      win.id().c_str(), chr->id.c_str(), chr->length));
  }

  return chr->record->seq.substr(win.start, win.width());
}

} // namespace seqio
