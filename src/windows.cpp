/**
 * Preparation of treatment (peak) and control windows and their sequences.
 *
 * Peaks are re-centered on their summits; control windows of the same
 * width are sampled at random, avoiding peaks and each other.
 */
#include "core/config/ConfigStore.hpp"
#include "core/errors.hpp"
#include "core/random.hpp"
#include "core/sampling/WindowSampler.hpp"
#include "core/seqio.hpp"

#include <boost/format.hpp>
#include <boost/timer/timer.hpp>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <set>
#include <string>
#include <vector>

using namespace std;
using boost::format;
using boost::str;
using config::ConfigStore;
using sampling::WindowSampler;
using seqio::GenomeReference;
using seqio::PeakFile;
using seqio::SeqCollection;
using seqio::Window;

int main (int argc, char* argv[])
{
  // user params (defined in config file or command line)
  ConfigStore config;
  try {
    bool args_ok = config.parseArgsWindows(argc, argv);
    if (!args_ok) { return EXIT_SUCCESS; }
  } catch (const std::exception& e) {
    fprintf(stderr, "\n%s: %s\n", error::errorName(e), e.what());
    return EXIT_FAILURE;
  }

  try {
    string fn_peaks = config.getValue<string>("peaks");
    string fn_genome = config.getValue<string>("genome");
    long width = config.getValue<long>("width");
    set<string> chr_allowlist = config.getChromosomes();
    unsigned max_attempts = config.getValue<unsigned>("max-attempts");
    string fn_treat_win = config.getValue<string>("out-treatment-windows");
    string fn_treat_seq = config.getValue<string>("out-treatment-seqs");
    string fn_ctrl_win = config.getValue<string>("out-control-windows");
    string fn_ctrl_seq = config.getValue<string>("out-control-seqs");
    int verbosity = config.getValue<int>("verbosity");
    long seed = config.getValue<long>("seed");

    boost::timer::cpu_timer timer;
    RandomNumberGenerator<> rng(seed);
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Random seed: %ld\n", seed);

    // read peaks
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Reading peaks from file '%s'.\n", fn_peaks.c_str());
    PeakFile peaks(fn_peaks);
    if (verbosity > 1)
      fprintf(stdout, "[INFO] Peak file parsed %s summit offsets.\n",
              (peaks.m_schema == seqio::SCHEMA_SUMMIT ? "with" : "without"));
    size_t num_peaks_total = peaks.m_vec_peaks.size();
    if (chr_allowlist.size() > 0) {
      size_t num_removed = peaks.filterChromosomes(chr_allowlist);
      if (verbosity > 0)
        fprintf(stdout, "[INFO] Dropped %lu peaks on chromosomes not in allowlist.\n", num_removed);
    }

    // read reference genome
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Reading genome from file '%s'.\n", fn_genome.c_str());
    GenomeReference genome = (chr_allowlist.size() > 0 ?
      GenomeReference(fn_genome, chr_allowlist) :
      GenomeReference(fn_genome));
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Read %u chromosomes (%lu bp).\n", genome.num_records, genome.length);

    // treatment windows
    vector<Window> vec_treat_win = peaks.getWindows(width);
    SeqCollection seqs_treat = seqio::extractSequences(genome, vec_treat_win);

    // control windows
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Sampling %lu control windows (width: %ld).\n", vec_treat_win.size(), width);
    WindowSampler sampler(genome.getChromosomeLengths(), width, max_attempts, verbosity);
    vector<Window> vec_ctrl_win = sampler.sample(vec_treat_win, rng);
    SeqCollection seqs_ctrl = seqio::extractSequences(genome, vec_ctrl_win);

    // write output
    seqio::writeWindows(vec_treat_win, fn_treat_win);
    seqio::writeFasta(seqs_treat.records(), fn_treat_seq);
    seqio::writeWindows(vec_ctrl_win, fn_ctrl_win);
    seqio::writeFasta(seqs_ctrl.records(), fn_ctrl_seq);
    if (verbosity > 0) {
      fprintf(stdout, "[INFO] Treatment windows: '%s', sequences: '%s'\n", fn_treat_win.c_str(), fn_treat_seq.c_str());
      fprintf(stdout, "[INFO] Control windows: '%s', sequences: '%s'\n", fn_ctrl_win.c_str(), fn_ctrl_seq.c_str());
    }

    // summary
    fprintf(stdout, "%s", str(format("Peaks: %d (used: %d)\n") % num_peaks_total % peaks.m_vec_peaks.size()).c_str());
    fprintf(stdout, "%s", str(format("Treatment windows: %d\n") % vec_treat_win.size()).c_str());
    fprintf(stdout, "%s", str(format("Control windows: %d (skipped slots: %d)\n") % vec_ctrl_win.size() % sampler.numExhausted()).c_str());
    if (verbosity > 0)
      fprintf(stdout, "[INFO] Done (%s).\n", timer.format(2, "%ws wall, %ts CPU").c_str());
  } catch (const std::exception& e) {
    fprintf(stderr, "\n%s: %s\n", error::errorName(e), e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
