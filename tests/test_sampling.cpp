#include <boost/test/unit_test.hpp>
#include <boost/timer/timer.hpp>

#include "core/errors.hpp"
#include "core/random.hpp"
#include "core/sampling/WindowSampler.hpp"
#include "core/seqio/Window.hpp"
#include <string>
#include <vector>

using namespace std;
using sampling::WindowSampler;
using seqio::TChromLengths;
using seqio::Window;

struct FixtureSampling {
  FixtureSampling() : rng(20170320) {
    BOOST_TEST_MESSAGE( "set up fixure" );
    chr_len["chr1"] = 100000;
    chr_len["chr2"] = 50000;
    chr_len["chr3"] = 10;
    peaks.push_back(Window("chr1", 1000, 1500));
    peaks.push_back(Window("chr1", 40000, 40500));
    peaks.push_back(Window("chr1", 40400, 40900));
    peaks.push_back(Window("chr2", 25000, 25500));
  }
  ~FixtureSampling() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  RandomNumberGenerator<> rng;
  TChromLengths chr_len;
  vector<Window> peaks;
};

BOOST_FIXTURE_TEST_SUITE( control_sampling, FixtureSampling )

/* controls have the requested width, stay within bounds and avoid peaks and each other */
BOOST_AUTO_TEST_CASE( controls_disjoint )
{
  WindowSampler sampler(chr_len, 501, 1000, 0);
  vector<Window> controls = sampler.sample(peaks, rng);

  BOOST_CHECK_EQUAL( controls.size(), peaks.size() );
  BOOST_CHECK_EQUAL( sampler.numExhausted(), 0 );
  for (size_t i=0; i<controls.size(); ++i) {
    const Window& ctl = controls[i];
    BOOST_TEST_MESSAGE( ctl.id() );
    BOOST_CHECK_EQUAL( ctl.width(), 501 );
    BOOST_CHECK( ctl.start >= 0 );
    BOOST_CHECK( ctl.end < chr_len[ctl.id_chr] );
    for (auto const & peak : peaks)
      BOOST_CHECK( !ctl.overlaps(peak) );
    for (size_t j=i+1; j<controls.size(); ++j)
      BOOST_CHECK( !ctl.overlaps(controls[j]) );
  }
  BOOST_CHECK_EQUAL( sampler.exclusionIndex().size(), peaks.size() + controls.size() );
}

/* controls are drawn from chromosomes that carry peaks */
BOOST_AUTO_TEST_CASE( controls_chromosomes )
{
  boost::timer::auto_cpu_timer t;
  WindowSampler sampler(chr_len, 101, 1000, 0);
  vector<Window> many_peaks;
  for (int i=0; i<50; ++i)
    many_peaks.push_back(Window("chr2", i*1000, i*1000+100));
  vector<Window> controls = sampler.sample(many_peaks, rng);

  BOOST_CHECK_EQUAL( controls.size(), many_peaks.size() );
  for (auto const & ctl : controls)
    BOOST_CHECK_EQUAL( ctl.id_chr, "chr2" );
}

/* same seed, same controls */
BOOST_AUTO_TEST_CASE( controls_reproducible )
{
  WindowSampler sampler(chr_len, 501, 1000, 0);
  RandomNumberGenerator<> rng1(42);
  RandomNumberGenerator<> rng2(42);
  vector<Window> c1 = sampler.sample(peaks, rng1);
  vector<Window> c2 = sampler.sample(peaks, rng2);
  BOOST_CHECK( c1 == c2 );
}

/* a chromosome shorter than the window leaves its slots empty */
BOOST_AUTO_TEST_CASE( short_chromosome )
{
  WindowSampler sampler(chr_len, 501, 100, 0);
  vector<Window> short_peaks = { Window("chr3", 0, 9), Window("chr3", 0, 9) };
  vector<Window> controls;
  BOOST_CHECK_NO_THROW( controls = sampler.sample(short_peaks, rng) );
  BOOST_CHECK( controls.empty() );
  BOOST_CHECK_EQUAL( sampler.numExhausted(), 2 );
}

/* slots are skipped once no free position is left */
BOOST_AUTO_TEST_CASE( exhausted_chromosome )
{
  TChromLengths tiny;
  tiny["chrT"] = 6;
  WindowSampler sampler(tiny, 3, 500, 0);
  // positions 0-2 are taken by the peak, leaving room for a single control
  vector<Window> tiny_peaks(3, Window("chrT", 0, 2));
  vector<Window> controls = sampler.sample(tiny_peaks, rng);

  BOOST_REQUIRE_EQUAL( controls.size(), 1 );
  BOOST_CHECK_EQUAL( controls[0].start, 3 );
  BOOST_CHECK_EQUAL( controls[0].end, 5 );
  BOOST_CHECK_EQUAL( sampler.numExhausted(), 2 );
}

BOOST_AUTO_TEST_CASE( invalid_parameters )
{
  BOOST_CHECK_THROW( WindowSampler(chr_len, 500), error::ConfigurationError );
  BOOST_CHECK_THROW( WindowSampler(chr_len, -1), error::ConfigurationError );
  BOOST_CHECK_THROW( WindowSampler(chr_len, 501, 0), error::ConfigurationError );
}

BOOST_AUTO_TEST_SUITE_END()
