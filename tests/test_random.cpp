#include <boost/test/unit_test.hpp>

#include "core/random.hpp"
#include <boost/format.hpp>
#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <vector>

using boost::format;
using boost::str;
using namespace std;

struct FixtureRandom {
  FixtureRandom() {
    BOOST_TEST_MESSAGE( "setup fixure" );
  }
  ~FixtureRandom() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  long seed = 123456789;
  RandomNumberGenerator<> gen = RandomNumberGenerator<>(seed);
};

BOOST_FIXTURE_TEST_SUITE( rng , FixtureRandom )

/* same seed, same numbers */
BOOST_AUTO_TEST_CASE( reproducible )
{
  RandomNumberGenerator<> gen2(seed);
  function<long()> r1 = gen.getRandomFunctionInt<long>(0, 1000000);
  function<long()> r2 = gen2.getRandomFunctionInt<long>(0, 1000000);
  for (int i=0; i<100; ++i)
    BOOST_CHECK_EQUAL( r1(), r2() );
}

/* integers stay within closed range */
BOOST_AUTO_TEST_CASE( int_range )
{
  function<long()> r = gen.getRandomFunctionInt<long>(5, 7);
  vector<int> counts(3, 0);
  for (int i=0; i<3000; ++i) {
    long x = r();
    BOOST_REQUIRE( x >= 5 && x <= 7 );
    counts[x-5]++;
  }
  for (int c : counts)
    BOOST_CHECK( c > 0 );
}

/* selection is proportional to multiplicity */
BOOST_AUTO_TEST_CASE( select_weighted_by_frequency )
{
  vector<string> pool = { "chr1", "chr1", "chr1", "chr2" };
  map<string, int> counts;
  int n = 40000;
  for (int i=0; i<n; ++i)
    counts[gen.select(pool)]++;

  double frac_chr1 = double(counts["chr1"]) / n;
  BOOST_TEST_MESSAGE( str(format("  chr1: %.4f, chr2: %.4f") % frac_chr1 % (1.0-frac_chr1)) );
  BOOST_CHECK_CLOSE( frac_chr1, 0.75, 2.0 );
}

/* shuffling keeps elements */
BOOST_AUTO_TEST_CASE( shuffle )
{
  vector<int> v = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 };
  vector<int> w = v;
  gen.shuffle(w);
  sort(w.begin(), w.end());
  BOOST_CHECK( v == w );
}

/* derived seeds differ */
BOOST_AUTO_TEST_CASE( seeds )
{
  unsigned long s1 = gen.getRandomSeed();
  unsigned long s2 = gen.getRandomSeed();
  BOOST_CHECK( s1 != s2 );
}

BOOST_AUTO_TEST_SUITE_END()
