#include <boost/test/unit_test.hpp>

#include "core/errors.hpp"
#include "core/features/KmerVectorizer.hpp"
#include "core/model/SparseMatrix.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using features::FeatureMatrix;
using features::KmerVectorizer;

struct FixtureFeatures {
  FixtureFeatures() {
    BOOST_TEST_MESSAGE( "set up fixure" );
    seqs.push_back("ACGTACGT");
    seqs.push_back("TTTTTTTT");
    seqs.push_back("ACG");
  }
  ~FixtureFeatures() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  vector<string> seqs;
};

BOOST_FIXTURE_TEST_SUITE( kmer_features, FixtureFeatures )

/* a homopolymer of length k yields a single k-mer */
BOOST_AUTO_TEST_CASE( single_kmer )
{
  KmerVectorizer vec(6, 6);
  FeatureMatrix mtx = vec.fitTransform(vector<string>(1, "AAAAAA"));

  BOOST_REQUIRE_EQUAL( vec.vocabulary().size(), 1 );
  BOOST_CHECK_EQUAL( vec.vocabulary()[0], "AAAAAA" );
  BOOST_CHECK_EQUAL( mtx.numRows(), 1 );
  BOOST_CHECK_EQUAL( mtx.n_cols, 1 );
  BOOST_CHECK_EQUAL( mtx.at(0, 0), 1.0 );

  // unseen k-mers are ignored
  FeatureMatrix mtx2 = vec.transform(vector<string>(1, "CCCCCC"));
  BOOST_CHECK_EQUAL( mtx2.numRows(), 1 );
  BOOST_CHECK_EQUAL( mtx2.n_cols, 1 );
  BOOST_CHECK_EQUAL( mtx2.rowSize(0), 0 );
  BOOST_CHECK_EQUAL( mtx2.at(0, 0), 0.0 );
}

/* overlapping occurrences are counted for every length in range */
BOOST_AUTO_TEST_CASE( overlapping_counts )
{
  KmerVectorizer vec(2, 3);
  FeatureMatrix mtx = vec.fitTransform(seqs);

  // ACGTACGT: AC CG GT TA AC CG GT / ACG CGT GTA TAC ACG CGT
  long j_ac = vec.columnOf("AC");
  long j_cgt = vec.columnOf("CGT");
  long j_tt = vec.columnOf("TT");
  long j_ttt = vec.columnOf("TTT");
  BOOST_REQUIRE( j_ac >= 0 && j_cgt >= 0 && j_tt >= 0 && j_ttt >= 0 );
  BOOST_CHECK_EQUAL( mtx.at(0, j_ac), 2.0 );
  BOOST_CHECK_EQUAL( mtx.at(0, j_cgt), 2.0 );
  BOOST_CHECK_EQUAL( mtx.rowSum(0), 13.0 );
  BOOST_CHECK_EQUAL( mtx.at(1, j_tt), 7.0 );
  BOOST_CHECK_EQUAL( mtx.at(1, j_ttt), 6.0 );
  BOOST_CHECK_EQUAL( mtx.rowSum(2), 3.0 );
  BOOST_CHECK_EQUAL( vec.columnOf("GGG"), -1 );
}

/* columns follow lexicographic order of the vocabulary */
BOOST_AUTO_TEST_CASE( vocabulary_sorted )
{
  KmerVectorizer vec(1, 2);
  vec.fit(seqs);
  const vector<string>& vocab = vec.vocabulary();

  BOOST_CHECK( is_sorted(vocab.begin(), vocab.end()) );
  BOOST_CHECK( adjacent_find(vocab.begin(), vocab.end()) == vocab.end() );
  for (size_t j=0; j<vocab.size(); ++j)
    BOOST_CHECK_EQUAL( vec.columnOf(vocab[j]), static_cast<long>(j) );
  // A C G T AC CG GT TA TT
  BOOST_CHECK_EQUAL( vocab.size(), 9 );
  BOOST_CHECK_EQUAL( vocab.front(), "A" );
}

/* rows appear in input order; sequences shorter than k have empty rows */
BOOST_AUTO_TEST_CASE( row_order )
{
  KmerVectorizer vec(4, 4);
  vec.fit(seqs);
  vector<string> target = { "ACG", "TTTT", "ACGT" };
  FeatureMatrix mtx = vec.transform(target);

  BOOST_REQUIRE_EQUAL( mtx.numRows(), 3 );
  BOOST_CHECK_EQUAL( mtx.rowSize(0), 0 );
  BOOST_CHECK_EQUAL( mtx.at(1, vec.columnOf("TTTT")), 1.0 );
  BOOST_CHECK_EQUAL( mtx.rowSum(1), 1.0 );
  BOOST_CHECK_EQUAL( mtx.at(2, vec.columnOf("ACGT")), 1.0 );
}

/* k-mers are case-sensitive */
BOOST_AUTO_TEST_CASE( case_sensitive )
{
  KmerVectorizer vec(2, 2);
  vec.fit(vector<string>(1, "acGT"));
  BOOST_CHECK( vec.columnOf("ac") >= 0 );
  BOOST_CHECK_EQUAL( vec.columnOf("AC"), -1 );
}

BOOST_AUTO_TEST_CASE( invalid_use )
{
  BOOST_CHECK_THROW( KmerVectorizer(0, 3), error::ConfigurationError );
  BOOST_CHECK_THROW( KmerVectorizer(5, 4), error::ConfigurationError );

  KmerVectorizer vec;
  BOOST_CHECK( !vec.isFitted() );
  BOOST_CHECK_EQUAL( vec.kMin(), 6 );
  BOOST_CHECK_EQUAL( vec.kMax(), 8 );
  BOOST_CHECK_THROW( vec.transform(seqs), std::logic_error );
}

BOOST_AUTO_TEST_CASE( sparse_matrix )
{
  model::SparseMatrix<double> mtx(4);
  map<size_t, double> row;
  row[3] = 2.0;
  row[1] = 0.0;
  row[0] = 1.5;
  mtx.appendRow(row);
  mtx.appendRow(map<size_t, double>());

  BOOST_CHECK_EQUAL( mtx.numRows(), 2 );
  BOOST_CHECK_EQUAL( mtx.numNonZero(), 2 );
  BOOST_CHECK_EQUAL( mtx.col_idx[0], 0 );
  BOOST_CHECK_EQUAL( mtx.col_idx[1], 3 );
  vector<double> w = { 2.0, 7.0, 7.0, 0.5 };
  BOOST_CHECK_CLOSE( mtx.dot(0, w), 4.0, 1e-9 );
  BOOST_CHECK_EQUAL( mtx.dot(1, w), 0.0 );

  map<size_t, double> bad;
  bad[4] = 1.0;
  BOOST_CHECK_THROW( mtx.appendRow(bad), std::out_of_range );
  BOOST_CHECK_THROW( mtx.at(2, 0), std::out_of_range );
}

BOOST_AUTO_TEST_SUITE_END()
