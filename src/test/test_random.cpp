#include <boost/test/unit_test.hpp>

#include "../core/random.hpp"
#include <boost/format.hpp>
#include <cmath>
#include <functional>
#include <stdexcept>
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

/* exponential waiting times have mean 1/rate */
BOOST_AUTO_TEST_CASE( exponential )
{
  double rate = 3.0;
  function<double()> random_exp = gen.getRandomExponential(rate);
  unsigned num_values = 100000;
  double sum = 0.0;
  for (unsigned i=0; i<num_values; ++i) {
    double x = random_exp();
    BOOST_REQUIRE( x >= 0.0 );
    sum += x;
  }
  double mean = sum / num_values;
  BOOST_TEST_MESSAGE( str(format("  mean: %.5f (expected: %.5f)") % mean % (1.0/rate)) );
  // standard error is (1/rate)/sqrt(n) ~ 0.001
  BOOST_CHECK_SMALL( mean - 1.0/rate, 0.01 );
}

/* non-positive rates are programming errors */
BOOST_AUTO_TEST_CASE( exponential_invalid_rate )
{
  BOOST_CHECK_THROW( gen.getRandomExponential(0.0), std::invalid_argument );
  BOOST_CHECK_THROW( gen.getRandomExponential(-1.0), std::invalid_argument );
  BOOST_CHECK_THROW( gen.getRandomExponential(NAN), std::invalid_argument );
  BOOST_CHECK_THROW( gen.getRandomExponential(INFINITY), std::invalid_argument );
}

/* indices drawn without replacement are distinct and in range */
BOOST_AUTO_TEST_CASE( sample_without_replacement )
{
  for (int rep=0; rep<1000; ++rep) {
    vector<size_t> idx = gen.getRandomSample(10, 4);
    BOOST_REQUIRE_EQUAL( idx.size(), 4u );
    for (size_t i=0; i<idx.size(); ++i) {
      BOOST_CHECK( idx[i] < 10 );
      for (size_t j=0; j<i; ++j) {
        BOOST_CHECK( idx[i] != idx[j] );
      }
    }
  }
  vector<size_t> all = gen.getRandomSample(5, 5);
  vector<bool> seen(5, false);
  for (size_t i : all) seen[i] = true;
  for (bool b : seen) BOOST_CHECK( b );

  BOOST_CHECK( gen.getRandomSample(3, 0).empty() );
  BOOST_CHECK_THROW( gen.getRandomSample(2, 3), std::invalid_argument );
}

/* every ordered pair of 4 items is equally likely */
BOOST_AUTO_TEST_CASE( sample_pairs_uniform )
{
  size_t n = 4;
  unsigned num_draws = 120000;
  vector<vector<unsigned>> counts(n, vector<unsigned>(n, 0));
  for (unsigned i=0; i<num_draws; ++i) {
    vector<size_t> idx = gen.getRandomSample(n, 2);
    counts[idx[0]][idx[1]]++;
  }
  double expected = double(num_draws) / (n*(n-1));
  for (size_t a=0; a<n; ++a) {
    BOOST_CHECK_EQUAL( counts[a][a], 0u );
    for (size_t b=0; b<n; ++b) {
      if (a == b) continue;
      BOOST_TEST_MESSAGE( str(format("  (%d,%d): %d") % a % b % counts[a][b]) );
      // expected 10000 per pair, sd ~ 96
      BOOST_CHECK_SMALL( counts[a][b] - expected, 600.0 );
    }
  }
}

/* copying a generator takes a snapshot of its state */
BOOST_AUTO_TEST_CASE( snapshot )
{
  RandomNumberGenerator<> copy = gen;
  BOOST_CHECK( copy == gen );
  double x = gen.getRandomFunctionDouble(0.0, 1.0)();
  BOOST_CHECK( copy != gen );
  double y = copy.getRandomFunctionDouble(0.0, 1.0)();
  BOOST_CHECK_EQUAL( x, y );
  BOOST_CHECK( copy == gen );

  RandomNumberGenerator<> other(seed+1);
  BOOST_CHECK( other != RandomNumberGenerator<>(seed) );
}

/* seeds for replicates are reproducible */
BOOST_AUTO_TEST_CASE( seeds )
{
  RandomNumberGenerator<> gen_a(42);
  RandomNumberGenerator<> gen_b(42);
  for (int i=0; i<10; ++i) {
    long s = gen_a.getRandomSeed();
    BOOST_CHECK( s >= 0 );
    BOOST_CHECK_EQUAL( s, gen_b.getRandomSeed() );
  }
  function<int()> random_int = gen.getRandomFunctionInt(1, 6);
  for (int i=0; i<100; ++i) {
    int v = random_int();
    BOOST_CHECK( v >= 1 && v <= 6 );
  }
}

BOOST_AUTO_TEST_SUITE_END()
