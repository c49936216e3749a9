#ifndef RANDOM_H
#define RANDOM_H

#include <algorithm> // std::shuffle()
#include <cassert>
#include <functional> // std::function<>, std::bind(), std::ref()
#include <iterator> // std::distance(), std::advance()
#include <limits>
#include <random>
#include <vector>
// Choosing the random number generator. (mt19937: Mersenne-Twister)
typedef std::mt19937 base_generator_type;
// defined in <functional>
using std::bind;
using std::ref;

/**
 * Seedable source of random numbers.
 *
 * A single instance is created per program run and passed by reference
 * to every component that needs randomness (window sampling, learner
 * initialization), so that results are reproducible for a given seed.
 */
template <typename GeneratorType = base_generator_type>
struct RandomNumberGenerator {

  GeneratorType generator;

  RandomNumberGenerator(long seed) {
	generator.seed(seed);
  }

  std::function<double()> getRandomFunctionDouble(double min, double max) {
	assert( max > min );
	std::uniform_real_distribution<> dist(min, max);
	return bind(dist, ref(generator));
  }

  /** Uniform integers in the closed range [min, max]. Requires min <= max. */
  template <typename T>
  std::function<T()> getRandomFunctionInt(T min, T max) {
	assert( max >= min );
	std::uniform_int_distribution<T> dist(min, max);
	return bind(dist, ref(generator));
  }

  /**
   * Draw a seed for a derived generator.
   * Used to hand out independent streams to parallel workers.
   */
  unsigned long getRandomSeed() {
    std::uniform_int_distribution<unsigned long> dist(0, std::numeric_limits<unsigned>::max());
    return dist(generator);
  }

  /** Select a uniformly random element from a range. */
  template <typename Iter>
  Iter select(Iter start, Iter end) {
    assert( start != end );
    std::uniform_int_distribution<long> dist(0, std::distance(start, end) - 1);
    std::advance(start, dist(generator));
    return start;
  }

  /** Select a uniformly random element from a non-empty container. */
  template <typename Container>
  auto select(const Container& c) -> decltype(*begin(c))& {
    assert( c.size() > 0 );
    return *select(begin(c), end(c));
  }

  /** Randomly permute the elements of a vector in place. */
  template <typename T>
  void shuffle(std::vector<T>& v) {
    std::shuffle(v.begin(), v.end(), generator);
  }
};

#endif /* RANDOM_H */
