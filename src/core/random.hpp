#ifndef RANDOM_H
#define RANDOM_H

#include <cmath> // std::isfinite()
#include <cstddef>
#include <functional> // std::function<>, std::bind(), std::ref()
#include <random>
#include <stdexcept>
#include <vector>
// Choosing the random number generator. (mt19937: Mersenne-Twister)
typedef std::mt19937 base_generator_type;
// defined in <functional>
using std::bind;
using std::ref;

/** Source of randomness for the simulation.
 *
 *  Holds the generator by value: copying a RandomNumberGenerator takes a
 *  snapshot of its state, assigning one back commits an advanced state.
 */
template <typename GeneratorType = base_generator_type>
struct RandomNumberGenerator {

  GeneratorType generator;

  RandomNumberGenerator(long seed) {
	generator.seed(seed);
  }

  std::function<double()> getRandomFunctionDouble(double min, double max) {
	if ( !(max > min) ) {
	  throw std::invalid_argument("getRandomFunctionDouble: max must be greater than min");
	}
	std::uniform_real_distribution<> dist(min, max);
	return bind(dist, ref(generator));
  }

  template <typename T>
  std::function<T()> getRandomFunctionInt(T min, T max) {
	std::uniform_int_distribution<T> dist(min, max);
	return bind(dist, ref(generator));
  }

  /**
   * Get exponentially distributed random function.
   * \param lambda  rate (inverse mean), must be positive and finite
   */
  template <typename RealType = double>
  std::function<RealType()>
  getRandomExponential (
    double lambda
  )
  {
	  if ( !(lambda > 0) || !std::isfinite(lambda) ) {
	    throw std::invalid_argument("getRandomExponential: rate must be positive and finite");
	  }
	  std::exponential_distribution<RealType> dist(lambda);
	  return bind(dist, ref(generator));
  }

  /**
   * Pick k distinct indices from [0,n) uniformly at random (without replacement).
   * Indices are returned in the order they were drawn.
   *
   * Each draw selects among the remaining n-j indices and skips over
   * indices chosen before, so the result is a uniform ordered k-subset.
   */
  std::vector<std::size_t>
  getRandomSample (
    std::size_t n,
    std::size_t k
  )
  {
    if (k > n) {
      throw std::invalid_argument("getRandomSample: cannot draw more indices than available");
    }
    std::vector<std::size_t> picked;
    std::vector<std::size_t> sorted; // picked indices in ascending order
    picked.reserve(k);
    for (std::size_t j=0; j<k; ++j) {
      std::uniform_int_distribution<std::size_t> dist(0, n-j-1);
      std::size_t r = dist(generator);
      auto it = sorted.begin();
      while (it != sorted.end() && *it <= r) {
        ++r;
        ++it;
      }
      sorted.insert(it, r);
      picked.push_back(r);
    }
    return picked;
  }

  /** Draw a seed for an independent generator (e.g., one per replicate). */
  long getRandomSeed() {
    std::uniform_int_distribution<long> dist(0, 2147483647L);
    return dist(generator);
  }

  bool operator==(const RandomNumberGenerator& other) const {
    return generator == other.generator;
  }

  bool operator!=(const RandomNumberGenerator& other) const {
    return !(*this == other);
  }
};

#endif /* RANDOM_H */
