#define BOOST_TEST_MODULE PeakMers
#include <boost/test/unit_test.hpp>
