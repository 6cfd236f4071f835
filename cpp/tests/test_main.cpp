#define BOOST_TEST_MODULE cpamm_tests
#include <boost/test/unit_test.hpp>
