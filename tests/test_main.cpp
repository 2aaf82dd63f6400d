#define BOOST_TEST_MODULE skirmish
#include <boost/test/unit_test.hpp>
