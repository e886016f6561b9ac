#define BOOST_TEST_MODULE iam_explorer_unit_test
#include <boost/test/unit_test.hpp>
