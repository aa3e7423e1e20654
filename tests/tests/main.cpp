#include <boost/test/included/unit_test.hpp>

#include <cstdlib>
#include <ctime>
#include <iostream>

boost::unit_test::test_suite* init_unit_test_suite(int argc, char* argv[]) {
    std::srand(time(NULL));
    std::cout << "Random number generator seeded to " << time(NULL) << std::endl;
    return nullptr;
}
