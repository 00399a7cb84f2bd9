#include "app/RentalTypeApp.hpp"
#include <iostream>

int main() {
    // All settings are fixed; see RentalTypeAppOptions for the defaults.
    RentalTypeAppOptions opts;
    return runRentalTypeMain(opts, std::cin, std::cout, std::cerr);
}
