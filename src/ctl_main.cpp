#include "energy_ctl.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        return energy_rollup::EnergyCtl::run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "energy-ctl error: " << e.what() << std::endl;
        return 1;
    }
}
