#include "co/unitest.h"

int main(int argc, char** argv) {
    flag::parse(argc, argv);
    return unitest::run_tests() == 0 ? 0 : 1;
}
