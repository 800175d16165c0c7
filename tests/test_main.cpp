#include "minitest.hpp"

int main(int argc, char** argv) { return mini::run_all(argc > 1 ? argv[1] : ""); }
