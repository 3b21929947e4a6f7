#include <string>
#include <vector>

#include "cli.hpp"

int main(int argc, char *argv[]) { return mkrpki::tools::run_cli(std::vector<std::string>(argv + 1, argv + argc)); }
