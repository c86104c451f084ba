#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return gifrgb::cli::run(argc, argv);
}
