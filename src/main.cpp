#include "todo/cli.hpp"

int main(int argc, char *argv[])
{
    return todo::cli::run(argc, argv);
}
