#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "i2pbase/cli.hpp"

int main(int argc, char** argv)
{
    // Unsynced std::cin sets badbit on a failed read instead of reporting end of file.
    std::ios::sync_with_stdio(false);
    try
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        i2pbase::Options options = i2pbase::parse_args(args);
        i2pbase::run(options, std::cin, std::cout);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
