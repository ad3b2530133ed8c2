#include <iostream>
#include <string>

#include "presence/core/App.hpp"

int main(int argc, char** argv)
{
    presence::core::App::Options options;
    std::string error;
    if (!presence::core::App::ParseArguments(argc, argv, options, &error))
    {
        std::cerr << error << "\n" << presence::core::App::Usage();
        return 2;
    }

    presence::core::App app(options);
    return app.Run() ? 0 : 1;
}
