#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"

#include "cokacenc/crypto/providers/OpenSslProviderFactory.hpp"
#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    try
    {
        const auto lockStatus{ cokacenc::ui::cli::lockProcessMemory() };
        if (!lockStatus.coreDumpsDisabled)
        {
            std::cerr << "warning: could not disable core dumps\n";
        }

        auto crypto{ cokacenc::crypto::providers::makeOpenSslCryptoProvider() };
        cokacenc::ui::cli::CommandLine cli{ *crypto, std::cout, std::cerr };
        return cli.run(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
