#include "cbxconv/cli.hpp"
#include "cbxconv/errors.hpp"
#include <iostream>

using cbxconv::ExitCode;

int main(int argc, char* argv[]) {
    try {
        auto config = cbxconv::CLI::parse(argc, argv);
        if (!config) {
            return static_cast<int>(ExitCode::USAGE);
        }

        return cbxconv::CLI::run(*config);
    }
    catch (const cbxconv::Error& e) {
        // bekannte fehler die bis hier durchrutschen, z.b. kaputter temp ordner
        std::cerr << "Error: " << e.what() << "\n";
        return static_cast<int>(ExitCode::ALL_FAILED);
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return static_cast<int>(ExitCode::ALL_FAILED);
    }
}
