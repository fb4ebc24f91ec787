#include <catch2/catch_session.hpp>

#include "mo/core/Logger.hpp"

#include <cstdlib>

int main(int argc, char* argv[]) {
    mo::core::Logger::ConfigureFromEnvironment();
    // Quiet by default; MO_LOG_LEVEL or MO_LOG_DEBUG override.
    if (std::getenv("MO_LOG_LEVEL") == nullptr) {
        mo::core::Logger::SetMinimumLevel(mo::core::Logger::IsDebugEnabled() ? mo::core::LogLevel::Debug
                                                                             : mo::core::LogLevel::Warning);
    }

    Catch::Session session;
    const int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }
    return session.run();
}
