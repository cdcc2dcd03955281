// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

// Logging is off unless DRAFTOPS_TEST_LOGLEVEL names a level
int main(int argc, char* argv[]) {
    const char* level = std::getenv("DRAFTOPS_TEST_LOGLEVEL");
    InitializeTestLogging(level ? level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
