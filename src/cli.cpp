// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/rpc_client.hpp"
#include "version.hpp"
#include <cstdlib>
#include <iostream>
#include <pwd.h>
#include <string>
#include <unistd.h>
#include <vector>

std::string GetDefaultDataDir() {
  const char *home = getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }

  if (home) {
    return std::string(home) + "/.draftops";
  }

  return ".draftops";
}

void PrintUsage(const char *program_name) {
  std::cout
      << "draftops CLI - Query the draft state daemon\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.draftops)\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "\n"
      << "Draft:\n"
      << "  getstate             Full draft state\n"
      << "  getcurrentpick       Current pick, team on the clock, time left\n"
      << "  getroster [team]     Roster of a team (default: tracked team)\n"
      << "  getrosters           Rosters of every team\n"
      << "  getavailable [pos] [limit]  Available players, optionally by position\n"
      << "  getpicks [count]     Pick history (last <count> picks)\n"
      << "  getmypicks           Pick numbers owned by the tracked team\n"
      << "\n"
      << "Diagnostics:\n"
      << "  getstats             Draft, processor, validator and feed statistics\n"
      << "  validate             Run a consistency check\n"
      << "  getsnapshot <index>  Show a snapshot (negative counts from newest)\n"
      << "  rollback <index>     Restore a snapshot\n"
      << "  getconnection        Feed connection health\n"
      << "  exportstate          Write the state file now\n"
      << "\n"
      << "Control:\n"
      << "  stop                 Stop the daemon\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    std::string datadir = GetDefaultDataDir();
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << draftops::GetFullVersionString() << std::endl;
        std::cout << draftops::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        datadir = arg.substr(10);
      } else if (command.empty()) {
        command = arg;
      } else {
        params.push_back(arg);
      }
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    // RPC is local-only over a Unix domain socket
    std::string socket_path = datadir + "/draftops.sock";
    draftops::rpc::RPCClient client(socket_path);

    if (!client.Connect()) {
      std::cerr << "Error: Cannot connect to daemon at " << socket_path << "\n"
                << "Make sure draftopsd is running.\n";
      return 1;
    }

    std::string response = client.ExecuteCommand(command, params);
    std::cout << response;

    // Non-zero exit for error replies so scripts can tell
    if (response.rfind("{\"error\"", 0) == 0) {
      return 1;
    }
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
