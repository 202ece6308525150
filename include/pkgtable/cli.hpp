#pragma once
#include <optional>
#include <string>
#include <variant>

namespace pkgtable {

struct CmdCreate {
  std::string manifest;
  std::string out;
  std::optional<std::string> container; // overrides the manifest's Name
};
struct CmdDump {
  std::string file;
  bool json = false;
};
struct CmdLookup {
  std::string file;
  std::string package;
  bool json = false;
};
struct CmdVerify {
  std::string file;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdCreate, CmdDump, CmdLookup, CmdVerify, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
  std::string log_level = "info";
};

ParseResult parse_cli(int argc, char **argv);

} // namespace pkgtable
