#include <pkgtable/cli.hpp>

#include <string_view>
#include <vector>

namespace pkgtable {

static bool has_arg(size_t i, size_t n) { return i + 1 < n; }

static bool valid_level(std::string_view l) {
  return l == "trace" || l == "debug" || l == "info" || l == "warn" ||
         l == "error" || l == "critical" || l == "off";
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};

  // --log-level may appear anywhere; strip it before dispatching
  std::vector<std::string> args;
  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--log-level") {
      if (i + 1 >= argc) {
        r.error = "--log-level: value required";
        return r;
      }
      r.log_level = argv[++i];
      if (!valid_level(r.log_level)) {
        r.error = "--log-level: unknown level " + r.log_level;
        return r;
      }
      continue;
    }
    args.emplace_back(a);
  }

  if (args.empty()) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = args[0];
  const size_t n = args.size();
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "create") {
    CmdCreate c{};
    for (size_t i = 1; i < n; i++) {
      const std::string &a = args[i];
      if (a == "--manifest" && has_arg(i, n))
        c.manifest = args[++i];
      else if (a == "--out" && has_arg(i, n))
        c.out = args[++i];
      else if (a == "--container" && has_arg(i, n))
        c.container = args[++i];
      else {
        r.error = "create: unexpected argument " + a;
        return r;
      }
    }
    if (c.manifest.empty() || c.out.empty()) {
      r.error = "create: --manifest and --out required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "dump") {
    if (n < 2) {
      r.error = "dump: file required";
      return r;
    }
    CmdDump c{args[1], false};
    for (size_t i = 2; i < n; i++) {
      if (args[i] == "--json")
        c.json = true;
      else {
        r.error = "dump: unexpected argument " + args[i];
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "lookup") {
    if (n < 3) {
      r.error = "lookup: file and package required";
      return r;
    }
    CmdLookup c{args[1], args[2], false};
    for (size_t i = 3; i < n; i++) {
      if (args[i] == "--json")
        c.json = true;
      else {
        r.error = "lookup: unexpected argument " + args[i];
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "verify") {
    if (n != 2) {
      r.error = "verify: exactly one file required";
      return r;
    }
    r.cmd = CmdVerify{args[1]};
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace pkgtable
