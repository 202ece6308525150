#include <pkgtable/app.hpp>
#include <pkgtable/builder.hpp>
#include <pkgtable/cli.hpp>
#include <pkgtable/error.hpp>
#include <pkgtable/io.hpp>
#include <pkgtable/manifest.hpp>
#include <pkgtable/query.hpp>
#include <pkgtable/table.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>
#include <type_traits>
#include <variant>

#ifndef PKGTABLE_COMMIT
#define PKGTABLE_COMMIT "unknown"
#endif
#ifndef PKGTABLE_BRANCH
#define PKGTABLE_BRANCH "unknown"
#endif
#ifndef PKGTABLE_BUILD_TIME
#define PKGTABLE_BUILD_TIME "unknown"
#endif

namespace pkgtable {

static const char *kHelp =
    R"(pkgtable - package table builder and inspector

Usage:
  pkgtable create --manifest <file> --out <file> [--container <name>]
  pkgtable dump   <file> [--json]
  pkgtable lookup <file> <package> [--json]
  pkgtable verify <file>
  pkgtable version | help

Options:
  --log-level trace|debug|info|warn|error|critical|off   (default: info)
)";

static std::string json_escape(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '\"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\b': o += "\\b"; break;
    case '\f': o += "\\f"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        o += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
      else
        o.push_back(c);
    }
  }
  return o;
}

static std::string table_json(const PackageTable &t) {
  const auto &h = t.header;
  std::string s = fmt::format(
      R"({{"header":{{"version":{},"container":"{}","file_size":{},"num_packages":{},"bucket_offset":{},"node_offset":{}}},"buckets":[)",
      h.version, json_escape(h.container), h.file_size, h.num_packages, h.bucket_offset,
      h.node_offset);
  for (size_t i = 0; i < t.buckets.size(); ++i) {
    if (i) s += ",";
    s += t.buckets[i] ? std::to_string(*t.buckets[i]) : std::string("null");
  }
  s += R"(],"nodes":[)";
  for (size_t i = 0; i < t.nodes.size(); ++i) {
    const auto &n = t.nodes[i];
    if (i) s += ",";
    s += fmt::format(
        R"({{"package":"{}","id":{},"boolean_offset":{},"next_offset":{}}})",
        json_escape(n.package_name), n.package_id, n.boolean_offset,
        n.next_offset ? std::to_string(*n.next_offset) : std::string("null"));
  }
  s += "]}";
  return s;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  spdlog::set_level(spdlog::level::from_str(pr.log_level));
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    out_ << kHelp;
    return pr.error.empty() ? 0 : 2;
  }

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            out_ << kHelp;
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            out_ << fmt::format("pkgtable {} ({}, built {}), file format v{}\n",
                                PKGTABLE_COMMIT, PKGTABLE_BRANCH, PKGTABLE_BUILD_TIME,
                                kFileVersion);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdCreate>) {
            Manifest m = Manifest::Load(c.manifest);
            const std::string container = c.container.value_or(m.container);
            BuildOptions opts;
            if (m.version)
              opts.version = *m.version;
            auto table = build_package_table(container, assign_packages(m.packages), opts);
            io::write_table_file(c.out, table);
            out_ << fmt::format("{}: container={} packages={} buckets={} bytes={}\n", c.out,
                                container, table.nodes.size(), table.buckets.size(),
                                table.header.file_size);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdDump>) {
            auto table = io::read_table_file(c.file);
            if (c.json)
              out_ << table_json(table) << "\n";
            else
              out_ << to_string(table);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLookup>) {
            io::MappedFile mf;
            if (!mf.open(c.file)) {
              spdlog::error("cannot map {}", c.file);
              return 1;
            }
            auto ctx = find_package(mf.data(), mf.size(), c.package);
            if (!ctx) {
              spdlog::error("package '{}' not found in {}", c.package, c.file);
              return 1;
            }
            if (c.json)
              out_ << fmt::format(R"({{"package":"{}","id":{},"boolean_offset":{}}})",
                                  json_escape(c.package), ctx->package_id,
                                  ctx->boolean_offset)
                   << "\n";
            else
              out_ << fmt::format("{} id={} boolean_offset={}\n", c.package, ctx->package_id,
                                  ctx->boolean_offset);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVerify>) {
            auto bytes = io::read_file_bytes(c.file);
            auto table = PackageTable::decode(bytes);
            auto problems = table.verify();
            if (table.header.file_size != bytes.size())
              problems.push_back(fmt::format("file holds {} bytes, header says {}",
                                             bytes.size(), table.header.file_size));
            if (table.header.version > kFileVersion)
              problems.push_back(fmt::format("file version {} is newer than supported {}",
                                             table.header.version, kFileVersion));
            for (const auto &p : problems)
              out_ << c.file << ": " << p << "\n";
            if (problems.empty()) {
              out_ << c.file << ": ok (" << table.nodes.size() << " packages)\n";
              return 0;
            }
            return 1;
          }
          return 2;
        },
        *pr.cmd);
  } catch (const ParseError &e) {
    spdlog::error("corrupt package table: {}", e.what());
  } catch (const Error &e) {
    spdlog::error("{}", e.what());
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
  }
  return 1;
}

} // namespace pkgtable
