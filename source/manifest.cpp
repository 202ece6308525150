#include <pkgtable/manifest.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <unordered_set>

namespace fs = std::filesystem;

namespace pkgtable {

static std::string trim(std::string s){
  while(!s.empty() && (s.back()==' '||s.back()=='\t'||s.back()=='\r'||s.back()=='\n')) s.pop_back();
  size_t i=0; while(i<s.size() && (s[i]==' '||s[i]=='\t')) ++i; return s.substr(i);
}

static std::string strip_comment(const std::string& s){
  auto pos = s.find_first_of("#;");
  return pos==std::string::npos ? s : s.substr(0,pos);
}

static uint32_t parse_u32(const std::string& v, const std::string& origin, int line_no){
  if (v.empty() || v[0]=='-' || v[0]=='+')
    throw ManifestError(fmt::format("{}:{}: expected a non-negative number, got '{}'", origin, line_no, v));
  errno = 0;
  char* end = nullptr;
  unsigned long long n = std::strtoull(v.c_str(), &end, 10);
  if (errno==ERANGE || *end!='\0' || n > std::numeric_limits<uint32_t>::max())
    throw ManifestError(fmt::format("{}:{}: '{}' is not a 32-bit number", origin, line_no, v));
  return static_cast<uint32_t>(n);
}

enum class Section { None, Container, Packages, Unknown };

Manifest Manifest::Parse(std::istream& in, const std::string& origin) {
  Manifest m;
  Section sec = Section::None;
  std::unordered_set<std::string> seen;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    line = trim(strip_comment(line));
    if (line.empty()) continue;
    if (line.front()=='[') {
      if (line.back()!=']')
        throw ManifestError(fmt::format("{}:{}: unterminated section header", origin, line_no));
      if (line=="[Container]") sec = Section::Container;
      else if (line=="[Packages]") sec = Section::Packages;
      else {
        spdlog::warn("{}:{}: unknown section {}, ignored", origin, line_no, line);
        sec = Section::Unknown;
      }
      continue;
    }

    auto eq = line.find('=');
    if (eq==std::string::npos)
      throw ManifestError(fmt::format("{}:{}: expected key=value", origin, line_no));
    auto key = trim(line.substr(0,eq));
    auto val = trim(line.substr(eq+1));
    if (key.empty())
      throw ManifestError(fmt::format("{}:{}: empty key", origin, line_no));

    switch (sec) {
    case Section::Container:
      if (key=="Name") m.container = val;
      else if (key=="Version") m.version = parse_u32(val, origin, line_no);
      else spdlog::warn("{}:{}: unknown key '{}' in [Container]", origin, line_no, key);
      break;
    case Section::Packages:
      if (!seen.insert(key).second)
        throw ManifestError(fmt::format("{}:{}: package '{}' listed twice", origin, line_no, key));
      m.packages.push_back(PackageSpec{key, parse_u32(val, origin, line_no)});
      break;
    case Section::None:
      throw ManifestError(fmt::format("{}:{}: key '{}' outside of a section", origin, line_no, key));
    case Section::Unknown:
      break;
    }
  }

  if (m.container.empty())
    throw ManifestError(fmt::format("{}: [Container] Name is required", origin));
  return m;
}

Manifest Manifest::Load(const fs::path& p) {
  std::ifstream in(p);
  if (!in) throw ManifestError("Manifest file not found: " + p.string());
  Manifest m = Parse(in, p.string());
  m.path = fs::absolute(p);
  spdlog::debug("[manifest={}] container={} packages={}", m.path.string(), m.container, m.packages.size());
  return m;
}

} // namespace pkgtable
