#pragma once

// stressrig/jsonlite.hpp - Minimal JSON field extraction for config files and
// event lines. Flat lookups only: keys are matched anywhere in the text, so
// callers pass the innermost object they care about.

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace stressrig::jsonlite {

inline std::string unescape(const std::string& in) {
  std::string o;
  for (size_t i=0;i<in.size();++i) {
    if (in[i]=='\\' && i+1<in.size()) {
      char n=in[++i];
      if (n=='n') o += '\n';
      else if (n=='t') o += '\t';
      else if (n=='"') o += '"';
      else o += n;
    } else o += in[i];
  }
  return o;
}

inline std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size());
  for (char c : s) {
    if (c == '"') o += "\\\"";
    else if (c == '\\') o += "\\\\";
    else if (c == '\n') o += "\\n";
    else if (c == '\t') o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) o += ' ';
    else o += c;
  }
  return o;
}

inline bool has_key(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:");
  return std::regex_search(s, re);
}

inline std::string get_string(const std::string& s, const std::string& key, const std::string& def = "") {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  std::smatch m;
  if (std::regex_search(s, m, re)) return unescape(m[1].str());
  return def;
}

inline bool get_bool(const std::string& s, const std::string& key, bool def = false) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return m[1].str() == "true";
  return def;
}

inline unsigned long long get_u64(const std::string& s, const std::string& key, unsigned long long def = 0) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return std::stoull(m[1].str());
  return def;
}

inline std::vector<std::string> get_string_array(const std::string& s, const std::string& key) {
  std::vector<std::string> out;
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\[([^\\]]*)\\]");
  std::smatch m;
  if (!std::regex_search(s, m, re)) return out;
  std::regex item("\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  auto begin = std::sregex_iterator(m[1].first, m[1].second, item);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) out.push_back(unescape((*it)[1].str()));
  return out;
}

// Returns the raw text of each flat object in the array under `key`.
// Objects must not nest further objects; strings may contain braces.
inline std::vector<std::string> get_object_array(const std::string& s, const std::string& key) {
  std::vector<std::string> out;
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\[");
  std::smatch m;
  if (!std::regex_search(s, m, re)) return out;
  size_t i = static_cast<size_t>(m.position(0) + m.length(0));
  bool in_string = false;
  size_t obj_start = std::string::npos;
  for (; i < s.size(); ++i) {
    const char c = s[i];
    if (in_string) {
      if (c == '\\') ++i;
      else if (c == '"') in_string = false;
      continue;
    }
    if (c == '"') in_string = true;
    else if (c == '{') obj_start = i;
    else if (c == '}' && obj_start != std::string::npos) {
      out.push_back(s.substr(obj_start, i - obj_start + 1));
      obj_start = std::string::npos;
    } else if (c == ']' && obj_start == std::string::npos) {
      break;
    }
  }
  return out;
}

}  // namespace stressrig::jsonlite
