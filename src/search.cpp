#include "search.hpp"

static std::vector<int> kmp_build(const std::string& pat) {
  std::vector<int> pi(pat.size(), 0);
  for (size_t i = 1, j = 0; i < pat.size(); ++i) {
    while (j > 0 && pat[i] != pat[j]) j = pi[j - 1];
    if (pat[i] == pat[j]) ++j;
    pi[i] = (int)j;
  }
  return pi;
}

static void kmp_scan(const std::string& s, const std::string& pat, const std::vector<int>& pi, std::vector<int>& out) {
  size_t j = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    while (j > 0 && s[i] != pat[j]) j = pi[j - 1];
    if (s[i] == pat[j]) ++j;
    if (j == pat.size()) { out.push_back((int)(i + 1 - pat.size())); j = 0; }
  }
}

void find_all_literal(const std::string& s, const std::string& pat, std::vector<int>& out) {
  out.clear();
  if (pat.empty()) return;
  kmp_scan(s, pat, kmp_build(pat), out);
}

std::vector<SearchMatch> collect_matches(const std::vector<std::string>& lines, const std::string& query) {
  std::vector<SearchMatch> matches;
  if (query.empty()) return matches;
  auto pi = kmp_build(query);
  int len = (int)query.size();
  std::vector<int> pos;
  for (int r = 0; r < (int)lines.size(); ++r) {
    pos.clear();
    kmp_scan(lines[r], query, pi, pos);
    for (int p : pos) matches.push_back({r, p, p + len});
  }
  return matches;
}
