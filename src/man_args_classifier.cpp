#include "man_args_classifier.hpp"
#include <spdlog/spdlog.h>
#include "process.hpp"

bool ManArgsClassifier::page_exists_in_section(const std::string& section, const std::string& page,
                                               bool& exists, std::string& msg) {
  SpawnSpec spec;
  spec.argv = {"man", "-w", "-S", section, page};
  ChildProcess child;
  if (!spawn_process(spec, child, msg)) return false;
  int code = 0;
  if (!wait_process(child.pid, code, msg)) return false;
  exists = (code == 0);
  return true;
}

std::optional<ArgsInterpretation> ManArgsClassifier::classify(const std::vector<std::string>& args,
                                                              std::string& msg) const {
  if (args.size() < 2) return ArgsInterpretation{std::nullopt, args};

  const std::string& candidate = args.front();
  std::vector<std::string> pages(args.begin() + 1, args.end());
  for (const auto& page : pages) {
    bool exists = false;
    if (!page_exists_in_section(candidate, page, exists, msg)) return std::nullopt;
    if (exists) {
      spdlog::debug("classify: '{}' resolves in section {}", page, candidate);
      return ArgsInterpretation{candidate, std::move(pages)};
    }
  }
  return ArgsInterpretation{std::nullopt, args};
}
