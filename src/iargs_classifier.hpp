#pragma once
/*
 * IArgsClassifier
 *
 * Purpose: decide whether `A B C...` means "section A, pages B C..." or "pages A B C...".
 * Goal: keep command parsing testable without probing the man database.
 */
#include <optional>
#include <string>
#include <vector>

struct ArgsInterpretation {
  std::optional<std::string> section; // set: section + pages, unset: plain page list
  std::vector<std::string> pages;
  bool operator==(const ArgsInterpretation&) const = default;
};

class IArgsClassifier {
public:
  virtual ~IArgsClassifier() = default;
  // nullopt with msg set when the classifier itself fails.
  virtual std::optional<ArgsInterpretation> classify(const std::vector<std::string>& args,
                                                     std::string& msg) const = 0;
};
