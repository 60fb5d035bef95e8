#pragma once
// Test doubles for the renderer and argument classifier.
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "iargs_classifier.hpp"
#include "iman_renderer.hpp"

// 50 lines of "name:width"; counts invocations.
class CountingRenderer : public IManRenderer {
public:
  std::optional<RenderError> render(const std::string& name, const std::optional<std::string>&,
                                    int width, std::vector<std::string>& out) const override {
    calls++;
    out.assign(50, name + ":" + std::to_string(width));
    return std::nullopt;
  }
  mutable int calls = 0;
};

// Same fixed lines for every page.
class LinesRenderer : public IManRenderer {
public:
  explicit LinesRenderer(std::vector<std::string> lines) : lines_(std::move(lines)) {}
  std::optional<RenderError> render(const std::string&, const std::optional<std::string>&,
                                    int, std::vector<std::string>& out) const override {
    out = lines_;
    return std::nullopt;
  }
private:
  std::vector<std::string> lines_;
};

// Fails with `kind` for the listed names (all names when the set is empty).
class FailingRenderer : public IManRenderer {
public:
  FailingRenderer(RenderError::Kind kind, std::set<std::string> names = {})
    : kind_(kind), names_(std::move(names)) {}
  std::optional<RenderError> render(const std::string& name, const std::optional<std::string>& section,
                                    int width, std::vector<std::string>& out) const override {
    if (names_.empty() || names_.count(name)) {
      if (kind_ == RenderError::Kind::NotFound) return RenderError{kind_, "No manual entry for " + name};
      return RenderError{kind_, "cannot run man: broken pipe"};
    }
    out.assign(30, name + (section ? "(" + *section + ")" : std::string()) + " " + std::to_string(width));
    return std::nullopt;
  }
private:
  RenderError::Kind kind_;
  std::set<std::string> names_;
};

class StubClassifier : public IArgsClassifier {
public:
  explicit StubClassifier(std::optional<ArgsInterpretation> result = std::nullopt) : result_(std::move(result)) {}
  std::optional<ArgsInterpretation> classify(const std::vector<std::string>& args, std::string& msg) const override {
    calls++;
    if (result_) return result_;
    if (args.size() < 2) return ArgsInterpretation{std::nullopt, args};
    msg = "classifier unavailable";
    return std::nullopt;
  }
  mutable int calls = 0;
private:
  std::optional<ArgsInterpretation> result_;
};

inline std::vector<std::string> numbered_lines(int n, const std::string& prefix = "line ") {
  std::vector<std::string> out;
  for (int i = 0; i < n; ++i) out.push_back(prefix + std::to_string(i));
  return out;
}
