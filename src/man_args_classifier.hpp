#pragma once
/*
 * ManArgsClassifier
 *
 * Purpose: IArgsClassifier probing `man -w -S SECTION PAGE` for each candidate page.
 * Rule: the first token is a section as soon as one remaining page resolves under it.
 */
#include "iargs_classifier.hpp"

class ManArgsClassifier : public IArgsClassifier {
public:
  std::optional<ArgsInterpretation> classify(const std::vector<std::string>& args,
                                             std::string& msg) const override;
private:
  static bool page_exists_in_section(const std::string& section, const std::string& page,
                                     bool& exists, std::string& msg);
};
