#pragma once
/*
 * SystemManRenderer
 *
 * Purpose: IManRenderer backed by `man [SECTION] NAME | col -bx`.
 * Note: MANWIDTH carries the width and MANPAGER=cat keeps man non-interactive.
 */
#include "iman_renderer.hpp"

class SystemManRenderer : public IManRenderer {
public:
  std::optional<RenderError> render(const std::string& name,
                                    const std::optional<std::string>& section,
                                    int width,
                                    std::vector<std::string>& out) const override;
};
