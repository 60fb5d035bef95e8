#pragma once
/*
 * IManRenderer
 *
 * Purpose: abstract source of display lines for a manual page at a width.
 * Goal: keep ManPage/Session independent from the man process, enable testing.
 */
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct RenderError {
  // NotFound: the page/section does not exist (recoverable).
  // Io: the renderer itself malfunctioned (spawn, pipe, read, filter).
  enum class Kind { NotFound, Io };
  Kind kind = Kind::Io;
  std::string message;

  bool recoverable() const { return kind == Kind::NotFound; }
};

class IManRenderer {
public:
  virtual ~IManRenderer() = default;
  // Fills `out` and returns nullopt on success; `out` is unspecified on error.
  virtual std::optional<RenderError> render(const std::string& name,
                                            const std::optional<std::string>& section,
                                            int width,
                                            std::vector<std::string>& out) const = 0;
};

// Thrown out of Session when a non-recoverable render error must end the run.
class RenderFault : public std::runtime_error {
public:
  explicit RenderFault(RenderError err)
    : std::runtime_error(err.message), error_(std::move(err)) {}
  const RenderError& error() const { return error_; }
private:
  RenderError error_;
};
