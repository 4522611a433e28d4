#ifndef __PARSLEY_UTILS__
#define __PARSLEY_UTILS__

#include <cstddef>
#include <exception>
#include <optional>
#include <string>

class ParsleyException : public std::exception {
private:
  // Line of the grammar definition the error refers to, starting at `1`
  std::optional<std::size_t> line;
  mutable std::string err_str;
  virtual std::string message() const;

protected:
  ParsleyException(std::optional<std::size_t> line);

public:
  const char *what() const noexcept override;
  std::optional<std::size_t> getLine() const;
};

#endif
