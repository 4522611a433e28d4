#include "ParsleyUtil/ParsleyUtil.hpp"

ParsleyException::ParsleyException(std::optional<std::size_t> line)
    : line(line == std::optional<std::size_t>(0) ? std::nullopt : line) {}

const char *ParsleyException::what() const noexcept {
  this->err_str = "error: ";
  this->err_str += this->message();

  if (this->line.has_value()) {
    this->err_str += "\n  --> line ";
    this->err_str += std::to_string(this->line.value());
  }
  this->err_str += "\n";

  return this->err_str.c_str();
}

std::optional<std::size_t> ParsleyException::getLine() const {
  return this->line;
}

std::string ParsleyException::message() const { return "Parsley Exception"; }
