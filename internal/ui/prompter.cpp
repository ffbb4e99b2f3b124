#include "prompter.hpp"

#include <stdexcept>

namespace projmgr::ui {

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {
}

bool ConsolePrompter::Confirm(const std::string& question) {
  while (true) {
    out_ << question << " (y/n): " << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) {
      throw std::runtime_error("input closed while waiting for an answer");
    }
    if (!answer.empty() && (answer[0] == 'y' || answer[0] == 'Y')) {
      return true;
    }
    if (!answer.empty() && (answer[0] == 'n' || answer[0] == 'N')) {
      return false;
    }
    out_ << " - Please answer y or n.\n";
  }
}

std::string ConsolePrompter::Ask(const std::string& question) {
  out_ << question << ' ' << std::flush;
  std::string answer;
  if (!std::getline(in_, answer)) {
    throw std::runtime_error("input closed while waiting for an answer");
  }
  return answer;
}

} // namespace projmgr::ui
