#include "parser/bracket_validator.h"

#include <map>
#include <string>
#include <vector>

namespace mathgrade::parser {

namespace {

struct Bracket {
  char open;
  char close;
  const char* name;
  const char* plural;
};

const Bracket kBrackets[] = {
    {'(', ')', "parenthesis", "parentheses"},
    {'[', ']', "square bracket", "square brackets"},
    {'{', '}', "curly brace", "curly braces"},
};

const Bracket* FindOpener(char ch) {
  for (const auto& bracket : kBrackets) {
    if (bracket.open == ch) return &bracket;
  }
  return nullptr;
}

const Bracket* FindCloser(char ch) {
  for (const auto& bracket : kBrackets) {
    if (bracket.close == ch) return &bracket;
  }
  return nullptr;
}

struct StackEntry {
  int index;
  const Bracket* bracket;
};

}  // namespace

void ValidateBrackets(const std::string& formula) {
  std::vector<StackEntry> stack;
  for (size_t i = 0; i < formula.size(); ++i) {
    const int index = static_cast<int>(i);
    if (const Bracket* opener = FindOpener(formula[i])) {
      stack.push_back(StackEntry{index, opener});
      continue;
    }
    const Bracket* closer = FindCloser(formula[i]);
    if (!closer) continue;
    if (stack.empty()) {
      throw util::Error(util::ErrorKind::kParse,
                        std::string("Invalid Input: a ") + closer->name +
                            " was closed without ever being opened",
                        index, index + 1);
    }
    StackEntry previous = stack.back();
    stack.pop_back();
    if (previous.bracket != closer) {
      throw util::Error(util::ErrorKind::kParse,
                        std::string("Invalid Input: a ") + previous.bracket->name +
                            " was opened and then closed by a " + closer->name,
                        previous.index, index + 1);
    }
  }

  if (stack.empty()) return;

  // Ordered by bracket name so the message is stable.
  std::map<std::string, int> counts;
  std::map<std::string, const Bracket*> by_name;
  for (const auto& entry : stack) {
    ++counts[entry.bracket->name];
    by_name[entry.bracket->name] = entry.bracket;
  }
  std::string message = "Invalid Input:";
  for (const auto& kv : counts) {
    const Bracket* bracket = by_name[kv.first];
    message += "\n" + std::to_string(kv.second) + " ";
    if (kv.second == 1) {
      message += std::string(bracket->name) + " was opened without being closed";
    } else {
      message += std::string(bracket->plural) + " were opened without being closed";
    }
  }
  const int first = stack.front().index;
  throw util::Error(util::ErrorKind::kParse, message, first, first + 1);
}

}  // namespace mathgrade::parser
