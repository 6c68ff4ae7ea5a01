#ifndef MATHGRADE_PARSER_BRACKET_VALIDATOR_H_
#define MATHGRADE_PARSER_BRACKET_VALIDATOR_H_

#include <string>

#include "util/error.h"

namespace mathgrade::parser {

/// Scans (), [] and {} in `formula` and throws a kParse util::Error positioned at the
/// offending bracket when they are unbalanced or mismatched.
void ValidateBrackets(const std::string& formula);

}  // namespace mathgrade::parser

#endif  // MATHGRADE_PARSER_BRACKET_VALIDATOR_H_
