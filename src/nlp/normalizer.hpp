#pragma once

#include <string>

namespace minigpt::nlp {

// Canonical lookup key: Unicode-lowercased, leading and trailing Unicode
// whitespace removed. Internal spacing and punctuation are kept as-is.
// Input that is not valid UTF-8 is handled byte-wise with ASCII rules.
std::string Normalize(const std::string& text);

}  // namespace minigpt::nlp
