#pragma once

#include <string>
#include <unordered_set>

namespace weave {

using TokenSet = std::unordered_set<std::string>;

/// Normalised set of meaningful tokens in `text`.
///
/// - camelCase / PascalCase boundaries are split before lowercasing
///   ("useContextManager" → use, context, manager)
/// - whitespace and common punctuation separate tokens
/// - tokens shorter than 2 bytes and stop-words are dropped
///
/// tokenize("TypeScript generics") == {"type", "script", "generics"}
TokenSet tokenize(const std::string& text);

bool isStopWord(const std::string& token);

} // namespace weave
