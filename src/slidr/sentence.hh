#ifndef SLIDR_SENTENCE_HH
#define SLIDR_SENTENCE_HH

#include <string_view>
#include <vector>

namespace Slidr::Sentence
{

// split text into sentences, keeping terminal punctuation attached
// a run of '.', '!' or '?' ends a sentence only when followed by
// whitespace or the end of the text, trailing text without terminal
// punctuation forms the last sentence
// abbreviations, decimals and ellipses get no special handling
// returned views refer into 'text' and are trimmed
std::vector<std::string_view> segment(std::string_view text);

} // namespace Slidr::Sentence

#endif // SLIDR_SENTENCE_HH
