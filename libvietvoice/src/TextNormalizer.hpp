#ifndef VIETVOICE_TEXT_NORMALIZER_H
#define VIETVOICE_TEXT_NORMALIZER_H

#include <cstddef>
#include <string>

namespace vietvoice {

// Keep only characters the model can read (latin alphabet, digits, Vietnamese
// letters and basic punctuation), fold ;:() into commas and collapse repeats.
// Throws InvalidInputError if nothing readable is left.
std::string normalizeText(const std::string& text);

// UTF-8 byte length plus a weight of 3 for each pause mark (.,;:!?)
std::size_t weightedLength(const std::string& text);

// Number of Unicode code points in a UTF-8 string
std::size_t codepointLength(const std::string& text);

} // namespace vietvoice

#endif // VIETVOICE_TEXT_NORMALIZER_H
