#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tree/tree_builder.hpp"

namespace hcodec {

// Whole-file binary helpers.
std::vector<uint8_t> read_all(const std::string& path);
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

// Weights file: one "<symbol> <frequency>" pair per line.
// Blank lines and lines starting with '#' are skipped. Order is preserved,
// since it decides tie-breaks when the tree is rebuilt.
Weights<std::string> load_weights(const std::string& path);
void save_weights(const std::string& path, const Weights<std::string>& weights);

// Token file: whitespace-separated symbols.
std::vector<std::string> load_tokens(const std::string& path);
void save_tokens(const std::string& path, const std::vector<std::string>& tokens);

// One CSV field: quoted (with doubled inner quotes) when it contains a comma,
// a quote or a line break, verbatim otherwise.
std::string csv_field(const std::string& value);

} // namespace hcodec
