#pragma once

#include <string>
#include <unordered_map>

namespace hcodec {

// Very small CLI parser:
//   --key value
//   --flag (treated as "true")
// Anything not starting with "--" that is not a value is rejected.
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // Throws std::runtime_error when the value is not an integer.
    long long get_int(const std::string& key, long long def) const;
private:
    std::unordered_map<std::string, std::string> kv_;
};

} // namespace hcodec
