#include "cli/cli_parser.hpp"

#include <stdexcept>

namespace hcodec {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) != 0 || a.size() == 2) {
            throw std::runtime_error("unexpected argument: " + a);
        }
        std::string key = a.substr(2);
        std::string val = "true";
        if (i + 1 < argc) {
            std::string next = argv[i + 1] ? argv[i + 1] : "";
            if (next.rfind("--", 0) != 0) {
                val = next;
                ++i;
            }
        }
        kv_[key] = val;
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

long long CliParser::get_int(const std::string& key, long long def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(it->second, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("--" + key + " must be an integer");
    }
    if (used != it->second.size()) {
        throw std::runtime_error("--" + key + " must be an integer");
    }
    return v;
}

} // namespace hcodec
