#include "io/text_io.hpp"

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace hcodec {
namespace {

static std::runtime_error parse_error(const std::string& path, size_t line_no, const std::string& what) {
    return std::runtime_error("weights: " + path + ":" + std::to_string(line_no) + ": " + what);
}

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

std::vector<uint8_t> read_all(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    ifs.seekg(0, std::ios::end);
    std::streamsize n = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) throw std::runtime_error("Short read: " + path);
    return buf;
}

void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

Weights<std::string> load_weights(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);

    Weights<std::string> out;
    std::string line;
    size_t line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        std::istringstream ls(line);
        std::string symbol;
        if (!(ls >> symbol) || symbol[0] == '#') continue;

        std::string freq_str;
        if (!(ls >> freq_str)) throw parse_error(path, line_no, "missing frequency");
        std::string extra;
        if (ls >> extra) throw parse_error(path, line_no, "unexpected trailing field");
        if (!all_digits(freq_str)) throw parse_error(path, line_no, "frequency must be a non-negative integer");

        unsigned long long freq = 0;
        try {
            freq = std::stoull(freq_str);
        } catch (const std::out_of_range&) {
            throw parse_error(path, line_no, "frequency out of range");
        }
        if (freq > std::numeric_limits<uint32_t>::max()) {
            throw parse_error(path, line_no, "frequency out of range");
        }
        out.emplace_back(symbol, static_cast<uint32_t>(freq));
    }
    return out;
}

void save_weights(const std::string& path, const Weights<std::string>& weights) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    for (const auto& w : weights) {
        if (w.first.empty() || w.first[0] == '#') {
            throw std::runtime_error("weights: symbol cannot be stored: '" + w.first + "'");
        }
        for (char c : w.first) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                throw std::runtime_error("weights: symbol contains whitespace: '" + w.first + "'");
            }
        }
        ofs << w.first << " " << w.second << "\n";
    }
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

std::vector<std::string> load_tokens(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    std::vector<std::string> tokens;
    std::string tok;
    while (ifs >> tok) tokens.push_back(tok);
    return tokens;
}

void save_tokens(const std::string& path, const std::vector<std::string>& tokens) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i != 0) ofs << ' ';
        ofs << tokens[i];
    }
    ofs << "\n";
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace hcodec
