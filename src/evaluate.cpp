// Code quality report: average code length vs entropy, optional round trip
// of a token file against the fixed-length baseline.
#include "cli/cli_parser.hpp"
#include "codec/huffman.hpp"
#include "io/text_io.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* kUsage =
    "Usage: huff_evaluate --weights <w.txt> [--in <tokens.txt>] [--out <codes.csv>] [--tree] [--limit <n>]\n";

struct CodeRow {
    std::string symbol;
    uint64_t freq;
    std::string code;
};

std::vector<CodeRow> collect_rows(const hcodec::Huffman<std::string>& codec) {
    const auto& tree = codec.decoder().tree();
    std::vector<CodeRow> rows;
    rows.reserve(tree.leaf_count());
    for (size_t i = 0; i < tree.node_count(); ++i) {
        const int idx = static_cast<int>(i);
        if (!tree.is_leaf(idx)) continue;
        const std::string& s = tree.symbol(idx);
        rows.push_back({s, tree.node(idx).freq, codec.encoder().code_for(s).to_string()});
    }
    return rows;
}

void write_csv(const std::string& path, const std::vector<CodeRow>& rows) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.good()) throw std::runtime_error("Cannot write csv: " + path);
    ofs << "symbol,frequency,code_length,code\n";
    for (const auto& r : rows) {
        ofs << hcodec::csv_field(r.symbol) << "," << r.freq << "," << r.code.size() << "," << r.code << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        hcodec::CliParser cli;
        cli.parse(argc, argv);
        const std::string weights_in = cli.get("weights");
        if (weights_in.empty()) {
            std::cerr << kUsage;
            return 1;
        }
        const long long limit = cli.get_int("limit", 20);
        if (limit < 0) throw std::runtime_error("--limit must be non-negative");

        const auto weights = hcodec::load_weights(weights_in);
        const auto codec = hcodec::Huffman<std::string>::construct(weights);
        const auto rows = collect_rows(codec);

        std::vector<uint64_t> freqs;
        uint64_t total = 0;
        uint64_t weighted_bits = 0;
        for (const auto& r : rows) {
            freqs.push_back(r.freq);
            total += r.freq;
            weighted_bits += r.freq * r.code.size();
        }
        const double avg_len = total > 0 ? static_cast<double>(weighted_bits) / static_cast<double>(total) : 0.0;

        std::cout << "alphabet: " << rows.size() << "\n";
        std::cout << "max code length: " << codec.decoder().tree().max_depth() << "\n";
        std::cout << "entropy: " << hcodec::shannon_entropy(freqs) << " bits/symbol\n";
        std::cout << "average code length: " << avg_len << " bits/symbol\n";
        std::cout << "fixed-length code: " << hcodec::fixed_code_length(rows.size()) << " bits/symbol\n";

        size_t shown = 0;
        for (const auto& r : rows) {
            if (shown++ >= static_cast<size_t>(limit)) {
                std::cout << "  ... (" << rows.size() - static_cast<size_t>(limit) << " more)\n";
                break;
            }
            std::cout << "  " << r.symbol << " " << r.freq << " " << r.code << "\n";
        }

        if (cli.has("tree")) {
            codec.decoder().tree().print(std::cout);
        }

        if (cli.has("in")) {
            const auto tokens = hcodec::load_tokens(cli.get("in"));
            const hcodec::BitVector bits = codec.encode(tokens);
            if (codec.decode_owned(bits) != tokens) {
                throw std::runtime_error("round-trip mismatch");
            }
            const uint64_t baseline = static_cast<uint64_t>(hcodec::fixed_code_length(rows.size())) * tokens.size();
            std::cout << "symbols: " << tokens.size() << "\n";
            std::cout << "encoded bits: " << bits.size() << "\n";
            std::cout << "fixed-length bits: " << baseline << "\n";
            if (!bits.empty()) {
                std::cout << "ratio: " << static_cast<double>(baseline) / static_cast<double>(bits.size()) << "\n";
            }
            std::cout << "round trip: ok\n";
        }

        if (cli.has("out")) {
            write_csv(cli.get("out"), rows);
            std::cout << "Wrote: " << cli.get("out") << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        std::cerr << kUsage;
        return 2;
    }
}
