#include "cli/cli_parser.hpp"
#include "codec/huffman.hpp"
#include "entropy/bitstream.hpp"
#include "io/text_io.hpp"

#include <iostream>

int main(int argc, char** argv) {
    try {
        hcodec::CliParser cli;
        cli.parse(argc, argv);
        const std::string weights_in = cli.get("weights");
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (weights_in.empty() || in.empty() || out.empty()) {
            std::cerr << "Usage: huff_decode --weights <w.txt> --in <data.hbit> --out <tokens.txt> [--strict]\n";
            return 1;
        }

        hcodec::CodecOptions opts;
        if (cli.has("strict")) opts.on_truncation = hcodec::TruncationPolicy::error;

        const auto weights = hcodec::load_weights(weights_in);
        auto decoder = hcodec::Huffman<std::string>::construct(weights, opts).split().second;

        const hcodec::BitVector bits = hcodec::read_bitstream(hcodec::read_all(in));
        const auto tokens = decoder.decode_owned(bits);
        hcodec::save_tokens(out, tokens);

        std::cout << "symbols: " << tokens.size() << "\n";
        std::cout << "Wrote: " << out << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
