#include "cli/cli_parser.hpp"
#include "codec/huffman.hpp"
#include "entropy/bitstream.hpp"
#include "io/text_io.hpp"

#include <iostream>

static const char* kUsage =
    "Usage: huff_encode --in <tokens.txt> --out <data.hbit> [--weights <w.txt>] [--weights-out <w.txt>]\n"
    "       (without --weights, frequencies are counted from the input and --weights-out is required)\n";

int main(int argc, char** argv) {
    try {
        hcodec::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        const std::string weights_in = cli.get("weights");
        const std::string weights_out = cli.get("weights-out");
        if (in.empty() || out.empty() || (weights_in.empty() && weights_out.empty())) {
            std::cout << kUsage;
            return 1;
        }

        const auto tokens = hcodec::load_tokens(in);
        const auto weights = weights_in.empty() ? hcodec::count_frequencies(tokens)
                                                : hcodec::load_weights(weights_in);
        if (!weights_out.empty()) {
            hcodec::save_weights(weights_out, weights);
        }

        auto codec = hcodec::Huffman<std::string>::construct(weights);
#ifndef NDEBUG
        const auto& tree = codec.decoder().tree();
        std::cerr << "alphabet=" << tree.leaf_count()
                  << " nodes=" << tree.node_count()
                  << " max_code_len=" << tree.max_depth() << "\n";
#endif
        const hcodec::BitVector bits = codec.encode(tokens);

        hcodec::ByteWriter w;
        hcodec::write_bitstream(w, bits);
        hcodec::write_all(out, w.bytes());

        std::cout << "symbols: " << tokens.size() << "\n";
        if (!weights_out.empty()) std::cout << "Wrote: " << weights_out << "\n";
        std::cout << "Wrote: " << out << " (" << bits.size() << " bits, " << w.bytes().size() << " bytes)\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
