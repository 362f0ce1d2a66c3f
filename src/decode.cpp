#include "lib/config.hpp"
#include "lib/io.hpp"
#include "lib/tokenizer.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    std::string config_path = "params.yaml";
    bool skip_special = false;
    std::vector<tokalign::TokenId> ids;
    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--skip-special") {
                skip_special = true;
            } else {
                ids.push_back(static_cast<tokalign::TokenId>(std::stoul(arg)));
            }
        }
    } catch (const std::logic_error &e) {
        std::cerr << "[decode] Invalid token id: " << e.what() << std::endl;
        return 1;
    }
    if (ids.empty()) {
        std::cerr << "Usage: " << argv[0]
                  << " [--config params.yaml] [--skip-special] <id...>"
                  << std::endl;
        return 1;
    }

    try {
        tokalign::TokenizerConfig config = tokalign::load_config(config_path);
        std::cout << "Loading vocabulary from " << config.vocab_file << "..."
                  << std::endl;
        auto vocab = tokalign::io::load_vocab(config.vocab_file);
        tokalign::Tokenizer tok(std::move(vocab), std::move(config));
        std::cout << "Tokenizer loaded (vocab size: " << tok.size() << ")"
                  << std::endl;

        const std::string decoded = tok.decode(ids, skip_special);
        std::cout << "\n" << std::string(80, '=') << std::endl;
        std::cout << decoded << std::endl;
        std::cout << std::string(80, '=') << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "[decode] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
