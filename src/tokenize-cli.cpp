#include "lib/config.hpp"
#include "lib/errors.hpp"
#include "lib/io.hpp"
#include "lib/tokenizer.hpp"
#include "lib/visualize.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tokalign {

void to_json(nlohmann::json &j, const Encoding &encoding) {
    j["input_ids"] = encoding.input_ids;
    if (encoding.token_type_ids) j["token_type_ids"] = *encoding.token_type_ids;
    if (encoding.attention_mask) j["attention_mask"] = *encoding.attention_mask;
    if (encoding.special_tokens_mask) {
        j["special_tokens_mask"] = *encoding.special_tokens_mask;
    }
    if (encoding.offset_mapping) j["offset_mapping"] = *encoding.offset_mapping;
    if (encoding.position_ids) j["position_ids"] = *encoding.position_ids;
    if (encoding.length) j["length"] = *encoding.length;
}

} // namespace tokalign

int main(int argc, char *argv[]) {
    std::string config_path = "params.yaml";
    bool json = false;
    bool show_offsets = false;
    std::string input;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--json") {
            json = true;
        } else if (arg == "--offsets") {
            show_offsets = true;
        } else {
            if (!input.empty()) input += " ";
            input += arg;
        }
    }
    if (input.empty()) {
        std::cerr << "Usage: " << argv[0]
                  << " [--config params.yaml] [--json] [--offsets] <text to "
                     "tokenize...>"
                  << std::endl;
        std::cerr << "Example: " << argv[0] << " \"Hello world!\"" << std::endl;
        return 1;
    }

    try {
        tokalign::TokenizerConfig config = tokalign::load_config(config_path);
        auto vocab = tokalign::io::load_vocab(config.vocab_file);
        tokalign::Tokenizer tok(std::move(vocab), std::move(config));

        tokalign::EncodeOptions options;
        options.add_special_tokens = json;
        options.return_offsets_mapping = true;
        options.return_special_tokens_mask = json;
        tokalign::Encoding encoding = tok.encode(input, std::nullopt, options);

        if (json) {
            nlohmann::json out = encoding;
            out["tokens"] = tok.convert_ids_to_tokens(encoding.input_ids);
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        std::cout << tokalign::visualize(input, encoding.input_ids,
                                         *encoding.offset_mapping)
                  << std::endl;
        if (show_offsets) {
            const auto tokens = tok.convert_ids_to_tokens(encoding.input_ids);
            for (size_t i = 0; i < tokens.size(); ++i) {
                const auto [start, end] = (*encoding.offset_mapping)[i];
                std::cout << tokens[i] << "\t" << encoding.input_ids[i] << "\t["
                          << start << ", " << end << ")" << std::endl;
            }
        }
        std::cout << "\nTokens: " << encoding.input_ids.size() << std::endl;
    } catch (const tokalign::ConfigError &e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "[tokenize] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
