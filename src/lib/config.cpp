#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace tokalign {

std::vector<std::string> SpecialTokensInput::all() const {
    std::vector<std::string> out;
    auto push = [&out](const std::string &token) {
        if (token.empty()) return;
        if (std::find(out.begin(), out.end(), token) == out.end()) {
            out.push_back(token);
        }
    };
    for (const auto *slot : {&bos_token, &eos_token, &unk_token, &sep_token,
                             &pad_token, &cls_token, &mask_token}) {
        push(*slot);
    }
    for (const auto &token : additional_special_tokens) {
        push(token);
    }
    return out;
}

bool TokenizerConfig::wants_input(const std::string &name) const {
    return std::find(model_input_names.begin(), model_input_names.end(),
                     name) != model_input_names.end();
}

namespace {

template <typename T>
void read(const YAML::Node &node, const std::string &key, T &out) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return;
    try {
        out = value.as<T>();
    } catch (const YAML::Exception &e) {
        throw ConfigError("invalid value for '" + key + "': " + e.what());
    }
}

template <typename T>
void read(const YAML::Node &node, const std::string &key,
          std::optional<T> &out) {
    T value{};
    const YAML::Node raw = node[key];
    if (!raw || raw.IsNull()) return;
    read(node, key, value);
    out = value;
}

// A token is either a plain scalar or a map with stripping metadata
AddedToken read_token(const YAML::Node &value, const std::string &key,
                      bool &has_behavior) {
    has_behavior = false;
    if (value.IsScalar()) {
        return AddedToken(value.as<std::string>());
    }
    if (!value.IsMap()) {
        throw ConfigError("'" + key + "' must be a string or a map");
    }
    AddedToken token;
    read(value, "content", token.content);
    if (token.content.empty()) {
        throw ConfigError("'" + key + "' has no content");
    }
    read(value, "lstrip", token.lstrip);
    read(value, "rstrip", token.rstrip);
    read(value, "single_word", token.single_word);
    read(value, "normalized", token.normalized);
    has_behavior = true;
    return token;
}

void read_special_tokens(const YAML::Node &node, SpecialTokensInput &out) {
    struct Slot {
        const char *key;
        std::string *target;
    };
    const Slot slots[] = {
        {"bos_token", &out.bos_token}, {"eos_token", &out.eos_token},
        {"unk_token", &out.unk_token}, {"sep_token", &out.sep_token},
        {"pad_token", &out.pad_token}, {"cls_token", &out.cls_token},
        {"mask_token", &out.mask_token},
    };
    for (const auto &slot : slots) {
        const YAML::Node value = node[slot.key];
        if (!value || value.IsNull()) continue;
        bool has_behavior = false;
        AddedToken token = read_token(value, slot.key, has_behavior);
        *slot.target = token.content;
        if (has_behavior) out.behaviors.push_back(token);
    }

    const YAML::Node additional = node["additional_special_tokens"];
    if (additional && !additional.IsNull()) {
        if (!additional.IsSequence()) {
            throw ConfigError("'additional_special_tokens' must be a list");
        }
        for (const auto &value : additional) {
            bool has_behavior = false;
            AddedToken token =
                read_token(value, "additional_special_tokens", has_behavior);
            out.additional_special_tokens.push_back(token.content);
            if (has_behavior) out.behaviors.push_back(token);
        }
    }
}

ModelType parse_model(const std::string &name) {
    if (name == "wordpiece") return ModelType::wordpiece;
    if (name == "pattern") return ModelType::pattern;
    throw ConfigError("unknown model '" + name +
                      "' (expected wordpiece or pattern)");
}

LayoutType parse_layout(const std::string &name) {
    if (name == "plain") return LayoutType::plain;
    if (name == "bert") return LayoutType::bert;
    throw ConfigError("unknown layout '" + name + "' (expected plain or bert)");
}

PaddingSide parse_padding_side(const std::string &name) {
    if (name == "right") return PaddingSide::right;
    if (name == "left") return PaddingSide::left;
    throw ConfigError("unknown padding_side '" + name +
                      "' (expected right or left)");
}

TokenizerConfig from_node(const YAML::Node &root) {
    const YAML::Node node = root["tokenizer"];
    if (!node || !node.IsMap()) {
        throw ConfigError("missing 'tokenizer' section");
    }

    TokenizerConfig config;
    read(node, "vocab_file", config.vocab_file);
    read(node, "do_lower_case", config.do_lower_case);
    read(node, "strip_accents", config.strip_accents);
    read(node, "tokenize_chinese_chars", config.tokenize_chinese_chars);
    read(node, "normalize_chars", config.normalize_chars);
    read(node, "tokenize_special_chars", config.tokenize_special_chars);
    read(node, "pattern", config.pattern);
    read(node, "continuing_subword_prefix", config.continuing_subword_prefix);
    read(node, "max_input_chars_per_word", config.max_input_chars_per_word);
    read(node, "model_max_length", config.model_max_length);
    read(node, "pad_token_type_id", config.pad_token_type_id);
    read(node, "model_input_names", config.model_input_names);
    read(node, "verbose", config.verbose);

    std::string name;
    if (node["model"]) {
        read(node, "model", name);
        config.model = parse_model(name);
    }
    if (node["layout"]) {
        read(node, "layout", name);
        config.layout = parse_layout(name);
    }
    if (node["padding_side"]) {
        read(node, "padding_side", name);
        config.padding_side = parse_padding_side(name);
    }

    const YAML::Node special = node["special_tokens"];
    if (special && !special.IsNull()) {
        if (!special.IsMap()) {
            throw ConfigError("'special_tokens' must be a map");
        }
        read_special_tokens(special, config.special_tokens);
    }

    const YAML::Node added = node["added_tokens"];
    if (added && !added.IsNull()) {
        if (!added.IsSequence()) {
            throw ConfigError("'added_tokens' must be a list");
        }
        for (const auto &value : added) {
            bool has_behavior = false;
            config.added_tokens.push_back(
                read_token(value, "added_tokens", has_behavior).content);
        }
    }
    return config;
}

} // namespace

TokenizerConfig load_config(const std::string &path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        throw ConfigError("failed to read config " + path + ": " + e.what());
    }
    return from_node(root);
}

TokenizerConfig parse_config(const std::string &yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception &e) {
        throw ConfigError(std::string("failed to parse config: ") + e.what());
    }
    return from_node(root);
}

} // namespace tokalign
