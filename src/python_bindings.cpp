#include "lib/config.hpp"
#include "lib/errors.hpp"
#include "lib/io.hpp"
#include "lib/tokenizer.hpp"
#include "lib/visualize.hpp"
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace tokalign;

PYBIND11_MODULE(tokalign_py, m) {
    m.doc() = "Python bindings for the tokalign tokenizer";

    py::register_exception<UsageError>(m, "UsageError", PyExc_ValueError);
    py::register_exception<AlignmentError>(m, "AlignmentError",
                                           PyExc_RuntimeError);
    py::register_exception<ConfigError>(m, "ConfigError", PyExc_RuntimeError);

    py::class_<AddedToken>(m, "AddedToken")
        .def(py::init<>())
        .def(py::init<std::string, bool, bool, bool, bool>(),
             py::arg("content"), py::arg("lstrip") = false,
             py::arg("rstrip") = false, py::arg("single_word") = false,
             py::arg("normalized") = true)
        .def_readwrite("content", &AddedToken::content)
        .def_readwrite("lstrip", &AddedToken::lstrip)
        .def_readwrite("rstrip", &AddedToken::rstrip)
        .def_readwrite("single_word", &AddedToken::single_word)
        .def_readwrite("normalized", &AddedToken::normalized);

    py::class_<SpecialTokensInput>(m, "SpecialTokensInput")
        .def(py::init<>())
        .def_readwrite("bos_token", &SpecialTokensInput::bos_token)
        .def_readwrite("eos_token", &SpecialTokensInput::eos_token)
        .def_readwrite("unk_token", &SpecialTokensInput::unk_token)
        .def_readwrite("sep_token", &SpecialTokensInput::sep_token)
        .def_readwrite("pad_token", &SpecialTokensInput::pad_token)
        .def_readwrite("cls_token", &SpecialTokensInput::cls_token)
        .def_readwrite("mask_token", &SpecialTokensInput::mask_token)
        .def_readwrite("additional_special_tokens",
                       &SpecialTokensInput::additional_special_tokens)
        .def_readwrite("behaviors", &SpecialTokensInput::behaviors)
        .def("all", &SpecialTokensInput::all);

    py::enum_<ModelType>(m, "ModelType")
        .value("wordpiece", ModelType::wordpiece)
        .value("pattern", ModelType::pattern);
    py::enum_<LayoutType>(m, "LayoutType")
        .value("plain", LayoutType::plain)
        .value("bert", LayoutType::bert);
    py::enum_<PaddingSide>(m, "PaddingSide")
        .value("right", PaddingSide::right)
        .value("left", PaddingSide::left);
    py::enum_<PaddingStrategy>(m, "PaddingStrategy")
        .value("do_not_pad", PaddingStrategy::DoNotPad)
        .value("longest", PaddingStrategy::Longest)
        .value("max_length", PaddingStrategy::MaxLength);
    py::enum_<TruncationStrategy>(m, "TruncationStrategy")
        .value("do_not_truncate", TruncationStrategy::DoNotTruncate)
        .value("longest_first", TruncationStrategy::LongestFirst)
        .value("only_first", TruncationStrategy::OnlyFirst)
        .value("only_second", TruncationStrategy::OnlySecond);

    py::class_<TokenizerConfig>(m, "TokenizerConfig")
        .def(py::init<>())
        .def_readwrite("special_tokens", &TokenizerConfig::special_tokens)
        .def_readwrite("added_tokens", &TokenizerConfig::added_tokens)
        .def_readwrite("do_lower_case", &TokenizerConfig::do_lower_case)
        .def_readwrite("strip_accents", &TokenizerConfig::strip_accents)
        .def_readwrite("tokenize_chinese_chars",
                       &TokenizerConfig::tokenize_chinese_chars)
        .def_readwrite("normalize_chars", &TokenizerConfig::normalize_chars)
        .def_readwrite("tokenize_special_chars",
                       &TokenizerConfig::tokenize_special_chars)
        .def_readwrite("model", &TokenizerConfig::model)
        .def_readwrite("pattern", &TokenizerConfig::pattern)
        .def_readwrite("continuing_subword_prefix",
                       &TokenizerConfig::continuing_subword_prefix)
        .def_readwrite("max_input_chars_per_word",
                       &TokenizerConfig::max_input_chars_per_word)
        .def_readwrite("layout", &TokenizerConfig::layout)
        .def_readwrite("model_max_length", &TokenizerConfig::model_max_length)
        .def_readwrite("padding_side", &TokenizerConfig::padding_side)
        .def_readwrite("pad_token_type_id", &TokenizerConfig::pad_token_type_id)
        .def_readwrite("model_input_names", &TokenizerConfig::model_input_names)
        .def_readwrite("verbose", &TokenizerConfig::verbose)
        .def_readwrite("vocab_file", &TokenizerConfig::vocab_file);

    m.def("load_config", &load_config, py::arg("path"),
          "Read the tokenizer section of a YAML file");
    m.def("parse_config", &parse_config, py::arg("yaml_text"));

    py::class_<EncodeOptions>(m, "EncodeOptions")
        .def(py::init<>())
        .def_readwrite("add_special_tokens", &EncodeOptions::add_special_tokens)
        .def_readwrite("padding", &EncodeOptions::padding)
        .def_readwrite("truncation", &EncodeOptions::truncation)
        .def_readwrite("max_length", &EncodeOptions::max_length)
        .def_readwrite("stride", &EncodeOptions::stride)
        .def_readwrite("pad_to_multiple_of", &EncodeOptions::pad_to_multiple_of)
        .def_readwrite("is_split_into_words", &EncodeOptions::is_split_into_words)
        .def_readwrite("return_token_type_ids",
                       &EncodeOptions::return_token_type_ids)
        .def_readwrite("return_attention_mask",
                       &EncodeOptions::return_attention_mask)
        .def_readwrite("return_position_ids", &EncodeOptions::return_position_ids)
        .def_readwrite("return_overflowing_tokens",
                       &EncodeOptions::return_overflowing_tokens)
        .def_readwrite("return_special_tokens_mask",
                       &EncodeOptions::return_special_tokens_mask)
        .def_readwrite("return_offsets_mapping",
                       &EncodeOptions::return_offsets_mapping)
        .def_readwrite("return_length", &EncodeOptions::return_length)
        .def_readwrite("num_threads", &EncodeOptions::num_threads);

    py::class_<Encoding>(m, "Encoding")
        .def(py::init<>())
        .def_readwrite("input_ids", &Encoding::input_ids)
        .def_readwrite("token_type_ids", &Encoding::token_type_ids)
        .def_readwrite("attention_mask", &Encoding::attention_mask)
        .def_readwrite("special_tokens_mask", &Encoding::special_tokens_mask)
        .def_readwrite("offset_mapping", &Encoding::offset_mapping)
        .def_readwrite("position_ids", &Encoding::position_ids)
        .def_readwrite("length", &Encoding::length)
        .def_readwrite("overflow_to_sample", &Encoding::overflow_to_sample)
        .def_readwrite("overflowing_tokens", &Encoding::overflowing_tokens)
        .def_readwrite("num_truncated_tokens", &Encoding::num_truncated_tokens);

    py::class_<EncodeExample>(m, "EncodeExample")
        .def(py::init<EncodeInput, std::optional<EncodeInput>>(),
             py::arg("first"), py::arg("second") = std::nullopt)
        .def_readwrite("first", &EncodeExample::first)
        .def_readwrite("second", &EncodeExample::second);

    py::class_<Tokenizer>(m, "Tokenizer")
        .def(py::init<std::vector<std::string>, TokenizerConfig, PreTokenizer>(),
             py::arg("vocab"), py::arg("config"),
             py::arg("pre_tokenizer") = nullptr)
        .def("tokenize", &Tokenizer::tokenize, py::arg("text"))
        .def("get_offset_mapping", &Tokenizer::get_offset_mapping,
             py::arg("text"))
        .def("add_tokens", &Tokenizer::add_tokens, py::arg("tokens"),
             py::arg("special") = false)
        .def("add_special_tokens", &Tokenizer::add_special_tokens,
             py::arg("tokens"))
        .def("convert_tokens_to_ids", &Tokenizer::convert_tokens_to_ids,
             py::arg("tokens"))
        .def("convert_ids_to_tokens", &Tokenizer::convert_ids_to_tokens,
             py::arg("ids"), py::arg("skip_special_tokens") = false)
        .def("convert_tokens_to_string", &Tokenizer::convert_tokens_to_string,
             py::arg("tokens"))
        .def("encode", &Tokenizer::encode, py::arg("text"),
             py::arg("text_pair") = std::nullopt,
             py::arg("options") = EncodeOptions())
        .def("encode_batch", &Tokenizer::encode_batch, py::arg("examples"),
             py::arg("options") = EncodeOptions())
        .def("decode", &Tokenizer::decode, py::arg("ids"),
             py::arg("skip_special_tokens") = false,
             py::arg("clean_up_tokenization_spaces") = true,
             py::arg("spaces_between_special_tokens") = true)
        .def("visualize",
             [](const Tokenizer &tok, const std::string &text) {
                 EncodeOptions options;
                 options.add_special_tokens = false;
                 options.return_offsets_mapping = true;
                 Encoding encoding = tok.encode(text, std::nullopt, options);
                 return visualize(text, encoding.input_ids,
                                  *encoding.offset_mapping);
             },
             py::arg("text"))
        .def_property_readonly("all_special_tokens",
                               &Tokenizer::all_special_tokens)
        .def_property_readonly("no_split_tokens", &Tokenizer::no_split_tokens)
        .def("__len__", &Tokenizer::size);

    m.def("load_vocab", &io::load_vocab, py::arg("filename"));
    m.def("save_vocab", &io::save_vocab, py::arg("tokens"), py::arg("filename"));
    m.def("save", &io::save, py::arg("tokenizer"), py::arg("filename"),
          "Save tokenizer to a binary file");
    m.def("load", &io::load, py::arg("filename"),
          py::arg("pre_tokenizer") = nullptr,
          "Load tokenizer from a binary file");
}
