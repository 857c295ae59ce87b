#ifndef ITEM_EXTRACTOR_H
#define ITEM_EXTRACTOR_H

#include <vector>
#include <string>
#include <memory>
#include <cctype>
#include "errors.h"

// Turns the raw items field of one row into item labels.
// Duplicates may be returned; the transaction store collapses them.
class ItemExtractor {
public:
    virtual ~ItemExtractor() = default;

    virtual std::string name() const = 0;
    virtual std::vector<std::string> extract(const std::string& field) const = 0;
};

// Length in bytes of the UTF-8 sequence starting with lead byte c, 0 if c cannot start one.
inline size_t utf8_sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

inline bool is_utf8_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// One item per character: "ABC" -> {A, B, C}. Multi-byte UTF-8 characters stay whole.
// Malformed UTF-8 throws DataIngestionError instead of merging bytes into a wrong item.
class CharacterItemExtractor : public ItemExtractor {
public:
    std::string name() const override { return "chars"; }

    std::vector<std::string> extract(const std::string& field) const override {
        std::vector<std::string> items;
        items.reserve(field.size());
        size_t i = 0;
        while (i < field.size()) {
            size_t len = utf8_sequence_length(static_cast<unsigned char>(field[i]));
            if (len == 0 || i + len > field.size()) {
                throw DataIngestionError("Malformed UTF-8 at byte " + std::to_string(i) + " of items field");
            }
            for (size_t j = 1; j < len; ++j) {
                if (!is_utf8_continuation(static_cast<unsigned char>(field[i + j]))) {
                    throw DataIngestionError("Malformed UTF-8 at byte " + std::to_string(i) + " of items field");
                }
            }
            items.push_back(field.substr(i, len));
            i += len;
        }
        return items;
    }
};

// One item per word. Lower-cases ASCII, keeps UTF-8 bytes, splits on punctuation and whitespace.
class TokenItemExtractor : public ItemExtractor {
public:
    std::string name() const override { return "tokens"; }

    std::vector<std::string> extract(const std::string& field) const override {
        std::vector<std::string> tokens;
        std::string current;
        current.reserve(32);

        for (size_t i = 0; i < field.length(); ++i) {
            unsigned char c = static_cast<unsigned char>(field[i]);
            if (c > 127 || std::isalnum(c)) {
                if (c >= 'A' && c <= 'Z') current += static_cast<char>(c + ('a' - 'A'));
                else current += static_cast<char>(c);
            } else {
                if (!current.empty()) { tokens.push_back(current); current.clear(); }
            }
        }
        if (!current.empty()) tokens.push_back(current);
        return tokens;
    }
};

enum class TokenizationKind {
    Characters,
    Tokens,
};

inline TokenizationKind parse_tokenization_kind(const std::string& name) {
    if (name == "chars" || name == "characters" || name == "default")
        return TokenizationKind::Characters;
    if (name == "tokens" || name == "words")
        return TokenizationKind::Tokens;

    throw ConfigError("Unknown tokenization mode: " + name);
}

inline std::unique_ptr<ItemExtractor> make_item_extractor(TokenizationKind kind) {
    switch (kind) {
        case TokenizationKind::Characters:
            return std::make_unique<CharacterItemExtractor>();
        case TokenizationKind::Tokens:
            return std::make_unique<TokenItemExtractor>();
    }
    throw ConfigError("Unsupported tokenization kind");
}

#endif // ITEM_EXTRACTOR_H
