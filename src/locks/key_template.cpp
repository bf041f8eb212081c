#include "key_template.hpp"
#include <core/errors.hpp>
#include <cctype>

static bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
    for (char c : s) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

KeyTemplate::KeyTemplate(std::string text) : text_(std::move(text)) {
    parse();
}

void KeyTemplate::parse() {
    std::string literal;
    size_t i = 0;
    while (i < text_.size()) {
        char c = text_[i];
        if (c == '{') {
            if (i + 1 < text_.size() && text_[i + 1] == '{') {
                literal += '{';
                i += 2;
                continue;
            }
            auto close = text_.find('}', i + 1);
            if (close == std::string::npos)
                throw KeyFormatError("Unbalanced '{' in lock key: " + text_);
            std::string name = text_.substr(i + 1, close - i - 1);
            if (!is_identifier(name))
                throw KeyFormatError(fmt::format(
                    "Invalid placeholder '{{{}}}' in lock key: {}", name, text_));
            if (!literal.empty()) {
                segments_.push_back({false, literal});
                literal.clear();
            }
            segments_.push_back({true, name});
            i = close + 1;
        } else if (c == '}') {
            if (i + 1 < text_.size() && text_[i + 1] == '}') {
                literal += '}';
                i += 2;
                continue;
            }
            throw KeyFormatError("Single '}' in lock key: " + text_);
        } else {
            literal += c;
            i++;
        }
    }
    if (!literal.empty()) segments_.push_back({false, literal});
}

std::vector<std::string> KeyTemplate::placeholders() const {
    std::vector<std::string> names;
    for (const auto& seg : segments_) {
        if (seg.placeholder) names.push_back(seg.value);
    }
    return names;
}

bool KeyTemplate::has_placeholders() const {
    for (const auto& seg : segments_) {
        if (seg.placeholder) return true;
    }
    return false;
}

std::string KeyTemplate::format(const KeyParams& params) const {
    std::string out;
    for (const auto& seg : segments_) {
        if (!seg.placeholder) {
            out += seg.value;
            continue;
        }
        auto it = params.find(seg.value);
        if (it == params.end()) throw MissingParameter(text_, seg.value);
        out += it->second;
    }
    return out;
}
