#pragma once

#include <map>
#include <string>
#include <vector>
#include <fmt/format.h>

// Substitution values for a key template, by placeholder name.
using KeyParams = std::map<std::string, std::string>;

// Convenience for building KeyParams from anything fmt can format:
//   lock.acquire({param("object_id", 123)})
template <typename T>
std::pair<const std::string, std::string> param(const std::string& name, const T& value) {
    return {name, fmt::to_string(value)};
}

// A lock key such as "resource-{id}": literal text plus named placeholders.
// "{{" and "}}" stand for literal braces. Placeholders must be plain
// identifiers; "{}", "{0}" and "{id:04d}" are rejected at parse time.
class KeyTemplate {
public:
    // Throws KeyFormatError on malformed templates.
    explicit KeyTemplate(std::string text);

    const std::string& text() const { return text_; }
    std::vector<std::string> placeholders() const;
    bool has_placeholders() const;

    // Substitute params. Unused params are ignored; a missing one throws
    // MissingParameter.
    std::string format(const KeyParams& params) const;

private:
    struct Segment {
        bool placeholder;
        std::string value;   // literal text or placeholder name
    };

    std::string text_;
    std::vector<Segment> segments_;

    void parse();
};
