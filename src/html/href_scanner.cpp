#include "sitecheck/html/href_scanner.h"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <set>

namespace sitecheck::html {
namespace {

const std::set<std::string> kRawTextTags = {
    "script", "style", "textarea", "title", "xmp", "noscript",
};

const std::map<std::string, std::uint32_t> kNamedEntities = {
    {"amp", '&'}, {"lt", '<'}, {"gt", '>'}, {"quot", '"'}, {"apos", '\''}, {"nbsp", 0xA0},
};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Decodes the reference body between '&' and ';'. Returns false when it is
// not a reference we know.
bool decode_reference(const std::string& name, std::string& out) {
    std::uint32_t cp = 0;
    if (name.size() > 1 && name[0] == '#') {
        const bool hex = name[1] == 'x' || name[1] == 'X';
        const std::string digits = name.substr(hex ? 2 : 1);
        if (digits.empty() || digits.size() > 8) {
            return false;
        }
        char* end = nullptr;
        const unsigned long value = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
        if (*end != '\0' || value == 0 || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
            return false;
        }
        cp = static_cast<std::uint32_t>(value);
    } else {
        const auto it = kNamedEntities.find(name);
        if (it == kNamedEntities.end()) {
            return false;
        }
        cp = it->second;
    }
    append_utf8(cp, out);
    return true;
}

// Walks one start tag's attributes. `pos` enters just past the tag name and
// leaves just past the closing '>' (or at the end of input).
class TagReader {
public:
    TagReader(const std::string& html, std::size_t& pos) : html_(html), pos_(pos) {}

    // Returns the first value of `wanted` if the attribute is present.
    bool read(const std::string& wanted, std::string& value) {
        bool found = false;
        while (pos_ < html_.size()) {
            const char c = html_[pos_];
            if (c == '>') {
                ++pos_;
                break;
            }
            if (is_space(c) || c == '/') {
                ++pos_;
                continue;
            }
            std::string name;
            while (pos_ < html_.size() && !is_space(html_[pos_]) && html_[pos_] != '>' &&
                   html_[pos_] != '/' && html_[pos_] != '=') {
                name += lower(html_[pos_++]);
            }
            if (name.empty()) {
                // A stray '=' with no name before it.
                ++pos_;
                continue;
            }
            std::string raw;
            const bool has_value = read_value(raw);
            if (!found && name == wanted && has_value) {
                value = decode_entities(raw);
                found = true;
            }
        }
        return found;
    }

private:
    void skip_space() {
        while (pos_ < html_.size() && is_space(html_[pos_])) {
            ++pos_;
        }
    }

    bool read_value(std::string& raw) {
        const std::size_t mark = pos_;
        skip_space();
        if (pos_ >= html_.size() || html_[pos_] != '=') {
            pos_ = mark;
            return false;
        }
        ++pos_;
        skip_space();
        if (pos_ < html_.size() && (html_[pos_] == '"' || html_[pos_] == '\'')) {
            const char quote = html_[pos_++];
            const std::size_t close = html_.find(quote, pos_);
            raw = html_.substr(pos_, close == std::string::npos ? std::string::npos : close - pos_);
            pos_ = close == std::string::npos ? html_.size() : close + 1;
            return true;
        }
        while (pos_ < html_.size() && !is_space(html_[pos_]) && html_[pos_] != '>') {
            raw += html_[pos_++];
        }
        return true;
    }

    const std::string& html_;
    std::size_t& pos_;
};

std::size_t skip_past(const std::string& text, const char* marker, std::size_t from) {
    const std::size_t at = text.find(marker, from);
    return at == std::string::npos ? text.size() : at + std::char_traits<char>::length(marker);
}

}  // namespace

std::string decode_entities(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t amp = text.find('&', pos);
        if (amp == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, amp - pos);
        const std::size_t semi = text.find(';', amp + 1);
        if (semi != std::string::npos && semi - amp <= 10 &&
            decode_reference(text.substr(amp + 1, semi - amp - 1), out)) {
            pos = semi + 1;
        } else {
            out += '&';
            pos = amp + 1;
        }
    }
    return out;
}

std::vector<std::string> extract_hrefs(const std::string& html) {
    std::string folded(html);
    for (char& c : folded) {
        c = lower(c);
    }

    std::vector<std::string> hrefs;
    std::size_t pos = 0;
    while ((pos = html.find('<', pos)) != std::string::npos) {
        if (html.compare(pos, 4, "<!--") == 0) {
            pos = skip_past(html, "-->", pos + 4);
            continue;
        }
        const std::size_t name_start = pos + 1;
        if (name_start >= html.size() ||
            !std::isalpha(static_cast<unsigned char>(html[name_start]))) {
            // End tags, doctypes and processing instructions carry no links.
            pos = (name_start < html.size() && std::string("/!?").find(html[name_start]) != std::string::npos)
                      ? skip_past(html, ">", name_start)
                      : name_start;
            continue;
        }

        pos = name_start;
        while (pos < html.size() && !is_space(html[pos]) && html[pos] != '/' && html[pos] != '>') {
            ++pos;
        }
        const std::string tag = folded.substr(name_start, pos - name_start);

        std::string href;
        TagReader attributes(html, pos);
        if (attributes.read("href", href) && tag == "a") {
            hrefs.push_back(href);
        }
        if (kRawTextTags.count(tag) != 0) {
            const std::size_t close = folded.find("</" + tag, pos);
            pos = close == std::string::npos ? html.size() : close;
        }
    }
    return hrefs;
}

}  // namespace sitecheck::html
