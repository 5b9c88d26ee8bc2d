#include "core/sanitize.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <climits>
#include <cstdint>
#include <memory>
#include <variant>

namespace daybook {

namespace {

constexpr std::array<std::string_view, 23> kAllowedTags = {
    "b", "i", "em", "strong", "u", "s", "strike", "del", "br", "p", "div", "span",
    "img", "a", "code", "h1", "h2", "h3", "h4", "h5", "h6", "hr", "blockquote"
};

constexpr std::array<std::string_view, 11> kAllowedAttributes = {
    "data-image-id", "data-timestamp", "data-label", "data-weather", "alt",
    "width", "height", "href", "target", "rel", "contenteditable"
};

// Elements removed together with everything inside them.
constexpr std::array<std::string_view, 6> kDropContentTags = {
    "script", "style", "iframe", "object", "template", "noscript"
};

constexpr std::array<std::string_view, 3> kVoidTags = {"br", "hr", "img"};

constexpr std::array<std::string_view, 3> kUnsafeSchemes = {
    "javascript:", "vbscript:", "data:"
};

// Named references the HTML4 entity table of libxml2 leaves undecoded but
// browsers resolve inside URLs.
struct NamedReference {
    std::string_view name;
    char value;
};

constexpr std::array<NamedReference, 5> kUrlReferences = {{
    {"colon", ':'}, {"Tab", '\t'}, {"NewLine", '\n'}, {"sol", '/'}, {"period", '.'}
}};

constexpr int kParseOptions = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                              HTML_PARSE_NOWARNING | HTML_PARSE_NONET |
                              HTML_PARSE_IGNORE_ENC;

constexpr int kMaxPasses = 4;

using HtmlDocPtr = std::unique_ptr<xmlDoc, void (*)(xmlDocPtr)>;
using XmlStringPtr = std::unique_ptr<xmlChar, xmlFreeFunc>;

template<size_t N>
bool contains(const std::array<std::string_view, N>& list, std::string_view value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view as_view(const xmlChar* s) {
    return s ? std::string_view(reinterpret_cast<const char*>(s)) : std::string_view{};
}

HtmlDocPtr parse_fragment(std::string_view html) {
    static constexpr std::string_view kPrefix = "<html><body>";
    static constexpr std::string_view kSuffix = "</body></html>";
    if (html.size() > static_cast<size_t>(INT_MAX) - kPrefix.size() - kSuffix.size()) {
        return HtmlDocPtr{nullptr, xmlFreeDoc};
    }

    std::string wrapped;
    wrapped.reserve(kPrefix.size() + html.size() + kSuffix.size());
    wrapped.append(kPrefix).append(html).append(kSuffix);
    return HtmlDocPtr{
        htmlReadMemory(wrapped.data(), static_cast<int>(wrapped.size()),
                       nullptr, "UTF-8", kParseOptions),
        xmlFreeDoc};
}

// The element holding the fragment, or the document root when the parser
// produced no body.
const xmlNode* fragment_root(const xmlDoc& doc) {
    const xmlNode* root = xmlDocGetRootElement(&doc);
    if (!root) return nullptr;
    for (const xmlNode* child = root->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && to_lower(as_view(child->name)) == "body") {
            return child;
        }
    }
    return root;
}

std::optional<uint32_t> parse_code_point(std::string_view digits, bool hex) {
    if (digits.empty() || digits.size() > 8) return std::nullopt;
    uint32_t value = 0;
    for (char c : digits) {
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (hex && c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (hex && c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else return std::nullopt;
        value = value * (hex ? 16 : 10) + static_cast<uint32_t>(d);
    }
    return value;
}

// Resolves the numeric and URL-relevant named references still present in
// an attribute value. Non-ASCII code points become a placeholder since only
// the scheme is inspected.
std::string decode_references(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '&') {
            out += value[i++];
            continue;
        }
        size_t j = i + 1;
        if (j < value.size() && value[j] == '#') {
            ++j;
            bool hex = j < value.size() && (value[j] == 'x' || value[j] == 'X');
            if (hex) ++j;
            size_t start = j;
            while (j < value.size() && std::isxdigit(static_cast<unsigned char>(value[j]))) ++j;
            if (auto cp = parse_code_point(value.substr(start, j - start), hex)) {
                out += *cp < 0x80 ? static_cast<char>(*cp) : '?';
                i = (j < value.size() && value[j] == ';') ? j + 1 : j;
                continue;
            }
        } else {
            size_t start = j;
            while (j < value.size() && std::isalpha(static_cast<unsigned char>(value[j]))) ++j;
            auto name = value.substr(start, j - start);
            auto it = std::find_if(kUrlReferences.begin(), kUrlReferences.end(),
                                   [&](const NamedReference& ref) { return ref.name == name; });
            if (it != kUrlReferences.end()) {
                out += it->value;
                i = (j < value.size() && value[j] == ';') ? j + 1 : j;
                continue;
            }
        }
        out += value[i++];
    }
    return out;
}

bool is_unsafe_url(std::string_view value) {
    std::string compact;
    for (char c : decode_references(value)) {
        if (static_cast<unsigned char>(c) > 0x20 && c != 0x7f) {
            compact += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return std::any_of(kUnsafeSchemes.begin(), kUnsafeSchemes.end(),
                       [&](std::string_view scheme) { return compact.starts_with(scheme); });
}

void append_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
}

void write_children(const xmlNode* parent, std::string& out);

void write_attributes(const xmlNode* element, std::string& out) {
    for (const xmlAttr* attr = element->properties; attr; attr = attr->next) {
        const auto name = to_lower(as_view(attr->name));
        if (!contains(kAllowedAttributes, name)) continue;

        XmlStringPtr value{
            xmlNodeGetContent(reinterpret_cast<const xmlNode*>(attr)), xmlFree};
        const auto text = as_view(value.get());
        if (name == "href" && is_unsafe_url(text)) continue;

        out += ' ';
        out += name;
        out += "=\"";
        append_escaped(out, text);
        out += '"';
    }
}

void write_node(const xmlNode* node, std::string& out) {
    switch (node->type) {
        case XML_TEXT_NODE:
        case XML_CDATA_SECTION_NODE:
            append_escaped(out, as_view(node->content));
            return;
        case XML_ELEMENT_NODE:
            break;
        default:
            return;
    }

    const auto name = to_lower(as_view(node->name));
    if (contains(kDropContentTags, name)) return;
    if (!contains(kAllowedTags, name)) {
        write_children(node, out);
        return;
    }

    out += '<';
    out += name;
    write_attributes(node, out);
    out += '>';
    if (contains(kVoidTags, name)) return;
    write_children(node, out);
    out += "</";
    out += name;
    out += '>';
}

void write_children(const xmlNode* parent, std::string& out) {
    for (const xmlNode* child = parent->children; child; child = child->next) {
        write_node(child, out);
    }
}

std::string sanitize_pass(std::string_view html) {
    std::string out;
    auto doc = parse_fragment(html);
    const xmlNode* root = doc ? fragment_root(*doc) : nullptr;
    if (!root) {
        // Unparseable input is kept as inert text.
        append_escaped(out, html);
        return out;
    }
    out.reserve(html.size());
    write_children(root, out);
    return out;
}

struct VisibleContent {
    std::string text;
    bool has_image = false;
};

void collect_visible(const xmlNode* parent, VisibleContent& content) {
    for (const xmlNode* node = parent->children; node; node = node->next) {
        if (node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE) {
            content.text += as_view(node->content);
        } else if (node->type == XML_ELEMENT_NODE) {
            const auto name = to_lower(as_view(node->name));
            if (name == "img") {
                content.has_image = true;
                return;
            }
            if (!contains(kDropContentTags, name)) {
                collect_visible(node, content);
            }
        }
        if (content.has_image) return;
    }
}

bool is_blank(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            ++i;
        } else if (c == 0xC2 && i + 1 < text.size() &&
                   static_cast<unsigned char>(text[i + 1]) == 0xA0) {
            i += 2;  // no-break space
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

std::string sanitize_html(std::string_view html) {
    // Unwrapping a disallowed element can leave markup the parser nests
    // differently on the next read; repeat until the output is stable.
    std::string out = sanitize_pass(html);
    for (int pass = 1; pass < kMaxPasses; ++pass) {
        auto next = sanitize_pass(out);
        if (next == out) break;
        out = std::move(next);
    }
    return out;
}

bool is_content_empty(std::string_view html) {
    auto doc = parse_fragment(html);
    const xmlNode* root = doc ? fragment_root(*doc) : nullptr;
    if (!root) {
        return html.empty();
    }
    VisibleContent content;
    collect_visible(root, content);
    return !content.has_image && is_blank(content.text);
}

bool has_habit_value(const HabitEntry& entry) {
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return !v.empty();
        } else if constexpr (std::is_same_v<T, double>) {
            return v != 0.0;
        } else {
            return v;
        }
    }, entry.value);
}

bool is_note_empty(std::string_view content, const std::optional<HabitValues>& habits) {
    if (!is_content_empty(content)) return false;
    if (!habits) return true;
    return std::none_of(habits->begin(), habits->end(),
                        [](const auto& kv) { return has_habit_value(kv.second); });
}

} // namespace daybook
