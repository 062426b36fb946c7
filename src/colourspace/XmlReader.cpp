#include "colourlink/colourspace/XmlReader.hpp"

#include "colourlink/core/Errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <utility>

namespace colourlink::colourspace::xml {
namespace {

bool isSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool isNameStart(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || u == '_' || u == ':' || u >= 0x80u;
}

bool isNameChar(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return isNameStart(c) || (u >= '0' && u <= '9') || u == '-' || u == '.';
}

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80u) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800u) {
        out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else if (cp < 0x10000u) {
        out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else {
        out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
}

// Decode one entity body (between '&' and ';'). Returns false if unknown.
bool decodeEntity(std::string_view body, std::string& out) {
    if (body == "lt")   { out.push_back('<');  return true; }
    if (body == "gt")   { out.push_back('>');  return true; }
    if (body == "amp")  { out.push_back('&');  return true; }
    if (body == "quot") { out.push_back('"');  return true; }
    if (body == "apos") { out.push_back('\''); return true; }

    if (body.size() < 2 || body.front() != '#') {
        return false;
    }
    const bool hex = body[1] == 'x' || body[1] == 'X';
    const std::string digits(body.substr(hex ? 2 : 1));
    if (digits.empty()) {
        return false;
    }
    char* end = nullptr;
    const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
    if (end != digits.c_str() + digits.size() || cp == 0 || cp > 0x10FFFFul
        || (cp >= 0xD800ul && cp <= 0xDFFFul)) {
        return false;
    }
    appendUtf8(out, static_cast<std::uint32_t>(cp));
    return true;
}

} // namespace

const Attribute* Event::attribute(std::string_view attributeName) const {
    for (const auto& attr : attributes) {
        if (attr.name == attributeName) {
            return &attr;
        }
    }
    return nullptr;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && isSpace(text.front())) text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back())) text.remove_suffix(1);
    return text;
}

std::string decodeEntities(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] != '&') {
            out.push_back(raw[i++]);
            continue;
        }
        const auto semi = raw.find(';', i + 1);
        if (semi == std::string_view::npos || !decodeEntity(raw.substr(i + 1, semi - i - 1), out)) {
            out.push_back(raw[i++]);
            continue;
        }
        i = semi + 1;
    }
    return out;
}

XmlReader::XmlReader(std::string_view document)
: doc_(document) {}

expected<Event> XmlReader::next() {
    while (!failed_ && pos_ < doc_.size()) {
        if (doc_[pos_] == '<') {
            return readMarkup();
        }

        const auto lt = doc_.find('<', pos_);
        const auto end = lt == std::string_view::npos ? doc_.size() : lt;
        const auto raw = trim(doc_.substr(pos_, end - pos_));
        pos_ = end;
        if (raw.empty()) {
            continue;
        }
        Event event;
        event.type = EventType::Text;
        event.text = decodeEntities(raw);
        return event;
    }
    return Event{};
}

expected<Event> XmlReader::readMarkup() {
    if (startsWith("<?")) {
        auto event = readDelimited(EventType::Declaration, "<?", "?>");
        if (event) {
            const auto body = trim(event->text);
            std::size_t split = 0;
            while (split < body.size() && !isSpace(body[split])) ++split;
            event->name = std::string(body.substr(0, split));
            event->text = std::string(trim(body.substr(split)));
        }
        return event;
    }
    if (startsWith("<!--")) {
        return readDelimited(EventType::Comment, "<!--", "-->");
    }
    if (startsWith("<![CDATA[")) {
        return readDelimited(EventType::CData, "<![CDATA[", "]]>");
    }
    if (startsWith("<!")) {
        return readDoctype();
    }
    if (startsWith("</")) {
        return readEndTag();
    }
    return readTag();
}

expected<Event> XmlReader::readDelimited(EventType type, std::string_view open, std::string_view close) {
    const auto bodyStart = pos_ + open.size();
    const auto closeAt = doc_.find(close, bodyStart);
    if (closeAt == std::string_view::npos) {
        return fail();
    }
    Event event;
    event.type = type;
    event.text = std::string(doc_.substr(bodyStart, closeAt - bodyStart));
    pos_ = closeAt + close.size();
    return event;
}

expected<Event> XmlReader::readDoctype() {
    // <!DOCTYPE ...> may carry an internal subset in brackets.
    int bracketDepth = 0;
    for (std::size_t i = pos_ + 2; i < doc_.size(); ++i) {
        const char c = doc_[i];
        if (c == '[') {
            ++bracketDepth;
        } else if (c == ']') {
            --bracketDepth;
        } else if (c == '>' && bracketDepth <= 0) {
            Event event;
            event.type = EventType::Doctype;
            event.text = std::string(trim(doc_.substr(pos_ + 2, i - pos_ - 2)));
            pos_ = i + 1;
            return event;
        }
    }
    return fail();
}

expected<Event> XmlReader::readEndTag() {
    pos_ += 2;
    Event event;
    event.type = EventType::EndTag;
    if (!readName(event.name)) {
        return fail();
    }
    skipWhitespace();
    if (pos_ >= doc_.size() || doc_[pos_] != '>') {
        return fail();
    }
    ++pos_;

    if (open_.empty() || open_.back() != event.name) {
        return fail();
    }
    open_.pop_back();
    return event;
}

expected<Event> XmlReader::readTag() {
    ++pos_;
    Event event;
    event.type = EventType::StartTag;
    if (!readName(event.name)) {
        return fail();
    }

    if (auto attrs = readAttributes(event); !attrs) {
        return fail();
    }

    if (event.type == EventType::StartTag) {
        open_.push_back(event.name);
    }
    return event;
}

expected<void> XmlReader::readAttributes(Event& event) {
    while (true) {
        skipWhitespace();
        if (pos_ >= doc_.size()) {
            return unexpected(make_error_code(Errc::MalformedXml));
        }

        if (startsWith("/>")) {
            event.type = EventType::EmptyTag;
            pos_ += 2;
            return {};
        }
        if (doc_[pos_] == '>') {
            ++pos_;
            return {};
        }

        Attribute attr;
        if (!readName(attr.name)) {
            return unexpected(make_error_code(Errc::MalformedXml));
        }
        skipWhitespace();
        if (pos_ < doc_.size() && doc_[pos_] == '=') {
            ++pos_;
            skipWhitespace();
            if (pos_ >= doc_.size()) {
                return unexpected(make_error_code(Errc::MalformedXml));
            }
            const char quote = doc_[pos_];
            if (quote == '"' || quote == '\'') {
                const auto closeAt = doc_.find(quote, pos_ + 1);
                if (closeAt == std::string_view::npos) {
                    return unexpected(make_error_code(Errc::MalformedXml));
                }
                attr.value = decodeEntities(doc_.substr(pos_ + 1, closeAt - pos_ - 1));
                pos_ = closeAt + 1;
            } else {
                // Unquoted value runs to whitespace, '>' or "/>".
                const auto start = pos_;
                while (pos_ < doc_.size() && !isSpace(doc_[pos_]) && doc_[pos_] != '>'
                       && !startsWith("/>")) {
                    ++pos_;
                }
                attr.value = decodeEntities(doc_.substr(start, pos_ - start));
            }
        }
        event.attributes.push_back(std::move(attr));
    }
}

bool XmlReader::readName(std::string& out) {
    if (pos_ >= doc_.size() || !isNameStart(doc_[pos_])) {
        return false;
    }
    const auto start = pos_;
    while (pos_ < doc_.size() && isNameChar(doc_[pos_])) {
        ++pos_;
    }
    out.assign(doc_.substr(start, pos_ - start));
    return true;
}

void XmlReader::skipWhitespace() {
    while (pos_ < doc_.size() && isSpace(doc_[pos_])) {
        ++pos_;
    }
}

bool XmlReader::startsWith(std::string_view prefix) const {
    return doc_.substr(pos_, prefix.size()) == prefix;
}

expected<Event> XmlReader::fail() {
    failed_ = true;
    return unexpected(make_error_code(Errc::MalformedXml));
}

} // namespace colourlink::colourspace::xml
