// XmlReader.hpp
// -----------------------------------------------------------------------------
// Streaming pull reader for the XML dialect ColourSpace speaks.
// The instrument writes attributes without quotes (`<CS_RMC version=1>`), so a
// conforming parser would reject every message; this reader accepts quoted,
// unquoted and value-less attributes while still reporting real structural
// errors (unterminated markup, mismatched end tags) as MalformedXml.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "colourlink/core/Expected.hpp"

namespace colourlink::colourspace::xml {

enum class EventType {
    StartTag,
    EndTag,
    EmptyTag,      // <name ... />
    Text,          // trimmed, entity-decoded; whitespace-only runs are skipped
    CData,
    Comment,
    Declaration,   // <?target ...?>
    Doctype,       // <!...>
    End
};

struct Attribute {
    std::string name;
    std::string value;   // entity-decoded
};

struct Event {
    EventType type = EventType::End;
    std::string name;                  // tag name, or declaration target
    std::string text;                  // text, CDATA, comment or declaration body
    std::vector<Attribute> attributes;

    /// First attribute with this name, or nullptr.
    const Attribute* attribute(std::string_view attributeName) const;
};

class XmlReader {
public:
    explicit XmlReader(std::string_view document);

    /**
     * @brief Produce the next event.
     *
     * Returns an End event once input is exhausted; elements still open at
     * that point are not an error. Syntax errors yield Errc::MalformedXml and
     * leave the reader at End.
     */
    expected<Event> next();

    /// Number of elements currently open.
    std::size_t depth() const { return open_.size(); }

    /// Byte offset of the next unread character.
    std::size_t position() const { return pos_; }

private:
    expected<Event> readMarkup();
    expected<Event> readTag();
    expected<Event> readEndTag();
    expected<Event> readDelimited(EventType type, std::string_view open, std::string_view close);
    expected<Event> readDoctype();
    expected<void> readAttributes(Event& event);
    bool readName(std::string& out);
    void skipWhitespace();
    bool startsWith(std::string_view prefix) const;
    expected<Event> fail();

    std::string_view doc_;
    std::size_t pos_ = 0;
    bool failed_ = false;
    std::vector<std::string> open_;
};

/// Decode &lt; &gt; &amp; &quot; &apos; and numeric references; unknown entities stay verbatim.
std::string decodeEntities(std::string_view raw);

/// Trim ASCII whitespace from both ends.
std::string_view trim(std::string_view text);

} // namespace colourlink::colourspace::xml
