#pragma once

#include <string>
#include <string_view>

#include "colourlink/core/Expected.hpp"

namespace colourlink::colourspace {

/**
 * @brief Appends received payloads, pretty-printed, to a diagnostics file.
 *
 * Each entry is framed as
 *   ----- Received at <unix seconds> -----
 *   <indented XML>
 *   ----- End -----
 */
class XmlLog {
public:
    explicit XmlLog(std::string path = defaultPath());

    /// $COLOURSPACE_XML_LOG, or "colourspace_commands.log" when unset.
    static std::string defaultPath();

    /// Re-indent @p xml two spaces per level; fails with MalformedXml.
    static expected<std::string> prettyPrint(std::string_view xml);

    /// Append one entry. Falls back to the raw payload if it does not pretty-print.
    expected<void> append(std::string_view xml) const;

    const std::string& path() const { return filePath; }

private:
    std::string filePath;
};

} // namespace colourlink::colourspace
