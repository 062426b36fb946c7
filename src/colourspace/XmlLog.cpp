#include "colourlink/colourspace/XmlLog.hpp"

#include "colourlink/colourspace/ColourSpaceConfig.hpp"
#include "colourlink/colourspace/XmlReader.hpp"
#include "colourlink/log/Log.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace colourlink::colourspace {
namespace {

void indentLine(std::string& buf, std::size_t depth, std::string_view line) {
    buf.append(depth * 2, ' ');
    buf.append(line);
    buf.push_back('\n');
}

std::string formatTag(const xml::Event& event, std::string_view close) {
    std::string line = "<" + event.name;
    for (const auto& attr : event.attributes) {
        line += " " + attr.name + "=\"" + attr.value + "\"";
    }
    line.append(close);
    return line;
}

double unixSeconds() {
    const auto since = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since).count();
}

} // namespace

XmlLog::XmlLog(std::string path)
: filePath(std::move(path)) {}

std::string XmlLog::defaultPath() {
    if (const char* env = std::getenv(config::XML_LOG_ENV); env && *env) {
        return env;
    }
    return config::XML_LOG_DEFAULT_PATH;
}

expected<std::string> XmlLog::prettyPrint(std::string_view xmlText) {
    xml::XmlReader reader(xmlText);
    std::string output;
    std::size_t depth = 0;

    while (true) {
        auto event = reader.next();
        if (!event) {
            return unexpected(event.error());
        }

        switch (event->type) {
            case xml::EventType::StartTag:
                indentLine(output, depth, formatTag(*event, ">"));
                ++depth;
                break;
            case xml::EventType::EndTag:
                depth = depth > 0 ? depth - 1 : 0;
                indentLine(output, depth, "</" + event->name + ">");
                break;
            case xml::EventType::EmptyTag:
                indentLine(output, depth, formatTag(*event, " />"));
                break;
            case xml::EventType::Text:
                indentLine(output, depth, event->text);
                break;
            case xml::EventType::CData:
                indentLine(output, depth, "<![CDATA[" + std::string(xml::trim(event->text)) + "]]>");
                break;
            case xml::EventType::Comment:
                indentLine(output, depth, "<!--" + std::string(xml::trim(event->text)) + "-->");
                break;
            case xml::EventType::Declaration: {
                std::string line = "<?" + event->name;
                if (!event->text.empty()) {
                    line += " " + event->text;
                }
                line += "?>";
                indentLine(output, depth, line);
                break;
            }
            case xml::EventType::Doctype:
                break;
            case xml::EventType::End:
                return output;
        }
    }
}

expected<void> XmlLog::append(std::string_view xmlText) const {
    std::string pretty;
    if (auto formatted = prettyPrint(xmlText)) {
        pretty = std::move(*formatted);
    } else {
        logError("[XmlLog] Failed to pretty print XML: ", formatted.error().message(), "\n");
        pretty.assign(xmlText);
    }

    std::ofstream file(filePath, std::ios::out | std::ios::app);
    if (!file) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }

    std::ostringstream header;
    header << std::fixed << std::setprecision(3) << unixSeconds();

    file << "----- Received at " << header.str() << " -----\n";
    file << pretty;
    if (pretty.empty() || pretty.back() != '\n') {
        file << '\n';
    }
    file << "----- End -----\n";
    file.flush();
    if (!file) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
}

} // namespace colourlink::colourspace
