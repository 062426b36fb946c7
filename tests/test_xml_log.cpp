#include "colourlink/colourspace/XmlLog.hpp"
#include "colourlink/core/Errors.hpp"
#include "colourlink/log/Log.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

using namespace colourlink;
using namespace colourlink::colourspace;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { colourlink::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { colourlink::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

std::string tempPath(const char* tag) {
    return "/tmp/colourlink_" + std::string(tag) + "_" + std::to_string(::getpid()) + ".log";
}

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

std::size_t count(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

} // namespace

static void testPrettyPrintIndents() {
    auto pretty = XmlLog::prettyPrint(
        "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
        "<CS_RMC version=1><rectangle><color red=255 green='1'/><note>hi</note></rectangle></CS_RMC>");
    ASSERT_TRUE(pretty.has_value(), "pretty print succeeds");
    if (!pretty) return;

    const std::string expected =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<CS_RMC version=\"1\">\n"
        "  <rectangle>\n"
        "    <color red=\"255\" green=\"1\" />\n"
        "    <note>\n"
        "      hi\n"
        "    </note>\n"
        "  </rectangle>\n"
        "</CS_RMC>\n";
    ASSERT_EQ(*pretty, expected, "indented output");
}

static void testPrettyPrintRejectsBrokenXml() {
    auto pretty = XmlLog::prettyPrint("<a><b></a>");
    ASSERT_TRUE(!pretty.has_value(), "mismatched tags fail");
    if (!pretty) ASSERT_TRUE(pretty.error() == make_error_code(Errc::MalformedXml), "MalformedXml");
}

static void testAppendWritesFramedEntries() {
    const std::string path = tempPath("xml_log");
    std::remove(path.c_str());

    XmlLog log(path);
    ASSERT_EQ(log.path(), path, "path kept");
    ASSERT_TRUE(log.append("<CS_RMC><result><red>1</red></result></CS_RMC>").has_value(), "first append");
    ASSERT_TRUE(log.append("<CS_RMC><result><red>2</red></result></CS_RMC>").has_value(), "second append");

    const std::string contents = slurp(path);
    ASSERT_EQ(count(contents, "----- Received at "), std::size_t{2}, "two headers");
    ASSERT_EQ(count(contents, "----- End -----\n"), std::size_t{2}, "two footers");
    ASSERT_TRUE(contents.find("  <result>\n") != std::string::npos, "entries are pretty printed");
    ASSERT_TRUE(contents.find("<red>1</red>") == std::string::npos, "not written raw");
    ASSERT_TRUE(contents.rfind("----- End -----\n") == contents.size() - 16, "ends with footer");

    std::remove(path.c_str());
}

static void testAppendFallsBackToRawPayload() {
    const std::string path = tempPath("xml_log_raw");
    std::remove(path.c_str());

    {
        colourlink::log::ScopedLogHandlers quiet([](std::string_view) {}, [](std::string_view) {});
        XmlLog log(path);
        ASSERT_TRUE(log.append("<broken>").has_value(), "append still succeeds");
        ASSERT_TRUE(log.append("<a></b>").has_value(), "malformed payload logged raw");
    }

    const std::string contents = slurp(path);
    ASSERT_TRUE(contents.find("\n<a></b>\n----- End -----\n") != std::string::npos, "raw payload kept");
    std::remove(path.c_str());
}

static void testAppendToUnwritablePathFails() {
    XmlLog log("/nonexistent-dir/colourlink/xml.log");
    auto result = log.append("<a/>");
    ASSERT_TRUE(!result.has_value(), "unwritable path reports an error");
}

static void testDefaultPathFromEnvironment() {
    ::unsetenv("COLOURSPACE_XML_LOG");
    ASSERT_EQ(XmlLog::defaultPath(), std::string("colourspace_commands.log"), "built-in default");
    ::setenv("COLOURSPACE_XML_LOG", "/tmp/custom.log", 1);
    ASSERT_EQ(XmlLog::defaultPath(), std::string("/tmp/custom.log"), "environment override");
    ::unsetenv("COLOURSPACE_XML_LOG");
}

int main() {
    testPrettyPrintIndents();
    testPrettyPrintRejectsBrokenXml();
    testAppendWritesFramedEntries();
    testAppendFallsBackToRawPayload();
    testAppendToUnwritablePathFails();
    testDefaultPathFromEnvironment();

    if (g_failures) {
        colourlink::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    colourlink::logInfo("XmlLog tests passed.\n");
    return 0;
}
