// logger_main.cpp
#include "Logger.h"
#include <sstream>
#include <string>

using namespace RKC;

namespace {

int g_failures = 0;

void expect(bool condition, const std::string& what) {
    if (!condition) {
        ++g_failures;
        std::cerr << "FAILURE: " << what << std::endl;
    }
}

[[nodiscard]] bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void testLevelFiltering() {
    std::ostringstream captured;
    Logger::setOutputStream(&captured);

    Logger::setLogLevel(LogLevel::Debug);
    LOG_DEBUG("TestMod", "debug visible");
    LOG_INFO("TestMod", "info visible");
    LOG_CRITICAL("TestMod", "critical visible");

    Logger::setLogLevel(LogLevel::Warning);
    LOG_INFO("TestMod", "info hidden");
    LOG_DEBUG("TestMod", "debug hidden");
    LOG_WARN("TestMod", "warning visible");

    Logger::setLogLevel(LogLevel::None);
    LOG_CRITICAL("TestMod", "critical hidden");

    Logger::setOutputStream(nullptr);
    const std::string out = captured.str();

    expect(contains(out, "[DBG][TestMod] debug visible"), "debug line at Debug level");
    expect(contains(out, "[INF][TestMod] info visible"), "info line at Debug level");
    expect(contains(out, "[CRT][TestMod] critical visible"), "critical line at Debug level");
    expect(contains(out, "[WRN][TestMod] warning visible"), "warning line at Warning level");
    expect(!contains(out, "info hidden"), "info suppressed at Warning level");
    expect(!contains(out, "debug hidden"), "debug suppressed at Warning level");
    expect(!contains(out, "critical hidden"), "everything suppressed at None");
}

void testFormatting() {
    std::ostringstream captured;
    Logger::setOutputStream(&captured);
    Logger::setLogLevel(LogLevel::Info);

    LOG_INFO_F("Formatter", "Hello, %s! Value: %d, Float: %.2f", "World", 123, 3.14159);
    LOG_INFO_F("Formatter", "No arguments at 100%");
    LOG_DEBUG_F("Formatter", "filtered %d", 7);

    Logger::setOutputStream(nullptr);
    const std::string out = captured.str();

    expect(contains(out, "[Formatter] Hello, World! Value: 123, Float: 3.14"), "printf-style formatting");
    expect(contains(out, "[Formatter] No arguments at 100%"), "plain message passes through unformatted");
    expect(!contains(out, "filtered 7"), "formatted debug suppressed at Info level");
}

void testLevelParsing() {
    expect(logLevelFromString("DEBUG") == LogLevel::Debug, "parse DEBUG");
    expect(logLevelFromString("warn") == LogLevel::Warning, "parse warn");
    expect(logLevelFromString("Warning") == LogLevel::Warning, "parse Warning");
    expect(logLevelFromString("off") == LogLevel::None, "parse off");
    expect(logLevelFromString("bogus", LogLevel::Error) == LogLevel::Error, "unknown falls back");

    Logger::setLogLevel(LogLevel::Critical);
    expect(Logger::getLogLevel() == LogLevel::Critical, "getLogLevel reflects setLogLevel");
    expect(!Logger::isLevelEnabled(LogLevel::Error), "Error disabled at Critical");
    expect(Logger::isLevelEnabled(LogLevel::Critical), "Critical enabled at Critical");
}

} // namespace

int main() {
    std::cout << "--- Logger Test ---" << std::endl;

    testLevelFiltering();
    testFormatting();
    testLevelParsing();

    Logger::setLogLevel(LogLevel::Info);
    if (g_failures > 0) {
        LOG_ERROR_F("LoggerTest", "%d check(s) failed.", g_failures);
        return 1;
    }
    std::cout << "--- Logger Test Complete ---" << std::endl;
    return 0;
}
