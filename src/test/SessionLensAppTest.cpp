#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

#include "app/SessionLensApp.hpp"
#include "infrastructure/EventLogReader.hpp"
#include "TestEventFactory.hpp"

using namespace sessionlens;
using json = nlohmann::json;

namespace {

const std::string kTestRoot = "test_sessionlens_app";

/** Swaps std::cout for a string buffer while in scope. */
class CapturedStdout {
public:
    CapturedStdout() : m_previous(std::cout.rdbuf(m_buffer.rdbuf())) {}
    ~CapturedStdout() { std::cout.rdbuf(m_previous); }
    std::string str() const { return m_buffer.str(); }

private:
    std::ostringstream m_buffer;
    std::streambuf* m_previous;
};

std::string writeLog() {
    auto path = (std::filesystem::path(kTestRoot) / "events.ndjson").string();
    std::ofstream f(path);
    for (const auto& event : test::SteadyEvents(30, 60000, "https://github.com/org/repo")) {
        f << infrastructure::EventLogReader::ToJson(event).dump() << "\n";
    }
    // Long break, then different site: one boundary
    auto later = test::MakeEvent(test::kBaseTime + 30 * 60000 + 900000, domain::browsing::EventType::TabUpdated,
                                 std::string("https://www.youtube.com/watch"));
    f << infrastructure::EventLogReader::ToJson(later).dump() << "\n";
    f << "{ broken\n";
    return path;
}

void testReportOnStdout() {
    std::cout << "[Test] Standard output carries only the report..." << std::endl;
    auto logPath = writeLog();

    int code = 0;
    std::string captured;
    {
        CapturedStdout capture;
        app::SessionLensApp application(logPath, std::nullopt);
        code = application.Run(std::cout);
        captured = capture.str();
    }
    assert(code == 0);

    json report = json::parse(captured);
    assert(report["events"] == 31);
    assert(report["skippedLines"] == 1);
    assert(report["boundaries"].size() == 1);
    assert(report["boundaries"][0]["reason"] == "idle_timeout");
    assert(report["report"].contains("time"));
    assert(report["report"].contains("activity"));
    assert(report["stats"]["timeBlocks"].get<int>() >= 2);
    std::cout << "[PASS] Standard output carries only the report." << std::endl;
}

void testFailuresLeaveStdoutEmpty() {
    std::cout << "[Test] Failures write nothing to standard output..." << std::endl;
    auto emptyPath = (std::filesystem::path(kTestRoot) / "empty.ndjson").string();
    {
        std::ofstream f(emptyPath);
        f << "\n";
    }

    std::string captured;
    int missing = 0;
    int empty = 0;
    {
        CapturedStdout capture;
        missing = app::SessionLensApp(kTestRoot + "/missing.ndjson", std::nullopt).Run(std::cout);
        empty = app::SessionLensApp(emptyPath, std::nullopt).Run(std::cout);
        captured = capture.str();
    }
    assert(missing == 1);
    assert(empty == 1);
    assert(captured.empty());
    std::cout << "[PASS] Failures write nothing to standard output." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SessionLens App Test..." << std::endl;
    std::filesystem::create_directories(kTestRoot);

    testReportOnStdout();
    testFailuresLeaveStdoutEmpty();

    std::filesystem::remove_all(kTestRoot);
    std::cout << "[PASS] SessionLens App Test." << std::endl;
    return 0;
}
