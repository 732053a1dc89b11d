// Shared helpers for the test executables: assertion macros that log through
// the error sink, a recording ReportSession, and a scratch directory used as a
// fake sysfs/devfs root.
#pragma once

#include "awlights/core/ByteBuffer.hpp"
#include "awlights/core/Sleeper.hpp"
#include "awlights/hid/ReportSession.hpp"
#include "awlights/log/Log.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { awlights::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { awlights::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace awtest {

using Bytes = std::vector<std::uint8_t>;

// Everything a device did, in order: payloads sent and pauses requested.
struct Transcript {
    struct Entry {
        bool isPause = false;
        Bytes payload;
        std::chrono::milliseconds pause{0};
    };

    std::vector<Entry> entries;
    int opens = 0;
    int closes = 0;

    std::vector<Bytes> sends() const {
        std::vector<Bytes> out;
        for (const auto& e : entries) {
            if (!e.isPause) out.push_back(e.payload);
        }
        return out;
    }

    awlights::core::Sleeper sleeper() {
        return [this](std::chrono::milliseconds duration) {
            Entry entry;
            entry.isPause = true;
            entry.pause = duration;
            entries.push_back(entry);
        };
    }
};

class RecordingSession : public awlights::hid::ReportSession {
public:
    explicit RecordingSession(Transcript& transcript, bool present = true)
    : transcript(transcript), present(present) {}

    bool open() override {
        opened = present;
        if (opened) ++transcript.opens;
        return opened;
    }
    void close() override {
        if (opened) ++transcript.closes;
        opened = false;
    }
    bool isOpen() const override { return opened; }

    awlights::expected<void> send(const awlights::core::ByteBuffer& payload) override {
        if (!opened) {
            return awlights::fail(std::errc::not_connected);
        }
        ++sendCount;
        if (failOnSend != 0 && sendCount == failOnSend) {
            return awlights::fail(std::errc::io_error);
        }
        Transcript::Entry entry;
        entry.payload = payload.bytes();
        transcript.entries.push_back(entry);
        return {};
    }

    Transcript& transcript;
    bool present = true;
    bool opened = false;
    int sendCount = 0;
    int failOnSend = 0; // 1-based index of a send that fails, 0 = none
};

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "awlights-XXXXXX").string();
        if (::mkdtemp(pattern.data())) {
            root = pattern;
        }
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return root; }

    void writeFile(const std::string& relative, const std::string& contents) const {
        const auto file = root / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << contents;
    }

    std::string readFile(const std::string& relative) const {
        std::ifstream in(root / relative, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path root;
};

inline int finish(const char* suite) {
    if (g_failures) {
        awlights::logError(suite, " tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    awlights::logInfo(suite, " tests passed.\n");
    return 0;
}

} // namespace awtest
