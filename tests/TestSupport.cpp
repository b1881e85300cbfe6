#include "TestSupport.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace krep::test {

void TempDirTest::SetUp() {
    std::string tmpl = (fs::temp_directory_path() / "krep_test.XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    ASSERT_NE(::mkdtemp(buf.data()), nullptr);
    dir_ = buf.data();
}

void TempDirTest::TearDown() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
}

Timestamp fixedNow() {
    return infra::from_ns(1717243200LL * 1000000000LL);
}

Session makeSession(const std::string& definition_id, Timestamp performed_at) {
    Session s;
    s.id = newSessionId();
    s.definition_id = definition_id;
    s.performed_at = performed_at;
    s.started_at = performed_at;
    s.completed_at = performed_at + std::chrono::seconds(300);
    s.actual_duration_seconds = 300;
    s.metrics_realized.push_back(MetricSpec::reps("reps", 5, 3, 15, 1, true));
    s.perceived_rpe = 7;
    return s;
}

std::string readBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void writeBytes(const std::string& path, const std::string& bytes) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << bytes;
}

bool exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

ScopedEnv::ScopedEnv(const char* name, const std::optional<std::string>& value)
    : name_(name) {
    if (const char* old = std::getenv(name)) {
        previous_ = old;
    }
    if (value) {
        ::setenv(name, value->c_str(), 1);
    } else {
        ::unsetenv(name);
    }
}

ScopedEnv::~ScopedEnv() {
    if (previous_) {
        ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
        ::unsetenv(name_.c_str());
    }
}

} // namespace krep::test
