#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QProcessEnvironment>

#include "gemrun/execution_environment.hpp"

using namespace gemrun;

namespace {

QProcessEnvironment hostWithPath(const QString& path) {
    QProcessEnvironment host;
    host.insert("HOME", "/home/tester");
    host.insert("LANG", "C.UTF-8");
    if (!path.isNull()) {
        host.insert("PATH", path);
    }
    return host;
}

}  // namespace

TEST_CASE("Shared environment points GEM_HOME at the user store", "[environment]") {
    const ExecutionEnvironment env =
        ExecutionEnvironment::shared(hostWithPath("/usr/bin:/bin"), "/var/gems");

    REQUIRE(env.mode == IsolationMode::Shared);
    REQUIRE(env.gemHome == "/var/gems");
    REQUIRE(env.variables.value("GEM_HOME") == "/var/gems");
    REQUIRE_FALSE(env.variables.contains("GEM_PATH"));
    REQUIRE(env.variables.value("PATH") == "/usr/bin:/bin");
    REQUIRE(env.variables.value("LANG") == "C.UTF-8");
}

TEST_CASE("Shared environment expands a home-relative store", "[environment]") {
    const ExecutionEnvironment env =
        ExecutionEnvironment::shared(hostWithPath("/bin"), "~/.gem");
    REQUIRE(env.gemHome == QDir::homePath() + "/.gem");
    REQUIRE(expandUserPath("~") == QDir::homePath());
    REQUIRE(expandUserPath("/abs/~/x") == "/abs/~/x");
}

TEST_CASE("Isolated environment redirects everything into the workspace", "[environment]") {
    const ExecutionEnvironment env =
        ExecutionEnvironment::isolated(hostWithPath("/usr/bin:/bin"), "/tmp/gemrun-abc123");

    REQUIRE(env.mode == IsolationMode::Isolated);
    REQUIRE(env.gemHome == "/tmp/gemrun-abc123/.gem");
    REQUIRE(env.variables.value("GEM_HOME") == "/tmp/gemrun-abc123/.gem");
    REQUIRE(env.variables.value("GEM_PATH") == "/tmp/gemrun-abc123/.gem");
    REQUIRE(env.gemBinDir() == "/tmp/gemrun-abc123/.gem/bin");
    REQUIRE(env.variables.value("PATH") == "/tmp/gemrun-abc123/.gem/bin:/usr/bin:/bin");
    REQUIRE(env.variables.value("HOME") == "/home/tester");
}

TEST_CASE("Isolated environment without a host PATH", "[environment]") {
    const ExecutionEnvironment env =
        ExecutionEnvironment::isolated(hostWithPath(QString()), "/w");
    REQUIRE(env.variables.value("PATH") == "/w/.gem/bin");
}

TEST_CASE("Building environments leaves the host untouched", "[environment]") {
    const QProcessEnvironment host = QProcessEnvironment::systemEnvironment();
    const QString gemHomeBefore = host.value("GEM_HOME");
    const QString pathBefore = host.value("PATH");

    const ExecutionEnvironment first = ExecutionEnvironment::isolated(host, "/tmp/gemrun-one");
    const ExecutionEnvironment second = ExecutionEnvironment::isolated(host, "/tmp/gemrun-two");

    REQUIRE(first.variables.value("GEM_HOME") != second.variables.value("GEM_HOME"));
    REQUIRE(qEnvironmentVariable("GEM_HOME") == gemHomeBefore);
    REQUIRE(qEnvironmentVariable("PATH") == pathBefore);
    REQUIRE(host.value("GEM_HOME") == gemHomeBefore);
}

TEST_CASE("Isolation modes have stable names", "[environment]") {
    REQUIRE(isolationModeName(IsolationMode::Shared) == "shared");
    REQUIRE(isolationModeName(IsolationMode::Isolated) == "isolated");
}
