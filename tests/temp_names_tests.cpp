// Temporary naming and discovery, remote (mock) and local (real filesystem).
#include "TestSupport.hpp"

#include "sftpovw/TempNames.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <vector>

using sftpovw::MockSftpSession;
using sftpovw::OpError;
using sftpovw_test::TestContext;

namespace {

bool isLowerHex(const std::string &s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) ||
               (c >= 'a' && c <= 'f');
    });
}

void test_random_suffix(TestContext &t) {
    std::string a, b, err;
    t.check(sftpovw::randomHexSuffix(10, a, err), "suffix should be generated");
    t.check(sftpovw::randomHexSuffix(10, b, err), "second suffix should be generated");
    t.check(a.size() == 20 && isLowerHex(a), "suffix should be 20 lowercase hex chars");
    t.check(a != b, "two suffixes should differ");
}

void test_remote_temp_name_shape(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    s.addFile("/srv/data.bin", "A");

    std::string name;
    OpError err;
    t.check(sftpovw::remoteTempName(s, "/srv/data.bin", name, err),
            "remote temp name should be found");
    const std::string prefix = "/srv/data.bin.";
    t.check(name.compare(0, prefix.size(), prefix) == 0,
            "temp name should extend the target path");
    t.check(name.size() == prefix.size() + 20 && isLowerHex(name.substr(prefix.size())),
            "temp name should end with 20 hex chars");
    t.check(!s.hasPath(name), "naming alone should not create anything remotely");
}

void test_remote_temp_name_twice_differs(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    const std::string target = "/srv/data.bin";
    s.addFile(target, "A");

    std::string a, b;
    OpError err;
    t.check(sftpovw::remoteTempName(s, target, a, err), "first temp name should be found");
    t.check(sftpovw::remoteTempName(s, target, b, err), "second temp name should be found");
    t.check(a != b, "two names for the same target should differ");
    t.check(a != target && b != target, "temp names should never be the target");
    t.check(!s.hasPath(a) && !s.hasPath(b), "both names should be absent remotely");
}

void test_naming_exhausted(TestContext &t) {
    int checks = 0;
    const sftpovw::ExistsCheck alwaysTaken =
        [&checks](const std::string &, bool &exists, std::string &) {
            ++checks;
            exists = true;
            return true;
        };
    std::string name;
    OpError err;
    t.check(!sftpovw::makeTempName("/x/y", alwaysTaken, name, err),
            "naming should fail when every candidate exists");
    t.check(err.kind == sftpovw::ErrorKind::NamingExhausted,
            "exhaustion should be NamingExhausted");
    t.check(checks == sftpovw::kTempNameAttempts,
            "naming should stop after the bounded number of attempts");
}

void test_naming_retries_after_collision(TestContext &t) {
    int checks = 0;
    const sftpovw::ExistsCheck firstTaken =
        [&checks](const std::string &, bool &exists, std::string &) {
            exists = (++checks < 3);
            return true;
        };
    std::string name;
    OpError err;
    t.check(sftpovw::makeTempName("/x/y", firstTaken, name, err),
            "naming should succeed after collisions");
    t.check(checks == 3, "naming should keep checking until a free candidate appears");
}

void test_naming_check_failure(TestContext &t) {
    const sftpovw::ExistsCheck broken =
        [](const std::string &, bool &, std::string &e) {
            e = "permission denied";
            return false;
        };
    std::string name;
    OpError err;
    t.check(!sftpovw::makeTempName("/x/y", broken, name, err),
            "existence check failure should abort naming");
    t.check(err.kind == sftpovw::ErrorKind::TransferFailure,
            "existence check failure should be a TransferFailure");
    t.checkContains(err.message, "permission denied", "existence check error should be kept");
}

void test_list_remote_temporaries(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    const std::string leftover = "/srv/f.txt.0123456789abcdef0123";
    s.addFile("/srv/f.txt", "A");
    s.addFile(leftover, "partial");
    s.addFile("/srv/f.txt.bak", "not a temp");
    s.addFile("/srv/g.txt.0123456789abcdef0123", "other target");

    std::vector<std::string> temps;
    OpError err;
    t.check(sftpovw::listRemoteTemporaries(s, "/srv/f.txt", temps, err),
            "listing remote temporaries should succeed");
    t.check(temps.size() == 1 && temps.front() == leftover,
            "only same-shape names of the target should be listed");
    t.check(!s.hasPath(temps.front() + "x"), "listing should not create files");
}

void test_list_remote_temporaries_relative(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    s.addFile("f.txt", "A");
    s.addFile("f.txt.aaaaaaaaaaaaaaaaaaaa", "partial");

    std::vector<std::string> temps;
    OpError err;
    t.check(sftpovw::listRemoteTemporaries(s, "f.txt", temps, err),
            "relative target should list the working directory");
    t.check(temps.size() == 1 && temps.front() == "f.txt.aaaaaaaaaaaaaaaaaaaa",
            "relative temporaries should keep relative paths");
}

void test_looks_like_temporary(TestContext &t) {
    t.check(sftpovw::looksLikeTemporary("a", "a.0123", 6), "prefix and length match");
    t.check(!sftpovw::looksLikeTemporary("a", "a.01234", 6), "length must match");
    t.check(!sftpovw::looksLikeTemporary("a", "b.0123", 6), "prefix must match");
    t.check(!sftpovw::looksLikeTemporary("a", "ab0123", 6), "dot separator required");
}

void test_local_temp_name(TestContext &t) {
    sftpovw_test::ScratchDir dir("tmpname");
    t.check(dir.ok(), "scratch dir should be created");
    const std::string target = dir.file("local.dat");

    std::string name;
    OpError err;
    t.check(sftpovw::localTempName(target, name, err), "local temp name should be created");
    t.check(name.compare(0, target.size() + 1, target + ".") == 0,
            "local temp name should extend the target path");
    t.check(std::filesystem::exists(name), "local temp file should be reserved on disk");

    struct stat st{};
    t.check(::stat(name.c_str(), &st) == 0 && (st.st_mode & 0777) == 0600,
            "local temp file should only be accessible by the owner");
}

void test_local_temp_name_missing_dir(TestContext &t) {
    std::string name;
    OpError err;
    t.check(!sftpovw::localTempName("/nonexistent-sftpovw-dir/x", name, err),
            "temp in missing directory should fail");
    t.check(err.kind == sftpovw::ErrorKind::LocalIo, "failure should be LocalIo");
}

void test_list_local_temporaries(TestContext &t) {
    sftpovw_test::ScratchDir dir("listtmp");
    t.check(dir.ok(), "scratch dir should be created");
    const std::string target = dir.file("t.bin");
    t.check(sftpovw_test::writeFile(target, "A"), "target should be written");

    std::string leftover;
    OpError err;
    t.check(sftpovw::localTempName(target, leftover, err), "leftover should be created");
    t.check(sftpovw_test::writeFile(dir.file("t.bin.old"), "x"), "decoy should be written");
    t.check(sftpovw_test::writeFile(dir.file("u.bin.abcdef"), "x"), "decoy should be written");

    std::vector<std::string> temps;
    t.check(sftpovw::listLocalTemporaries(target, temps, err),
            "listing local temporaries should succeed");
    t.check(temps.size() == 1 && temps.front() == leftover,
            "only the leftover temporary should be listed");
    t.check(sftpovw_test::countEntries(dir.path()) == 4,
            "listing should not leave its own candidate file behind");
}

} // namespace

int main() {
    TestContext t;
    test_random_suffix(t);
    test_remote_temp_name_shape(t);
    test_remote_temp_name_twice_differs(t);
    test_naming_exhausted(t);
    test_naming_retries_after_collision(t);
    test_naming_check_failure(t);
    test_list_remote_temporaries(t);
    test_list_remote_temporaries_relative(t);
    test_looks_like_temporary(t);
    test_local_temp_name(t);
    test_local_temp_name_missing_dir(t);
    test_list_local_temporaries(t);
    return t.finish("sftpovw_temp_names_tests");
}
