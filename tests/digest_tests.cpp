// Remote and local digests: check-file extension, command fallback, parsing.
#include "TestSupport.hpp"

#include "sftpovw/Digest.hpp"
#include "sftpovw/Hashing.hpp"

#include <string>
#include <vector>

using sftpovw::DigestAlgorithm;
using sftpovw::DigestOptions;
using sftpovw::DigestResult;
using sftpovw::ErrorKind;
using sftpovw::MockSftpSession;
using sftpovw::OpError;
using sftpovw::Verifier;
using sftpovw_test::TestContext;

namespace {

const std::string kHelloSha1 = "2aae6c35c94fcfb415dbe95f408b9ce91ee846ed";

void test_known_digests(TestContext &t) {
    std::string hex, err;
    t.check(sftpovw::hexDigest(DigestAlgorithm::Sha1, "hello world", hex, err) &&
                hex == kHelloSha1,
            "sha1('hello world') should match the published value");
    t.check(sftpovw::hexDigest(DigestAlgorithm::Md5, "", hex, err) &&
                hex == "d41d8cd98f00b204e9800998ecf8427e",
            "md5('') should match the published value");
    t.check(sftpovw::hexDigest(DigestAlgorithm::Sha256, "abc", hex, err) &&
                hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
            "sha256('abc') should match the published value");

    sftpovw::Hasher h;
    t.check(h.init(DigestAlgorithm::Sha1, err), "hasher init should succeed");
    t.check(h.update("hello ", 6, err) && h.update("world", 5, err),
            "incremental update should succeed");
    t.check(h.finalHex(hex, err) && hex == kHelloSha1,
            "incremental digest should equal the one-shot digest");
}

void test_local_digest(TestContext &t) {
    sftpovw_test::ScratchDir dir("digest");
    const std::string a = dir.file("a.txt");
    t.check(sftpovw_test::writeFile(a, "hello world"), "file should be written");

    DigestResult out;
    OpError err;
    t.check(sftpovw::digestLocal({a}, DigestAlgorithm::Sha1, out, err),
            "local digest should succeed");
    t.check(out.size() == 1 && out[a] == kHelloSha1, "local digest should be sha1");

    t.check(!sftpovw::digestLocal({a, dir.file("missing")}, DigestAlgorithm::Sha1,
                                  out, err),
            "local digest of a missing file should fail");
    t.check(err.kind == ErrorKind::LocalIo, "missing local file is LocalIo");
}

void test_command_fallback_matches_local(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    s.addFile("/d/a b.txt", "hello world");
    s.addFile("/d/c.txt", "other");

    Verifier v(s);
    DigestResult out;
    OpError err;
    t.check(v.digest({"/d/a b.txt", "/d/c.txt"}, out, err),
            "digest should fall back to the remote command: " + err.describe());
    t.check(out.size() == 2, "both files should be digested");
    t.check(out["/d/a b.txt"] == kHelloSha1, "remote digest should equal local digest");
    t.check(s.commands().size() == 1, "the batch should run as a single command");
    if (!s.commands().empty())
        t.checkContains(s.commands().front(), "sha1sum '/d/a b.txt' /d/c.txt",
                        "paths should be shell quoted");
}

void test_extension_path(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    s.setCheckFileSupported(true);
    s.addFile("/d/a", "hello world");

    Verifier v(s);
    DigestResult out;
    OpError err;
    t.check(v.digest({"/d/a"}, out, err), "extension digest should succeed");
    t.check(out["/d/a"] == kHelloSha1, "extension digest should equal local digest");
    t.check(s.commands().empty(), "no command should run when the extension answers");
}

void test_extension_missing_file_is_not_unsupported(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    s.setCheckFileSupported(true);
    s.addFile("/d/a", "hello world");

    Verifier v(s);
    DigestResult out;
    OpError err;
    t.check(v.digest({"/d/a", "/d/missing"}, out, err),
            "partial extension result should not be an error");
    t.check(out.size() == 1 && out.count("/d/a") == 1,
            "missing file should be omitted from the result");
    t.check(s.commands().empty(), "a missing file must not trigger the fallback");

    t.check(!v.digest({"/d/missing"}, out, err), "nothing digested should fail");
    t.check(err.kind == ErrorKind::TransferFailure, "failure should be TransferFailure");
}

void test_command_not_found(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    s.addFile("/d/a", "x");

    DigestOptions opt;
    opt.command = "nosuchsum";
    Verifier v(s, opt);
    DigestResult out;
    OpError err;
    t.check(!v.digestByCommand({"/d/a"}, out, err), "missing utility should fail");
    t.check(err.kind == ErrorKind::CommandNotFound, "exit 127 is CommandNotFound");
}

void test_some_files_missing(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    s.addFile("/d/a", "hello world");

    Verifier v(s);
    DigestResult out;
    OpError err;
    t.check(v.digestByCommand({"/d/a", "/d/gone"}, out, err),
            "exit 1 with partial output should succeed");
    t.check(out.size() == 1 && out["/d/a"] == kHelloSha1,
            "present file should still be digested");
    const auto missing = sftpovw::missingDigests({"/d/a", "/d/gone"}, out);
    t.check(missing.size() == 1 && missing.front() == "/d/gone",
            "missingDigests should name the absent path");

    t.check(!v.digestByCommand({"/d/gone"}, out, err), "exit 1 with nothing parsed fails");
    t.check(err.kind == ErrorKind::UnknownCommandError,
            "exit 1 without digests is UnknownCommandError");
}

void test_unknown_exit_status(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");

    sftpovw::ExecResult r;
    r.exitStatus = 2;
    r.stderrData = "sha1sum: invalid option\n";
    s.queueExecResult(r);

    Verifier v(s);
    DigestResult out;
    OpError err;
    t.check(!v.digestByCommand({"/d/a"}, out, err), "status 2 without output fails");
    t.check(err.kind == ErrorKind::UnknownCommandError, "status 2 is UnknownCommandError");
    t.checkContains(err.message, "invalid option", "stderr should be reported");

    r.stdoutData = kHelloSha1 + "  /d/a\n";
    s.queueExecResult(r);
    t.check(v.digestByCommand({"/d/a"}, out, err),
            "non-zero status with output keeps the partial result");
}

void test_sha256_command(TestContext &t) {
    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    s.addFile("/d/a", "abc");

    DigestOptions opt;
    opt.algorithm = DigestAlgorithm::Sha256;
    Verifier v(s, opt);
    t.check(sftpovw::digestCommandFor(v.options()) == "sha256sum",
            "utility should follow the algorithm");
    DigestResult out;
    OpError err;
    t.check(v.digest({"/d/a"}, out, err), "sha256 digest should succeed");
    t.check(out["/d/a"] ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
            "sha256 remote digest should match");
}

void test_empty_and_disconnected(TestContext &t) {
    MockSftpSession s;
    Verifier v(s);
    DigestResult out;
    OpError err;
    t.check(v.digest({}, out, err) && out.empty(), "empty batch is an empty result");
    t.check(s.commands().empty(), "empty batch should not run anything");
    t.check(!v.digest({"/x"}, out, err), "disconnected digest should fail");
    t.check(err.kind == ErrorKind::NotConnected, "failure should be NotConnected");
}

void test_parse_output(TestContext &t) {
    const std::vector<std::string> wanted = {"/a", "/b c", "/n\nl", "/star"};
    DigestResult out;
    sftpovw::parseDigestOutput(
        "ABCDEF01  /a\n"
        "0123abcd  /b c\n"
        "\\deadbeef  /n\\nl\n"
        "cafe0000 */star\n"
        "ffff0000  /unrequested\n"
        "not-a-digest  /a\n"
        "\n",
        wanted, out);
    t.check(out.size() == 4, "four requested lines should parse");
    t.check(out["/a"] == "abcdef01", "digests should be lowercased");
    t.check(out["/b c"] == "0123abcd", "names with spaces should be kept");
    t.check(out["/n\nl"] == "deadbeef", "escaped names should be unescaped");
    t.check(out["/star"] == "cafe0000", "binary marker should be stripped");
    t.check(out.count("/unrequested") == 0, "unrequested paths should be ignored");
}

void test_build_command(TestContext &t) {
    t.check(sftpovw::buildDigestCommand("md5sum", {"/x", "it's"}) ==
                "md5sum /x 'it'\"'\"'s'",
            "single quotes should be escaped for the shell");
}

void test_dash_leading_paths(TestContext &t) {
    t.check(sftpovw::buildDigestCommand("sha1sum", {"-c", "-", "/d/-x", "a"}) ==
                "sha1sum ./-c ./- /d/-x a",
            "relative paths starting with '-' should not reach the tool as options");

    MockSftpSession s;
    t.check(sftpovw_test::connectMock(s), "connect should succeed");
    sftpovw::ExecResult r;
    r.exitStatus = 0;
    r.stdoutData = kHelloSha1 + "  ./-c\n" + kHelloSha1 + "  a\n";
    s.queueExecResult(r);

    Verifier v(s);
    DigestResult out;
    OpError err;
    t.check(v.digestByCommand({"-c", "a"}, out, err),
            "digest of a dash-leading name should succeed: " + err.describe());
    t.check(!s.commands().empty() && s.commands().back() == "sha1sum ./-c a",
            "the remote command should carry the ./ prefix");
    t.check(out.size() == 2 && out["-c"] == kHelloSha1 && out["a"] == kHelloSha1,
            "results should be keyed by the requested paths");
    t.check(out.count("./-c") == 0, "the prefixed name should not leak into the result");
}

} // namespace

int main() {
    TestContext t;
    test_known_digests(t);
    test_local_digest(t);
    test_command_fallback_matches_local(t);
    test_extension_path(t);
    test_extension_missing_file_is_not_unsupported(t);
    test_command_not_found(t);
    test_some_files_missing(t);
    test_unknown_exit_status(t);
    test_sha256_command(t);
    test_empty_and_disconnected(t);
    test_parse_output(t);
    test_build_command(t);
    test_dash_leading_paths(t);
    return t.finish("sftpovw_digest_tests");
}
