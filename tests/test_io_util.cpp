#include "pw/orchestrator/io_util.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>

#include <sys/stat.h>

#include "test_support.h"

namespace {

  using pw::test::Expect;

  void TestCrashBeforeRenameKeepsOriginal() { // TSK068_Atomic_Writes
    pw::test::TempDir dir("pw_io_util");
    const auto target = dir.path() / "plugin.json";
    pw::test::WriteFile(target, "{\"id\":\"baseline\"}");

    pw::orchestrator::AtomicReplaceHooks hooks;
    hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
      throw std::runtime_error("simulated crash");
    };
    bool threw = false;
    try {
      pw::orchestrator::AtomicReplace(target, std::string_view("{\"id\":\"update\"}"), hooks);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    Expect(threw, "simulated crash propagates");
    Expect(pw::test::ReadFile(target) == "{\"id\":\"baseline\"}", "original survives a crash before rename");

    pw::orchestrator::AtomicReplace(target, std::string_view("{\"id\":\"update\"}"));
    Expect(pw::orchestrator::ReadFileText(target) == "{\"id\":\"update\"}", "replace lands after rename");
  }

  void TestBinaryPayload() {
    pw::test::TempDir dir("pw_io_util");
    const auto target = dir.path() / "blob.bin";
    const std::array<std::uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
    pw::orchestrator::AtomicReplace(target, std::span<const std::uint8_t>(update.data(), update.size()));
    const auto bytes = pw::test::ReadFile(target);
    Expect(bytes.size() == 4 && static_cast<std::uint8_t>(bytes[0]) == 0xBA &&
               static_cast<std::uint8_t>(bytes[3]) == 0x0D,
           "binary payload written verbatim");
    struct stat info {};
    Expect(::stat(target.c_str(), &info) == 0 && (info.st_mode & 0777) == 0600, "replaced file is owner-only");
  }

  void TestReadMissingFile() {
    pw::test::TempDir dir("pw_io_util");
    pw::test::ExpectError([&] { (void)pw::orchestrator::ReadFileText(dir.path() / "absent"); },
                          pw::ErrorDomain::IO, pw::errors::io::kFileUnreadable, "missing file is an IO error");
  }

  void TestPrivateDirectory() {
    pw::test::TempDir dir("pw_io_util");
    const auto nested = dir.path() / "a" / "b";
    pw::orchestrator::EnsurePrivateDirectory(nested);
    struct stat info {};
    Expect(::stat(nested.c_str(), &info) == 0 && S_ISDIR(info.st_mode), "directory created");
    Expect((info.st_mode & 0777) == 0700, "directory restricted to owner");
  }

} // namespace

int main() {
  TestCrashBeforeRenameKeepsOriginal();
  TestBinaryPayload();
  TestReadMissingFile();
  TestPrivateDirectory();
  return pw::test::Finish("atomic replace");
}
