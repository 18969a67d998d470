#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include "pw/error.h"

namespace pw::orchestrator {

struct AtomicReplaceHooks { // TSK068_Atomic_Writes test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Writes |payload| to a temporary sibling of |target|, fsyncs it, then renames
// it into place and syncs the directory. Throws pw::Error(IO) on failure.
void AtomicReplace(const std::filesystem::path& target, std::span<const std::uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});
void AtomicReplace(const std::filesystem::path& target, std::string_view text,
                   const AtomicReplaceHooks& hooks = {});

// Whole-file read. Throws pw::Error(IO, kFileUnreadable) carrying errno.
std::string ReadFileText(const std::filesystem::path& path);

// Creates |dir| (and parents) and restricts it to the owner.
void EnsurePrivateDirectory(const std::filesystem::path& dir);

}  // namespace pw::orchestrator
