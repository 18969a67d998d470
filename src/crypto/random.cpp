#include "pw/crypto/random.h"

#include <cerrno>
#include <fstream>

#if defined(__linux__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include "pw/error.h"

namespace {

void ReadFromUrandom(std::span<std::uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw pw::Error(pw::ErrorDomain::Crypto, pw::errors::io::kFileUnreadable,
                    "Failed to open /dev/urandom", errno);
  }
  urandom.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw pw::Error(pw::ErrorDomain::Crypto, pw::errors::io::kFileUnreadable,
                    "Failed to read sufficient entropy from /dev/urandom", errno);
  }
}

}  // namespace

namespace pw::crypto {

void SystemRandomBytes(std::span<std::uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(__linux__)
  std::size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, GRND_NONBLOCK);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == ENOSYS) {
        break; // entropy pool not ready or old kernel, fall back below
      }
      throw Error(ErrorDomain::Crypto, errors::internal::kUnexpected, "getrandom failed", errno);
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<std::size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

}  // namespace pw::crypto
