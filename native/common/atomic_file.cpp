/*
 * atomic_file.cpp — Whole-file read and atomic replace
 */

#include "common/atomic_file.h"

#include <cstdio>
#include <utility>

#include <unistd.h>

namespace wifi_ranger {

bool write_file_atomic(const std::string &path, const std::string &contents) {
  const std::string tmp_path = path + ".tmp";

  FILE *f = std::fopen(tmp_path.c_str(), "w");
  if (!f)
    return false;

  size_t written = std::fwrite(contents.data(), 1, contents.size(), f);
  bool ok = written == contents.size();

  // Flush + fsync
  ok = ok && std::fflush(f) == 0;
  int fd = fileno(f);
  if (ok && fd >= 0)
    ok = fsync(fd) == 0;
  ok = (std::fclose(f) == 0) && ok;

  if (!ok) {
    std::remove(tmp_path.c_str());
    return false;
  }

  // Atomic rename
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::remove(tmp_path.c_str());
    return false;
  }
  return true;
}

bool read_file(const std::string &path, std::string *out) {
  FILE *f = std::fopen(path.c_str(), "rb");
  if (!f)
    return false;

  std::string data;
  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
    data.append(buf, n);

  bool ok = std::ferror(f) == 0;
  std::fclose(f);
  if (!ok)
    return false;

  *out = std::move(data);
  return true;
}

} // namespace wifi_ranger
