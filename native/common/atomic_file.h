/*
 * atomic_file.h — Whole-file read and atomic replace
 *
 * Write atomically: temp -> fsync -> rename.
 */

#ifndef WIFI_RANGER_ATOMIC_FILE_H
#define WIFI_RANGER_ATOMIC_FILE_H

#include <string>

namespace wifi_ranger {

// Replace `path` with `contents`. Readers see either the old or the new file,
// never a partial one. Returns false if any step fails (temp file removed).
bool write_file_atomic(const std::string &path, const std::string &contents);

// Read the whole file into *out. Returns false if it cannot be opened or read.
bool read_file(const std::string &path, std::string *out);

} // namespace wifi_ranger

#endif // WIFI_RANGER_ATOMIC_FILE_H
