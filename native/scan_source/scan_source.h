/*
 * scan_source.h — Platform scan invocation
 *
 * A ScanSource produces the raw text of one scan. Variants:
 *   CommandScanSource : runs a scan tool (fork + execvp), captures stdout,
 *                       kills the child on timeout or cancel
 *   FileScanSource    : re-reads a capture file every cycle (replay, tests)
 *
 * Selected once at startup via make_scan_source().
 */

#ifndef WIFI_RANGER_SCAN_SOURCE_H
#define WIFI_RANGER_SCAN_SOURCE_H

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace wifi_ranger {

enum class ScanStatus {
  OK,
  TOOL_NOT_FOUND,
  SPAWN_FAILED,
  TIMEOUT,
  TOOL_FAILED, // non-zero exit or killed by a signal
  READ_FAILED,
  CANCELLED,
};

const char *scan_status_name(ScanStatus s);

enum class ScanBackend {
  AIRPORT,
  WPA_CLI,
  CAPTURE_FILE,
};

const char *scan_backend_name(ScanBackend b);
bool parse_scan_backend(const std::string &text, ScanBackend *out);

// macOS scan tool
static constexpr char AIRPORT_PATH[] =
    "/System/Library/PrivateFrameworks/Apple80211.framework/Versions/Current/"
    "Resources/airport";
static constexpr char DEFAULT_WPA_INTERFACE[] = "wlan0";
static constexpr size_t MAX_SCAN_OUTPUT_BYTES = 1 << 20;

class ScanSource {
public:
  virtual ~ScanSource() = default;

  // Run one scan. On OK *out holds the raw text; otherwise *reason says why.
  virtual ScanStatus scan(std::string *out, std::string *reason) = 0;

  // Abort an outstanding scan() from another thread. Sticky until resume().
  virtual void cancel() {}
  virtual void resume() {}

  // Upper bound for one scan(); sources that cannot hang ignore it.
  virtual void set_timeout(std::chrono::seconds) {}

  // Startup check that the source can work at all.
  virtual bool verify(std::string *reason) const = 0;

  virtual std::string name() const = 0;
};

// =========================================================================
// COMMAND SOURCE
// =========================================================================

class CommandScanSource : public ScanSource {
public:
  CommandScanSource(std::vector<std::string> argv,
                    std::chrono::seconds timeout);

  ScanStatus scan(std::string *out, std::string *reason) override;
  void cancel() override;
  void resume() override;
  bool verify(std::string *reason) const override;
  std::string name() const override;

  void set_timeout(std::chrono::seconds timeout) override;
  const std::vector<std::string> &argv() const { return argv_; }

private:
  std::vector<std::string> argv_;
  std::atomic<long long> timeout_ms_;
  std::atomic<bool> cancelled_;
  std::atomic<pid_t> child_pid_;
};

std::vector<std::string> airport_scan_argv();
std::vector<std::string> wpa_cli_scan_argv(const std::string &interface);

// True if program is an executable path, or found on $PATH.
bool find_executable(const std::string &program);

// =========================================================================
// FILE SOURCE
// =========================================================================

class FileScanSource : public ScanSource {
public:
  explicit FileScanSource(const std::string &path);

  ScanStatus scan(std::string *out, std::string *reason) override;
  bool verify(std::string *reason) const override;
  std::string name() const override;

private:
  std::string path_;
};

// =========================================================================
// FACTORY
// =========================================================================

// interface is used by WPA_CLI (empty -> wlan0), path by CAPTURE_FILE.
std::unique_ptr<ScanSource> make_scan_source(ScanBackend backend,
                                             const std::string &interface,
                                             const std::string &path,
                                             std::chrono::seconds timeout,
                                             std::string *reason);

} // namespace wifi_ranger

#endif // WIFI_RANGER_SCAN_SOURCE_H
