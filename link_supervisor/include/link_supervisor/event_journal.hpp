#pragma once

#include <chrono>
#include <fstream>
#include <string>

namespace link_supervisor
{

/**
 * Append-only file mirror of supervisor log lines. Each line is prefixed with a
 * UTC timestamp: "[2025-03-05T10:00:00Z] message". Write errors are reported to
 * the caller and never thrown.
 */
class EventJournal
{
public:
  EventJournal() = default;

  /// Opens `path` for appending. On failure returns false and fills `error`.
  bool open(const std::string & path, std::string & error);
  bool isOpen() const;
  void close();

  /// Returns false when the line could not be written.
  bool append(const std::string & message, std::chrono::system_clock::time_point when);
  bool append(const std::string & message);

  static std::string formatTimestamp(std::chrono::system_clock::time_point when);

private:
  std::ofstream out_;
};

}  // namespace link_supervisor
