#include <link_supervisor/event_journal.hpp>

#include <cerrno>
#include <cstring>
#include <ctime>

namespace link_supervisor
{

bool EventJournal::open(const std::string & path, std::string & error)
{
  close();
  out_.open(path, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    error = std::strerror(errno);
    return false;
  }
  return true;
}

bool EventJournal::isOpen() const
{
  return out_.is_open();
}

void EventJournal::close()
{
  if (out_.is_open()) {
    out_.close();
  }
}

bool EventJournal::append(
  const std::string & message,
  const std::chrono::system_clock::time_point when)
{
  if (!out_.is_open()) {
    return false;
  }
  out_ << '[' << formatTimestamp(when) << "] " << message << '\n';
  out_.flush();
  if (!out_) {
    out_.clear();
    return false;
  }
  return true;
}

bool EventJournal::append(const std::string & message)
{
  return append(message, std::chrono::system_clock::now());
}

std::string EventJournal::formatTimestamp(const std::chrono::system_clock::time_point when)
{
  const std::time_t whenTime = std::chrono::system_clock::to_time_t(when);

  std::tm whenTm{};
  gmtime_r(&whenTime, &whenTm);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &whenTm);
  return std::string(buffer);
}

}  // namespace link_supervisor
