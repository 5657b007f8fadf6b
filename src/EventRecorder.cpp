#include "EventRecorder.hpp"

#include <ostream>

namespace outline {

const char *toString(EventLevel level) {
  switch (level) {
  case EventLevel::Debug:
    return "DEBUG";
  case EventLevel::Info:
    return "INFO";
  case EventLevel::Warning:
    return "WARNING";
  case EventLevel::Error:
  default:
    return "ERROR";
  }
}

StreamEventRecorder::StreamEventRecorder(std::ostream &out,
                                         EventLevel minLevel)
    : m_out(out), m_minLevel(minLevel) {}

void StreamEventRecorder::recordEvent(EventLevel level,
                                      const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(m_minLevel))
    return;
  m_out << toString(level) << ": " << message << std::endl;
}

} // namespace outline
