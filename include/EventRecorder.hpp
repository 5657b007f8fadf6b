#ifndef OUTLINE_EVENT_RECORDER_HPP
#define OUTLINE_EVENT_RECORDER_HPP

#include <iosfwd>
#include <string>

namespace outline {

/**
 * @brief Severity of a recorded event
 */
enum class EventLevel { Debug, Info, Warning, Error };

/// "DEBUG", "INFO", "WARNING" or "ERROR"
const char *toString(EventLevel level);

/**
 * @brief Reporting sink handed to the pipeline by its caller
 *
 * Components hold a non-owning pointer and stay silent when it is null.
 */
class EventRecorder {
public:
  virtual ~EventRecorder() = default;

  /**
   * @brief Record one event
   * @param level Severity
   * @param message Human readable message, without trailing newline
   */
  virtual void recordEvent(EventLevel level, const std::string &message) = 0;
};

/**
 * @brief Writes "LEVEL: message" lines to a stream
 */
class StreamEventRecorder : public EventRecorder {
public:
  /**
   * @brief Constructor
   * @param out Destination stream, must outlive the recorder
   * @param minLevel Events below this level are dropped
   */
  explicit StreamEventRecorder(std::ostream &out,
                               EventLevel minLevel = EventLevel::Info);

  void recordEvent(EventLevel level, const std::string &message) override;

  void setMinLevel(EventLevel minLevel) { m_minLevel = minLevel; }
  EventLevel minLevel() const { return m_minLevel; }

private:
  std::ostream &m_out;
  EventLevel m_minLevel;
};

/**
 * @brief Discards every event
 */
class NullEventRecorder : public EventRecorder {
public:
  void recordEvent(EventLevel, const std::string &) override {}
};

} // namespace outline

#endif // OUTLINE_EVENT_RECORDER_HPP
