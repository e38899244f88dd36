#ifndef STORM_DAMAGE_AGGREGATOR_ERRORS_HPP
#define STORM_DAMAGE_AGGREGATOR_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace stormagg {

// Damage value that is neither a zero sentinel nor a numeral with a known
// scale suffix. Always fatal.
class MalformedMagnitudeError : public std::runtime_error {
 public:
  MalformedMagnitudeError(std::string value, std::string event_id, std::string field)
      : std::runtime_error(describe(value, event_id, field)),
        value_(std::move(value)),
        event_id_(std::move(event_id)),
        field_(std::move(field)) {}

  const std::string& value() const { return value_; }
  const std::string& eventId() const { return event_id_; }
  const std::string& field() const { return field_; }

 private:
  static std::string describe(const std::string& value, const std::string& event_id, const std::string& field) {
    std::string message = "Malformed magnitude '" + value + "'";
    if (!field.empty()) {
      message += " in field " + field;
    }
    if (!event_id.empty()) {
      message += " of event " + event_id;
    }
    return message;
  }

  std::string value_;
  std::string event_id_;
  std::string field_;
};

class CrsMismatchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Unreadable file, missing column, unparseable coordinate.
class InputError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class FetchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

} // namespace stormagg

#endif
