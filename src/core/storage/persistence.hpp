#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace fieldops {

// Where finally stored bytes live. Positions are 1-based within one operation stream.
class IEventPersistence {
public:
  virtual ~IEventPersistence() = default;

  virtual Result open() = 0;
  virtual Result append_raw(const Event& event) = 0;
  // `to_position` of 0 reads to the end of the stream.
  virtual Result read_range(std::string_view operation_id, std::uint64_t from_position, std::uint64_t to_position,
                            std::vector<Event>& out) const = 0;
  virtual Result read_tail(std::string_view operation_id, std::optional<Event>& out) const = 0;

  [[nodiscard]] virtual std::vector<std::string> operations() const = 0;
  [[nodiscard]] virtual std::size_t invalid_line_count() const = 0;
  [[nodiscard]] virtual std::string location() const = 0;
};

class MemoryEventPersistence : public IEventPersistence {
public:
  Result open() override;
  Result append_raw(const Event& event) override;
  Result read_range(std::string_view operation_id, std::uint64_t from_position, std::uint64_t to_position,
                    std::vector<Event>& out) const override;
  Result read_tail(std::string_view operation_id, std::optional<Event>& out) const override;

  [[nodiscard]] std::vector<std::string> operations() const override;
  [[nodiscard]] std::size_t invalid_line_count() const override { return 0; }
  [[nodiscard]] std::string location() const override { return ":memory:"; }

protected:
  std::map<std::string, std::vector<Event>, std::less<>> streams_;
};

// One tab-separated line per event in <data_dir>/events.log, payload hex encoded.
class FileEventLog final : public MemoryEventPersistence {
public:
  explicit FileEventLog(std::string data_dir);

  Result open() override;
  Result append_raw(const Event& event) override;

  [[nodiscard]] std::size_t invalid_line_count() const override { return invalid_lines_; }
  [[nodiscard]] std::string location() const override { return event_log_path_; }

private:
  std::string data_dir_;
  std::string event_log_path_;
  std::size_t invalid_lines_ = 0;
};

std::string serialize_event_line(const Event& event);
bool parse_event_line(std::string_view line, Event& out);

}  // namespace fieldops
