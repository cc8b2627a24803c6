// recorder/interceptor/recorder_mode.cpp
#include "recorder_mode.hpp"

namespace httprec::recorder
{
  std::string_view to_string(RecorderMode mode)
  {
    switch (mode)
    {
    case RecorderMode::Auto: return "Auto";
    case RecorderMode::Record: return "Record";
    case RecorderMode::Replay: return "Replay";
    case RecorderMode::Passthrough: return "Passthrough";
    }
    return "Unknown";
  }

  std::optional<RecorderMode> parse_recorder_mode(std::string_view text)
  {
    for (auto mode : {RecorderMode::Auto, RecorderMode::Record, RecorderMode::Replay, RecorderMode::Passthrough})
    {
      if (text == to_string(mode))
      {
        return mode;
      }
    }
    return std::nullopt;
  }
}
