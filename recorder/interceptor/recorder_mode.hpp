#ifndef HTTPREC_RECORDER_INTERCEPTOR_RECORDER_MODE_HPP_
#define HTTPREC_RECORDER_INTERCEPTOR_RECORDER_MODE_HPP_

#include <optional>
#include <string_view>

namespace httprec::recorder
{
  enum class RecorderMode
  {
    // Resolves to Replay when the interaction exists, Record otherwise.
    Auto,
    Record,
    Replay,
    Passthrough
  };

  std::string_view to_string(RecorderMode mode);

  // Exact, case-sensitive match on "Passthrough", "Record", "Replay" or "Auto".
  std::optional<RecorderMode> parse_recorder_mode(std::string_view text);
}

#endif // HTTPREC_RECORDER_INTERCEPTOR_RECORDER_MODE_HPP_
