#ifndef HTTPREC_RECORDER_HAR_HTTP_ARCHIVE_HPP_
#define HTTPREC_RECORDER_HAR_HTTP_ARCHIVE_HPP_

#include "har/har_types.hpp"
#include "model/interaction.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httprec::recorder::har
{
  inline constexpr std::string_view kArchiveVersion = "1.2";
  inline constexpr std::string_view kCreatorName = "httprec";

  // Domain <-> archive projection
  Entry to_entry(const InteractionMessage& message);
  HttpArchive to_archive(const Interaction& interaction);

  /**
   * @brief Rebuilds a domain message from an archive entry.
   * @throws MalformedArchive if a body cannot be decoded or the timestamp is invalid.
   */
  InteractionMessage from_entry(const Entry& entry);

  /**
   * @brief Inverse of to_archive().
   * @throws MalformedArchive if the log version is not 1.1/1.2 or an entry is structurally invalid.
   */
  Interaction from_archive(const HttpArchive& archive, const std::string& name);

  // JSON codec
  std::string serialize(const HttpArchive& archive);
  std::string serialize_entry(const Entry& entry);

  /**
   * @brief Parses a serialized archive.
   * @throws MalformedArchive on invalid JSON, missing required fields or wrong types.
   */
  HttpArchive parse(std::string_view document);

  /**
   * @brief Appends entries to a serialized archive without reparsing it.
   *
   * Only works on documents shaped like serialize() output, i.e. ending with the
   * entries array followed by the closing braces of "log" and of the root
   * object. Returns std::nullopt when the tail does not have that shape; the
   * caller must then fall back to parse / append / serialize. For documents
   * written by serialize() the result is byte-for-byte the slow path's output.
   */
  std::optional<std::string> append_entries(std::string_view document, const std::vector<Entry>& entries);

  std::string format_timestamp(std::chrono::system_clock::time_point time);
  std::chrono::system_clock::time_point parse_timestamp(const std::string& text);

  std::string format_http_version(unsigned version);
  unsigned parse_http_version(std::string_view text);

  // Bodies that are not valid UTF-8 are archived base64 encoded.
  bool is_text(std::string_view data);
  std::string base64_encode(std::string_view data);
  std::string base64_decode(std::string_view text);
}

#endif // HTTPREC_RECORDER_HAR_HTTP_ARCHIVE_HPP_
