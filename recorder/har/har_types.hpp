#ifndef HTTPREC_RECORDER_HAR_HAR_TYPES_HPP_
#define HTTPREC_RECORDER_HAR_HAR_TYPES_HPP_

#include <boost/describe.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// HAR 1.2 (http://www.softwareishard.com/blog/har-12-spec/) wire types.
// Member names are the JSON property names, so they stay lower camel case.
// std::optional members are omitted from the output when empty; every other
// member is required when reading.
namespace httprec::recorder::har
{
  struct NameValue
  {
    std::string name;
    std::string value;
  };

  BOOST_DESCRIBE_STRUCT(NameValue, (), (name, value))

  struct Creator
  {
    std::string name;
    std::string version;
    std::optional<std::string> comment;
  };

  BOOST_DESCRIBE_STRUCT(Creator, (), (name, version, comment))

  struct PostDataParam
  {
    std::string name;
    std::optional<std::string> value;
    std::optional<std::string> fileName;
    std::optional<std::string> contentType;
  };

  BOOST_DESCRIBE_STRUCT(PostDataParam, (), (name, value, fileName, contentType))

  // "encoding" is not part of HAR 1.2 postData; it mirrors content.encoding so
  // binary request bodies survive the round trip.
  struct PostData
  {
    std::string mimeType;
    std::optional<std::vector<PostDataParam>> params;
    std::optional<std::string> text;
    std::optional<std::string> encoding;
  };

  BOOST_DESCRIBE_STRUCT(PostData, (), (mimeType, params, text, encoding))

  struct EntryRequest
  {
    std::string method;
    std::string url;
    std::string httpVersion;
    std::optional<std::vector<NameValue>> cookies;
    std::vector<NameValue> headers;
    std::vector<NameValue> queryString;
    std::optional<PostData> postData;
    std::int64_t headersSize = -1;
    std::int64_t bodySize = -1;
  };

  BOOST_DESCRIBE_STRUCT(EntryRequest, (),
                        (method, url, httpVersion, cookies, headers, queryString, postData, headersSize, bodySize))

  struct Content
  {
    std::int64_t size = 0;
    std::optional<std::int64_t> compression;
    std::string mimeType;
    std::optional<std::string> text;
    std::optional<std::string> encoding;
  };

  BOOST_DESCRIBE_STRUCT(Content, (), (size, compression, mimeType, text, encoding))

  struct EntryResponse
  {
    std::int64_t status = 0;
    std::string statusText;
    std::string httpVersion;
    std::optional<std::vector<NameValue>> cookies;
    std::vector<NameValue> headers;
    Content content;
    std::string redirectURL;
    std::int64_t headersSize = -1;
    std::int64_t bodySize = -1;
  };

  BOOST_DESCRIBE_STRUCT(EntryResponse, (),
                        (status, statusText, httpVersion, cookies, headers, content, redirectURL, headersSize, bodySize))

  struct Cache
  {
    std::optional<std::string> comment;
  };

  BOOST_DESCRIBE_STRUCT(Cache, (), (comment))

  // Milliseconds, -1 when not applicable.
  struct Timings
  {
    std::optional<double> blocked;
    std::optional<double> dns;
    std::optional<double> connect;
    double send = 0;
    double wait = 0;
    double receive = 0;
    std::optional<double> ssl;
  };

  BOOST_DESCRIBE_STRUCT(Timings, (), (blocked, dns, connect, send, wait, receive, ssl))

  struct Entry
  {
    std::optional<std::string> pageref;
    std::string startedDateTime;
    double time = 0;
    EntryRequest request;
    EntryResponse response;
    Cache cache;
    Timings timings;
    std::optional<std::string> serverIPAddress;
    std::optional<std::string> connection;
    std::optional<std::string> comment;
  };

  BOOST_DESCRIBE_STRUCT(Entry, (),
                        (pageref, startedDateTime, time, request, response, cache, timings, serverIPAddress, connection,
                          comment))

  // "entries" must stay the last member: the append fast path relies on the
  // serialized document ending with the entries array.
  struct Log
  {
    std::string version;
    Creator creator;
    std::vector<Entry> entries;
  };

  BOOST_DESCRIBE_STRUCT(Log, (), (version, creator, entries))

  struct HttpArchive
  {
    Log log;
  };

  BOOST_DESCRIBE_STRUCT(HttpArchive, (), (log))
}

#endif // HTTPREC_RECORDER_HAR_HAR_TYPES_HPP_
