#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

class FetchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Loads a .torrent descriptor. Throws FetchError on failure.
using TorrentFetcher = std::function<std::vector<std::uint8_t>(const std::string& url)>;

// Upper bound on a descriptor body; anything larger is not a metafile.
constexpr std::size_t kMaxTorrentSize = 32 * 1024 * 1024;

struct FetchOptions {
  // Covers one whole request: resolve, connect, TLS handshake and the response.
  std::chrono::milliseconds timeout{30000};
  std::size_t max_size = kMaxTorrentSize;
  int max_redirects = 5;
};

struct ParsedUrl {
  std::string scheme; // lower case, empty for plain paths
  std::string host;
  std::string port;
  std::string target; // path + query for http(s), filesystem path otherwise
};

ParsedUrl parse_url(const std::string& url);

// Where a redirect's Location points, given the URL that produced it.
ParsedUrl resolve_location(const ParsedUrl& base, const std::string& location);

// Supports http://, https://, file:// and plain filesystem paths. magnet:
// links are rejected with FetchError.
std::vector<std::uint8_t> fetch_torrent_content(const std::string& url,
                                                const FetchOptions& options = FetchOptions());

TorrentFetcher make_torrent_fetcher(FetchOptions options = FetchOptions());
