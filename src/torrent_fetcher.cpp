#include "torrent_fetcher.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace {

using asio::ip::tcp;
using Clock = std::chrono::steady_clock;

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path, std::size_t max_size) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if(ec) {
    throw FetchError("Cannot read " + path.string() + ": " + ec.message());
  }
  if(size > max_size) {
    throw FetchError("Torrent file " + path.string() + " is too large");
  }
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw FetchError("Cannot open " + path.string());
  }
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in),
                                   std::istreambuf_iterator<char>());
}

struct HttpResponse {
  int status = 0;
  std::string location;
  std::string body;
};

// Drives the request's private io_context one handler at a time. When the
// deadline passes, the socket is closed and the aborted handlers are drained
// before FetchError is thrown, so no handler outlives the request.
class Deadline {
public:
  Deadline(asio::io_context& io, tcp::socket::lowest_layer_type& socket,
           std::chrono::milliseconds timeout, std::string host)
    : io_(io), socket_(socket), expires_at_(Clock::now() + timeout),
      timeout_(timeout), host_(std::move(host)) {}

  void wait(const bool& done, const char* phase, const std::function<void()>& cancel = {}) {
    io_.restart();
    while(!done) {
      auto now = Clock::now();
      if(now >= expires_at_) break;
      io_.run_one_for(expires_at_ - now);
      if(io_.stopped() && !done) io_.restart();
    }
    if(done) return;

    if(cancel) cancel();
    std::error_code ignored;
    socket_.close(ignored);
    io_.restart();
    io_.run();
    throw FetchError("Timed out " + std::string(phase) + " " + host_ + " after " +
                     std::to_string(timeout_.count()) + " ms");
  }

private:
  asio::io_context& io_;
  tcp::socket::lowest_layer_type& socket_;
  Clock::time_point expires_at_;
  std::chrono::milliseconds timeout_;
  std::string host_;
};

void connect(asio::io_context& io, tcp::socket& socket, Deadline& deadline, const ParsedUrl& url) {
  tcp::resolver resolver(io);
  tcp::resolver::results_type endpoints;
  std::error_code ec;
  bool done = false;
  resolver.async_resolve(url.host, url.port,
    [&](const std::error_code& result, tcp::resolver::results_type found){
      ec = result;
      endpoints = std::move(found);
      done = true;
    });
  deadline.wait(done, "resolving", [&]{ resolver.cancel(); });
  if(ec) throw FetchError("Cannot resolve " + url.host + ": " + ec.message());

  done = false;
  asio::async_connect(socket, endpoints,
    [&](const std::error_code& result, const tcp::endpoint&){
      ec = result;
      done = true;
    });
  deadline.wait(done, "connecting to");
  if(ec) throw FetchError("Cannot connect to " + url.host + ": " + ec.message());
}

template<typename Stream>
std::string round_trip(Stream& stream, Deadline& deadline, const ParsedUrl& url, std::size_t max_size) {
  std::string request =
    "GET " + url.target + " HTTP/1.0\r\n"
    "Host: " + url.host + "\r\n"
    "User-Agent: modsync\r\n"
    "Accept: application/x-bittorrent, */*\r\n"
    "Connection: close\r\n\r\n";

  std::error_code ec;
  bool done = false;
  asio::async_write(stream, asio::buffer(request),
    [&](const std::error_code& result, std::size_t){
      ec = result;
      done = true;
    });
  deadline.wait(done, "sending request to");
  if(ec) throw FetchError("Cannot send request to " + url.host + ": " + ec.message());

  std::string raw;
  char buf[4096];
  for(;;) {
    std::size_t n = 0;
    done = false;
    stream.async_read_some(asio::buffer(buf),
      [&](const std::error_code& result, std::size_t read){
        ec = result;
        n = read;
        done = true;
      });
    deadline.wait(done, "reading from");
    raw.append(buf, n);
    if(raw.size() > max_size) {
      throw FetchError("Response from " + url.host + " is too large");
    }
    if(ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) break;
    if(ec) throw FetchError("Error reading from " + url.host + ": " + ec.message());
  }
  return raw;
}

HttpResponse parse_response(const std::string& raw, const std::string& host) {
  auto header_end = raw.find("\r\n\r\n");
  if(header_end == std::string::npos) {
    throw FetchError("Malformed HTTP response from " + host);
  }

  HttpResponse response;
  std::istringstream headers(raw.substr(0, header_end));
  std::string line;
  std::getline(headers, line);
  {
    std::istringstream status_line(line);
    std::string version;
    status_line >> version >> response.status;
    if(version.rfind("HTTP/", 0) != 0 || response.status == 0) {
      throw FetchError("Malformed HTTP status line from " + host);
    }
  }
  while(std::getline(headers, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    auto colon = line.find(':');
    if(colon == std::string::npos) continue;
    if(lower(line.substr(0, colon)) == "location") {
      auto value = line.substr(colon + 1);
      value.erase(0, value.find_first_not_of(" \t"));
      response.location = value;
    }
  }
  response.body = raw.substr(header_end + 4);
  return response;
}

HttpResponse http_get(const ParsedUrl& url, const FetchOptions& options) {
  asio::io_context io;
  tcp::socket socket(io);
  Deadline deadline(io, socket.lowest_layer(), options.timeout, url.host);
  connect(io, socket, deadline, url);
  return parse_response(round_trip(socket, deadline, url, options.max_size), url.host);
}

HttpResponse https_get(const ParsedUrl& url, const FetchOptions& options) {
  asio::io_context io;
  asio::ssl::context tls(asio::ssl::context::tls_client);
  std::error_code ec;
  tls.set_default_verify_paths(ec);
  if(ec) throw FetchError("Cannot load trusted certificates: " + ec.message());
  tls.set_verify_mode(asio::ssl::verify_peer, ec);
  if(ec) throw FetchError("Cannot enable certificate verification: " + ec.message());

  asio::ssl::stream<tcp::socket> stream(io, tls);
  stream.set_verify_callback(asio::ssl::host_name_verification(url.host), ec);
  if(ec) throw FetchError("Cannot verify host name " + url.host + ": " + ec.message());
  if(!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    throw FetchError("Cannot set TLS server name for " + url.host);
  }

  Deadline deadline(io, stream.lowest_layer(), options.timeout, url.host);
  connect(io, stream.next_layer(), deadline, url);

  bool done = false;
  stream.async_handshake(asio::ssl::stream_base::client,
    [&](const std::error_code& result){
      ec = result;
      done = true;
    });
  deadline.wait(done, "negotiating TLS with");
  if(ec) throw FetchError("TLS handshake with " + url.host + " failed: " + ec.message());

  return parse_response(round_trip(stream, deadline, url, options.max_size), url.host);
}

} // namespace

ParsedUrl parse_url(const std::string& url) {
  ParsedUrl out;
  auto scheme_end = url.find("://");
  if(scheme_end == std::string::npos) {
    if(lower(url.substr(0, 7)) == "magnet:") {
      out.scheme = "magnet";
    }
    out.target = url;
    return out;
  }
  out.scheme = lower(url.substr(0, scheme_end));
  auto rest = url.substr(scheme_end + 3);
  if(out.scheme == "file") {
    out.target = rest;
    return out;
  }
  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);
  auto colon = authority.rfind(':');
  if(colon != std::string::npos && authority.find(']') == std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
  } else {
    out.host = authority;
  }
  if(out.port.empty()) {
    out.port = (out.scheme == "https") ? "443" : "80";
  }
  return out;
}

ParsedUrl resolve_location(const ParsedUrl& base, const std::string& location) {
  if(location.find("://") != std::string::npos) {
    return parse_url(location);
  }
  ParsedUrl out = base;
  if(location.rfind("//", 0) == 0) {
    return parse_url(base.scheme + ":" + location);
  }
  if(!location.empty() && location.front() == '/') {
    out.target = location;
    return out;
  }
  std::string path = base.target.substr(0, base.target.find_first_of("?#"));
  out.target = path.substr(0, path.rfind('/') + 1) + location;
  return out;
}

std::vector<std::uint8_t> fetch_torrent_content(const std::string& url, const FetchOptions& options) {
  if(url.empty()) {
    throw FetchError("Remote torrent URL not configured");
  }

  ParsedUrl parsed = parse_url(url);
  if(parsed.scheme.empty() || parsed.scheme == "file") {
    return read_file(parsed.target, options.max_size);
  }
  if(parsed.scheme == "magnet") {
    throw FetchError("Magnet links are not supported; configure a .torrent URL");
  }

  for(int redirect = 0; redirect <= options.max_redirects; ++redirect) {
    if(parsed.scheme != "http" && parsed.scheme != "https") {
      throw FetchError("Unsupported URL scheme '" + parsed.scheme + "'");
    }
    if(parsed.host.empty()) {
      throw FetchError("Missing host in URL");
    }
    auto response = (parsed.scheme == "https") ? https_get(parsed, options)
                                               : http_get(parsed, options);
    if(response.status >= 300 && response.status < 400 && !response.location.empty()) {
      parsed = resolve_location(parsed, response.location);
      continue;
    }
    if(response.status != 200) {
      throw FetchError("HTTP " + std::to_string(response.status) + " fetching " + url);
    }
    if(response.body.empty()) {
      throw FetchError("Empty response fetching " + url);
    }
    return std::vector<std::uint8_t>(response.body.begin(), response.body.end());
  }
  throw FetchError("Too many redirects fetching " + url);
}

TorrentFetcher make_torrent_fetcher(FetchOptions options) {
  return [options](const std::string& url) {
    return fetch_torrent_content(url, options);
  };
}
