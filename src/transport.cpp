#include "kefctl/transport.h"
#include "kefctl/test_hooks.h"

#include "internal.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace kefctl {
namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kMaxResponseSize = 1 << 20;
constexpr size_t kReadChunkSize = 4096;
constexpr const char* kHeaderTerminator = "\r\n\r\n";

struct ParsedResponse {
  int status = 0;
  std::string body;
};

std::string ErrnoText(const char* what) {
  return std::string(what) + " failed: " + std::strerror(errno);
}

// Convert the time left until `deadline` into a select() timeout.
timeval RemainingTimeval(Clock::time_point deadline) {
  const auto now = Clock::now();
  const auto left = deadline > now
                        ? std::chrono::duration_cast<std::chrono::microseconds>(deadline - now)
                        : std::chrono::microseconds(0);
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(left.count() / 1000000);
  tv.tv_usec = static_cast<suseconds_t>(left.count() % 1000000);
  return tv;
}

// Minimal non-blocking TCP socket with deadline-bounded connect/send/recv.
class TcpSocket {
 public:
  TcpSocket() = default;
  ~TcpSocket() { Close(); }

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  bool Connect(const std::string& host, uint16_t port, Clock::time_point deadline,
               Error* error) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
      return internal::Fail(error, ErrorCode::kTransportError,
                            "invalid IPv4 address: " + host);
    }
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      return internal::Fail(error, ErrorCode::kTransportError, ErrnoText("socket()"));
    }
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
      const std::string message = ErrnoText("fcntl(O_NONBLOCK)");
      Close();
      return internal::Fail(error, ErrorCode::kTransportError, message);
    }
    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
      return true;
    }
    if (errno != EINPROGRESS) {
      const std::string message = ErrnoText("connect()");
      Close();
      return internal::Fail(error, ErrorCode::kTransportError, message);
    }
    if (!WaitReady(true, deadline, error)) {
      Close();
      return false;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
      const std::string message = ErrnoText("getsockopt(SO_ERROR)");
      Close();
      return internal::Fail(error, ErrorCode::kTransportError, message);
    }
    if (so_error != 0) {
      std::ostringstream oss;
      oss << "connect(" << host << ":" << port << ") failed: "
          << std::strerror(so_error);
      Close();
      return internal::Fail(error, ErrorCode::kTransportError, oss.str());
    }
    return true;
  }

  bool SendAll(const std::string& data, Clock::time_point deadline, Error* error) {
    size_t sent = 0;
    while (sent < data.size()) {
      const ssize_t result = ::send(fd_, data.data() + sent, data.size() - sent,
                                    MSG_NOSIGNAL);
      if (result > 0) {
        sent += static_cast<size_t>(result);
        continue;
      }
      if (result < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        return internal::Fail(error, ErrorCode::kTransportError, ErrnoText("send()"));
      }
      if (!WaitReady(true, deadline, error)) {
        return false;
      }
    }
    return true;
  }

  // Read until the peer closes or the response is known to be complete.
  bool ReadResponse(std::string* out, Clock::time_point deadline, Error* error) {
    char buffer[kReadChunkSize];
    while (true) {
      if (ResponseComplete(*out)) {
        return true;
      }
      if (!WaitReady(false, deadline, error)) {
        return false;
      }
      const ssize_t result = ::recv(fd_, buffer, sizeof(buffer), 0);
      if (result == 0) {
        return true;
      }
      if (result < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
          continue;
        }
        return internal::Fail(error, ErrorCode::kTransportError, ErrnoText("recv()"));
      }
      out->append(buffer, static_cast<size_t>(result));
      if (out->size() > kMaxResponseSize) {
        return internal::Fail(error, ErrorCode::kMalformedResponse,
                              "response exceeds size limit");
      }
    }
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  bool WaitReady(bool for_write, Clock::time_point deadline, Error* error) {
    while (true) {
      fd_set fds;
      FD_ZERO(&fds);
      FD_SET(fd_, &fds);
      timeval tv = RemainingTimeval(deadline);
      const int ready = ::select(fd_ + 1, for_write ? nullptr : &fds,
                                 for_write ? &fds : nullptr, nullptr, &tv);
      if (ready > 0) {
        return true;
      }
      if (ready == 0) {
        return internal::Fail(error, ErrorCode::kTimeout, "request timed out");
      }
      if (errno != EINTR) {
        return internal::Fail(error, ErrorCode::kTransportError, ErrnoText("select()"));
      }
    }
  }

  // A Content-Length response is complete once the declared body arrived.
  static bool ResponseComplete(const std::string& raw) {
    const auto header_end = raw.find(kHeaderTerminator);
    if (header_end == std::string::npos) {
      return false;
    }
    std::string headers = raw.substr(0, header_end);
    std::transform(headers.begin(), headers.end(), headers.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto pos = headers.find("\r\ncontent-length:");
    if (pos == std::string::npos) {
      return false;
    }
    const size_t value_start = pos + std::strlen("\r\ncontent-length:");
    const size_t length = std::strtoul(headers.c_str() + value_start, nullptr, 10);
    return raw.size() - (header_end + 4) >= length;
  }

  int fd_ = -1;
};

std::string Trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool DecodeChunked(const std::string& body, std::string* out, std::string* error) {
  size_t pos = 0;
  out->clear();
  while (true) {
    const auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) {
      *error = "truncated chunk header";
      return false;
    }
    const std::string size_text = body.substr(pos, line_end - pos);
    char* parse_end = nullptr;
    const unsigned long size = std::strtoul(size_text.c_str(), &parse_end, 16);
    if (parse_end == size_text.c_str()) {
      *error = "invalid chunk size";
      return false;
    }
    pos = line_end + 2;
    if (size == 0) {
      return true;
    }
    if (body.size() < pos + size) {
      *error = "truncated chunk";
      return false;
    }
    out->append(body, pos, size);
    pos += size + 2;
  }
}

// Parse status line, headers and body of a complete HTTP/1.x response.
bool ParseResponse(const std::string& raw, ParsedResponse* out, std::string* error) {
  const auto header_end = raw.find(kHeaderTerminator);
  if (header_end == std::string::npos) {
    *error = "incomplete HTTP headers";
    return false;
  }
  std::istringstream headers(raw.substr(0, header_end));
  std::string status_line;
  std::getline(headers, status_line);
  if (status_line.compare(0, 5, "HTTP/") != 0) {
    *error = "invalid status line";
    return false;
  }
  const auto space = status_line.find(' ');
  if (space == std::string::npos) {
    *error = "invalid status line";
    return false;
  }
  out->status = std::atoi(status_line.c_str() + space + 1);
  if (out->status < 100 || out->status > 599) {
    *error = "invalid status code";
    return false;
  }

  bool chunked = false;
  std::optional<size_t> content_length;
  std::string line;
  while (std::getline(headers, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string name = ToLower(Trim(line.substr(0, colon)));
    const std::string value = Trim(line.substr(colon + 1));
    if (name == "transfer-encoding" && ToLower(value).find("chunked") != std::string::npos) {
      chunked = true;
    } else if (name == "content-length") {
      content_length = static_cast<size_t>(std::strtoul(value.c_str(), nullptr, 10));
    }
  }

  const std::string body = raw.substr(header_end + 4);
  if (chunked) {
    return DecodeChunked(body, &out->body, error);
  }
  if (content_length.has_value()) {
    if (body.size() < content_length.value()) {
      *error = "truncated body";
      return false;
    }
    out->body = body.substr(0, content_length.value());
    return true;
  }
  out->body = body;
  return true;
}

std::string UrlEncodeComponent(const std::string& text) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(text.size() * 3);
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[c >> 4]);
      encoded.push_back(kHex[c & 0x0f]);
    }
  }
  return encoded;
}

// Build "/api/<endpoint>?path=...&roles=...[&value=...]".
std::string ApiTarget(const std::string& endpoint, const std::string& path,
                      const std::string& roles, const std::string* value) {
  std::string target = "/api/" + endpoint + "?path=" + UrlEncodeComponent(path) +
                       "&roles=" + UrlEncodeComponent(roles);
  if (value) {
    target += "&value=" + UrlEncodeComponent(*value);
  }
  return target;
}

// The vendor wraps every value in `[{"<type>_": value, ...}]`; the sweep only
// checks that the first element carries a string.
bool VendorFingerprint(const nlohmann::json& body) {
  if (!body.is_array() || body.empty() || !body.front().is_object()) {
    return false;
  }
  const auto it = body.front().find("string_");
  return it != body.front().end() && it->is_string();
}

// Return the first element of a getData response as an object.
bool FirstObject(const nlohmann::json& body, const nlohmann::json** out, Error* error) {
  if (!body.is_array() || body.empty()) {
    return internal::Fail(error, ErrorCode::kMalformedResponse, "empty response");
  }
  if (!body.front().is_object()) {
    return internal::Fail(error, ErrorCode::kMalformedResponse,
                          "invalid response format");
  }
  *out = &body.front();
  return true;
}

// Integer JSON number that fits in an int.
bool ToInt(const nlohmann::json& value, int* out) {
  if (value.is_number_unsigned()) {
    const auto number = value.get<uint64_t>();
    if (number > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
      return false;
    }
    *out = static_cast<int>(number);
    return true;
  }
  if (value.is_number_integer()) {
    const auto number = value.get<int64_t>();
    if (number < std::numeric_limits<int>::min() ||
        number > std::numeric_limits<int>::max()) {
      return false;
    }
    *out = static_cast<int>(number);
    return true;
  }
  return false;
}

}  // namespace

bool Transport::GetInt(const DeviceAddress& device, const std::string& path,
                       int* out, Error* error) {
  nlohmann::json body;
  if (!GetData(device, path, "value", &body, error)) {
    return false;
  }
  const nlohmann::json* first = nullptr;
  if (!FirstObject(body, &first, error)) {
    return false;
  }
  const auto it = first->find("i32_");
  int value = 0;
  if (it == first->end() || !ToInt(*it, &value)) {
    return internal::Fail(error, ErrorCode::kMalformedResponse,
                          "invalid integer format");
  }
  if (out) {
    *out = value;
  }
  return true;
}

bool Transport::GetString(const DeviceAddress& device, const std::string& path,
                          std::string* out, Error* error) {
  nlohmann::json body;
  if (!GetData(device, path, "value", &body, error)) {
    return false;
  }
  const nlohmann::json* first = nullptr;
  if (!FirstObject(body, &first, error)) {
    return false;
  }
  const auto it = first->find("string_");
  if (it == first->end() || !it->is_string()) {
    return internal::Fail(error, ErrorCode::kMalformedResponse,
                          "invalid string format");
  }
  if (out) {
    *out = it->get<std::string>();
  }
  return true;
}

bool Transport::SetInt(const DeviceAddress& device, const std::string& path,
                       int value, Error* error) {
  const std::string json_value =
      "{\"type\":\"i32_\",\"i32_\":" + std::to_string(value) + "}";
  return SetData(device, path, "value", json_value, error);
}

bool Transport::ProbeExistence(const DeviceAddress& device, Error* error) {
  nlohmann::json body;
  if (!GetData(device, kDeviceNamePath, "value", &body, error)) {
    return false;
  }
  if (!VendorFingerprint(body)) {
    return internal::Fail(error, ErrorCode::kMalformedResponse,
                          "response does not match the vendor envelope");
  }
  return true;
}

HttpTransport::HttpTransport(std::chrono::milliseconds timeout, uint16_t default_port)
    : timeout_(timeout), default_port_(default_port) {}

bool HttpTransport::GetData(const DeviceAddress& device,
                            const std::string& path,
                            const std::string& roles,
                            nlohmann::json* out,
                            Error* error) {
  std::string body;
  if (!Get(device, ApiTarget("getData", path, roles, nullptr), &body, error)) {
    return false;
  }
  nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return internal::Fail(error, ErrorCode::kMalformedResponse,
                          "invalid JSON in response to " + path);
  }
  if (!parsed.is_array()) {
    return internal::Fail(error, ErrorCode::kMalformedResponse,
                          "expected JSON array in response to " + path);
  }
  if (out) {
    *out = std::move(parsed);
  }
  return true;
}

bool HttpTransport::SetData(const DeviceAddress& device,
                            const std::string& path,
                            const std::string& roles,
                            const std::string& value,
                            Error* error) {
  std::string body;
  return Get(device, ApiTarget("setData", path, roles, &value), &body, error);
}

bool HttpTransport::Get(const DeviceAddress& device, const std::string& target,
                        std::string* body, Error* error) {
  if (device.host.empty()) {
    return internal::Fail(error, ErrorCode::kNoHostConfigured, "no host configured");
  }
  const uint16_t port = device.port.value_or(default_port_);
  const auto deadline = Clock::now() + timeout_;

  TcpSocket socket;
  if (!socket.Connect(device.host, port, deadline, error)) {
    return false;
  }

  std::ostringstream request;
  request << "GET " << target << " HTTP/1.1\r\n"
          << "Host: " << device.host;
  if (port != kDefaultHttpPort) {
    request << ":" << port;
  }
  request << "\r\n"
          << "Accept: application/json\r\n"
          << "User-Agent: kefctl\r\n"
          << "Connection: close\r\n"
          << "\r\n";
  if (!socket.SendAll(request.str(), deadline, error)) {
    return false;
  }

  std::string raw;
  if (!socket.ReadResponse(&raw, deadline, error)) {
    return false;
  }
  ParsedResponse response;
  std::string parse_error;
  if (!ParseResponse(raw, &response, &parse_error)) {
    return internal::Fail(error, ErrorCode::kMalformedResponse, parse_error);
  }
  if (response.status < 200 || response.status >= 300) {
    return internal::Fail(error, ErrorCode::kTransportError,
                          "HTTP error: " + std::to_string(response.status));
  }
  *body = std::move(response.body);
  return true;
}

#ifdef KEFCTL_TESTING
namespace test {

std::string UrlEncode(const std::string& text) {
  return UrlEncodeComponent(text);
}

std::string BuildApiTarget(const std::string& endpoint,
                           const std::string& path,
                           const std::string& roles,
                           const std::string* value) {
  return ApiTarget(endpoint, path, roles, value);
}

bool ParseHttpResponse(const std::string& raw, HttpResponse* out,
                       std::string* error) {
  ParsedResponse parsed;
  std::string parse_error;
  if (!ParseResponse(raw, &parsed, &parse_error)) {
    if (error) {
      *error = parse_error;
    }
    return false;
  }
  if (out) {
    out->status = parsed.status;
    out->body = parsed.body;
  }
  return true;
}

bool HasVendorFingerprint(const nlohmann::json& body) {
  return VendorFingerprint(body);
}

}  // namespace test
#endif

}  // namespace kefctl
