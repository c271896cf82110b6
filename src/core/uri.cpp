#include "core/uri.hpp"
#include <cctype>
#include <sstream>
#include <vector>

namespace netfs {

namespace {

Error malformed(const std::string& text, const std::string& detail) {
  return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::MALFORMED_URI,
    "Malformed URI '" + text + "'", detail);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// PATH HELPERS
//==============================================

std::string percent_decode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = hex_value(text[i + 1]);
      int lo = hex_value(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string percent_encode_path(const std::string& path) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(path.size());
  for (unsigned char c : path) {
    if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string normalize_path(const std::string& path) {
  std::vector<std::string> segments;
  std::string segment;
  std::istringstream in(path);

  while (std::getline(in, segment, '/')) {
    if (segment.empty() || segment == ".") {
      continue;
    }
    if (segment == "..") {
      if (!segments.empty()) {
        segments.pop_back();
      }
      continue;
    }
    segments.push_back(segment);
  }

  if (segments.empty()) {
    return "/";
  }

  std::string result;
  for (const auto& s : segments) {
    result += "/" + s;
  }
  return result;
}


//==============================================
// PARSING
//==============================================

Result<RemoteUri> RemoteUri::parse(const std::string& text) {
  RemoteUri uri;

  if (text.empty()) {
    return malformed(text, "empty");
  }

  // Plain absolute path
  if (text.front() == '/') {
    uri.protocol = Protocol::LOCAL;
    uri.path = normalize_path(text);
    return Result<RemoteUri>::success(uri);
  }

  const auto scheme_end = text.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return malformed(text, "missing scheme");
  }

  const auto protocol = protocol_from_scheme(text.substr(0, scheme_end));
  if (!protocol) {
    return malformed(text, "unknown scheme '" + text.substr(0, scheme_end) + "'");
  }
  uri.protocol = *protocol;

  std::string rest = text.substr(scheme_end + 3);

  // Query parameters
  const auto query_start = rest.find('?');
  if (query_start != std::string::npos) {
    std::istringstream query(rest.substr(query_start + 1));
    std::string param;
    while (std::getline(query, param, '&')) {
      const auto eq = param.find('=');
      if (eq != std::string::npos && param.substr(0, eq) == "cred") {
        uri.credentials_id = percent_decode(param.substr(eq + 1));
      }
    }
    rest = rest.substr(0, query_start);
  }

  const auto path_start = rest.find('/');
  std::string authority = rest.substr(0, path_start);
  std::string raw_path = path_start == std::string::npos ? "/" : rest.substr(path_start);

  if (uri.protocol == Protocol::LOCAL) {
    if (!authority.empty() && authority != "localhost") {
      return malformed(text, "file URIs cannot name a remote host");
    }
    uri.path = normalize_path(percent_decode(raw_path));
    return Result<RemoteUri>::success(uri);
  }

  // Drop any user info, credentials come from the credential store
  const auto at = authority.rfind('@');
  if (at != std::string::npos) {
    authority = authority.substr(at + 1);
  }

  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      return malformed(text, "unterminated IPv6 literal");
    }
    uri.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return malformed(text, "unexpected text after IPv6 literal");
      }
      port_text = authority.substr(close + 2);
    }
  } else {
    const auto colon = authority.find(':');
    uri.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  if (uri.host.empty()) {
    return malformed(text, "missing host");
  }

  uri.port = default_port(uri.protocol);
  if (!port_text.empty()) {
    unsigned long value = 0;
    for (char c : port_text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        return malformed(text, "invalid port '" + port_text + "'");
      }
      value = value * 10 + static_cast<unsigned long>(c - '0');
      if (value > 65535) {
        return malformed(text, "port out of range");
      }
    }
    if (value == 0) {
      return malformed(text, "port out of range");
    }
    uri.port = static_cast<uint16_t>(value);
  }

  std::string decoded = normalize_path(percent_decode(raw_path));

  if (uri.protocol == Protocol::SMB) {
    if (decoded == "/") {
      return malformed(text, "SMB URIs must name a share");
    }
    const auto share_end = decoded.find('/', 1);
    uri.share = decoded.substr(1, share_end == std::string::npos ? std::string::npos : share_end - 1);
    decoded = share_end == std::string::npos ? "/" : decoded.substr(share_end);
  }

  uri.path = decoded;
  return Result<RemoteUri>::success(uri);
}


//==============================================
// ACCESSORS
//==============================================

ConnectionInfo RemoteUri::connection_info() const {
  ConnectionInfo info;
  info.protocol = protocol;
  info.host = host;
  info.port = port;
  info.share = share;
  return info;
}

std::string RemoteUri::to_string() const {
  std::string result = std::string(protocol_to_scheme(protocol)) + "://";

  if (protocol != Protocol::LOCAL) {
    const bool ipv6 = host.find(':') != std::string::npos;
    result += ipv6 ? "[" + host + "]" : host;
    if (port != 0 && port != default_port(protocol)) {
      result += ":" + std::to_string(port);
    }
    if (!share.empty()) {
      result += "/" + percent_encode_path(share);
    }
  }

  result += percent_encode_path(path);
  if (!credentials_id.empty()) {
    result += "?cred=" + credentials_id;
  }
  return result;
}

std::string RemoteUri::file_name() const {
  if (is_root()) {
    return {};
  }
  return path.substr(path.rfind('/') + 1);
}

std::string RemoteUri::location() const {
  RemoteUri bare(*this);
  bare.credentials_id.clear();
  return bare.to_string();
}

RemoteUri RemoteUri::parent() const {
  RemoteUri result(*this);
  if (is_root()) {
    return result;
  }
  const auto slash = path.rfind('/');
  result.path = slash == 0 ? "/" : path.substr(0, slash);
  return result;
}

RemoteUri RemoteUri::child(const std::string& name) const {
  RemoteUri result(*this);
  result.path = normalize_path(path + "/" + name);
  return result;
}

bool RemoteUri::same_connection(const RemoteUri& other) const {
  return connection_info().key() == other.connection_info().key();
}

} // namespace netfs
