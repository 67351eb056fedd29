#pragma once

#include "kefctl/kefctl.h"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kefctl {

#ifdef KEFCTL_TESTING
namespace test {

struct HttpResponse {
  int status = 0;
  std::string body;
};

std::string BuildMSearchRequest(const std::string& search_target);
bool IsQualifyingReply(const std::string& payload,
                       const std::vector<std::string>& vendor_markers);
std::optional<std::string> SubnetPrefix(const std::string& ipv4);
std::vector<std::string> CollectSweepPrefixes(
    const std::vector<NetworkInterface>& interfaces);

std::string UrlEncode(const std::string& text);
std::string BuildApiTarget(const std::string& endpoint,
                           const std::string& path,
                           const std::string& roles,
                           const std::string* value);
bool ParseHttpResponse(const std::string& raw, HttpResponse* out,
                       std::string* error);
bool HasVendorFingerprint(const nlohmann::json& body);

int ClampVolume(int level);
bool ParseVolumeText(const std::string& text, int* out);
bool ParseModel(const std::string& release_text, std::string* model);
bool ParsePlaybackInfo(const nlohmann::json& body, PlaybackInfo* out,
                       std::string* error);

int GetPollLoopStarts(const Controller& controller);

}  // namespace test
#endif

}  // namespace kefctl
