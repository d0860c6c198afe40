#include "internal/geo/nominatim_geocoder.hpp"

#include <curl/curl.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <iomanip>
#include <mutex>
#include <sstream>

#include "internal/observability/logging.hpp"

namespace framecache::geo {

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

void GlobalCurlInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

NominatimGeocoder::NominatimGeocoder(NominatimOptions options) : options_(std::move(options)) {
  GlobalCurlInit();
}

NominatimGeocoder::~NominatimGeocoder() = default;

std::string NominatimGeocoder::BuildUrl(double latitude, double longitude) const {
  std::ostringstream url;
  url << options_.endpoint << "?format=jsonv2&zoom=14&addressdetails=0" << std::fixed << std::setprecision(kCoordinatePrecision)
      << "&lat=" << latitude << "&lon=" << longitude;
  return url.str();
}

std::string NominatimGeocoder::ParseDisplayName(const std::string& json) {
  google::protobuf::Struct reply;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &reply, options);
  if (!status.ok()) {
    return {};
  }

  const auto& fields = reply.fields();
  if (fields.count("error")) {
    return {};
  }
  auto it = fields.find("display_name");
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

std::string NominatimGeocoder::Resolve(double latitude, double longitude) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    FRAMECACHE_LOG_ERROR("geocode: failed to initialize curl");
    return {};
  }

  std::string body;
  const auto  url = BuildUrl(latitude, longitude);

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

  struct curl_slist* headers = nullptr;
  if (!options_.language.empty()) {
    const auto header = "Accept-Language: " + options_.language;
    headers = curl_slist_append(headers, header.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }

  CURLcode rc        = curl_easy_perform(curl);
  long     http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_easy_cleanup(curl);
  curl_slist_free_all(headers);

  if (rc != CURLE_OK) {
    FRAMECACHE_LOG_WARN("geocode request failed", {observability::StringField("error", curl_easy_strerror(rc))});
    return {};
  }
  if (http_code != 200) {
    FRAMECACHE_LOG_WARN("geocode request rejected", {observability::IntField("http_status", http_code)});
    return {};
  }

  return ParseDisplayName(body);
}

} // namespace framecache::geo
