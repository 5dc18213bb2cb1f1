#include "app/NtfyNotifier.hpp"
#include "app/NotifyMessage.hpp"

#include <curl/curl.h>
#include <cstdio>
#include <string>

namespace snapwatch::app {

using snapwatch::model::Event;
using snapwatch::model::NotifyResult;

static size_t discard_body(char*, size_t size, size_t nmemb, void*) { return size * nmemb; }

NtfyNotifier::NtfyNotifier(snapwatch::model::MonitorConfig cfg) : cfg_(std::move(cfg)) {}

NotifyResult NtfyNotifier::notify(const Event& e) {
  const char* name = snapwatch::model::to_string(e.kind);
  auto msg = build_message(e, cfg_);
  if (!msg) return {false, std::string("no template for event '") + name + "'"};

  CURL* c = curl_easy_init();
  if (!c) return {false, "curl_easy_init failed"};

  struct curl_slist* h = nullptr;
  if (!msg->title.empty()) h = curl_slist_append(h, ("Title: " + msg->title).c_str());
  if (msg->priority) h = curl_slist_append(h, ("Priority: " + std::to_string(*msg->priority)).c_str());
  if (!msg->tags.empty()) {
    std::string tags;
    for (const auto& t : msg->tags) {
      if (!tags.empty()) tags += ',';
      tags += t;
    }
    h = curl_slist_append(h, ("Tags: " + tags).c_str());
  }

  curl_easy_setopt(c, CURLOPT_URL, msg->url.c_str());
  curl_easy_setopt(c, CURLOPT_POST, 1L);
  curl_easy_setopt(c, CURLOPT_POSTFIELDS, msg->body.c_str());
  curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(msg->body.size()));
  if (h) curl_easy_setopt(c, CURLOPT_HTTPHEADER, h);
  curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg_.notify.timeout.count()));
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, discard_body);

  CURLcode rc = curl_easy_perform(c);
  long status = 0;
  if (rc == CURLE_OK) curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(h);
  curl_easy_cleanup(c);

  if (rc != CURLE_OK) return {false, curl_easy_strerror(rc)};
  if (status >= 400) return {false, "HTTP " + std::to_string(status)};
  std::fprintf(stderr, "snapwatch: ntfy(%s) sent\n", name);
  return {true, {}};
}

} // namespace snapwatch::app
