#include "whisper_server_client.hpp"

#include <curl/curl.h>

static size_t discard_body(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

WhisperServerClient::WhisperServerClient(std::string base_url, std::string language)
    : base_url_(std::move(base_url)),
      inference_(HttpBackend::Options{
          .name = "local-server",
          .url = base_url_,
          .api_format = "whisper.cpp",
          .language = std::move(language),
          .timeout_seconds = 120,
      }) {}

bool WhisperServerClient::healthy() {
    CURL* curl = curl_easy_init();
    if (!curl) return false;

    const std::string url = base_url_ + "/health";
    long http_code = 0;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 2L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    // whisper-server answers 503 while the model is still loading.
    return rc == CURLE_OK && http_code == 200;
}

std::expected<TranscriptResult, std::string>
WhisperServerClient::transcribe(std::span<const int16_t> audio, uint32_t sample_rate) {
    return inference_.transcribe(audio, sample_rate);
}
