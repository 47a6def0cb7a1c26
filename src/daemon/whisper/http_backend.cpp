#include "http_backend.hpp"

#include "platform/linux/child_process.hpp"
#include "wav_encoder.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

HttpBackend::HttpBackend(Options options)
    : options_(std::move(options)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpBackend::~HttpBackend() {
    curl_global_cleanup();
}

std::expected<TranscriptResult, std::string>
HttpBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }

    double duration_s = wav::duration_seconds(audio.size(), sample_rate);
    auto wav_data = wav::encode(audio, sample_rate);

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    auto* file = curl_mime_addpart(mime);
    curl_mime_name(file, "file");
    curl_mime_data(file, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(file, "audio.wav");
    curl_mime_type(file, "audio/wav");

    if (options_.api_format == "whisper.cpp") {
        endpoint = options_.url + "/inference";
        add_field(mime, "temperature", "0.0");
    } else {
        endpoint = options_.url + "/v1/audio/transcriptions";
        add_field(mime, "model", options_.model);
    }
    add_field(mime, "response_format", "json");
    if (!options_.language.empty()) {
        add_field(mime, "language", options_.language);
    }

    curl_slist* headers = nullptr;
    if (!options_.api_key.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + options_.api_key).c_str());
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        return std::unexpected(options_.name + " API error: HTTP " + std::to_string(http_code));
    }

    auto text = parse_response(response_body);
    if (!text) return std::unexpected(text.error());

    return TranscriptResult{
        .text = std::move(*text),
        .duration_s = duration_s,
        .processing_s = processing_s,
        .backend = options_.name,
    };
}

std::expected<std::string, std::string> HttpBackend::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("text")) {
            return child::trim(j["text"].get<std::string>());
        }
        if (j.contains("error")) {
            auto& err = j["error"];
            if (err.is_object() && err.contains("message")) {
                return std::unexpected("server error: " + err["message"].get<std::string>());
            }
            return std::unexpected("server error: " + err.dump());
        }
        return std::unexpected("unexpected response: " + body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
