#include "lan_backend.hpp"
#include "inference_response.hpp"
#include "wav/wav_encoder.hpp"

#include <curl/curl.h>

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

LanBackend::LanBackend(std::string url, std::string api_format)
    : url_(std::move(url)), api_format_(std::move(api_format)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<std::vector<TranscriptSegment>, std::string>
LanBackend::transcribe(std::span<const float> audio, uint32_t sample_rate,
                       const DecodeConfig& config) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }

    double duration_s = static_cast<double>(audio.size()) / sample_rate;

    auto wav_data = wav::encode(audio, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    add_field(mime, "response_format", "verbose_json");
    if (!config.language.empty()) {
        add_field(mime, "language", config.language);
    }

    if (api_format_ == "openai") {
        endpoint = url_ + (config.translate ? "/v1/audio/translations" : "/v1/audio/transcriptions");
        add_field(mime, "model", "whisper-1");
        add_field(mime, "timestamp_granularities[]", "segment");
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";
        add_field(mime, "temperature", "0.0");
        if (config.translate) {
            add_field(mime, "translate", "true");
        }
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 600L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_code >= 400 && response_body.empty()) {
        return std::unexpected("server returned HTTP " + std::to_string(http_code));
    }

    return parse_inference_response(response_body, duration_s);
}
