#include "stt/http_transcription_provider.hpp"
#include "audio/wav_encoder.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <mutex>

namespace voicebridge {
namespace stt {

namespace {

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

void addField(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

} // namespace

HttpTranscriptionProvider::HttpTranscriptionProvider(Options options)
    : options_(std::move(options)) {
    ensureCurlInitialized();
    while (!options_.url.empty() && options_.url.back() == '/') {
        options_.url.pop_back();
    }
}

std::string HttpTranscriptionProvider::getEndpoint() const {
    if (options_.apiFormat == "openai") {
        return options_.url + "/v1/audio/transcriptions";
    }
    return options_.url + "/inference";
}

ProviderResponse HttpTranscriptionProvider::transcribe(const std::vector<uint8_t>& audio,
                                                       const audio::AudioFormat& format) {
    if (audio.empty()) {
        return ProviderResponse::failure("empty audio");
    }

    auto wav_data = audio::wav::encode(audio, format);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return ProviderResponse::failure("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    struct curl_slist* headers = nullptr;
    if (options_.apiFormat == "openai") {
        addField(mime, "model", options_.model);
        if (!options_.apiKey.empty()) {
            std::string auth = "Authorization: Bearer " + options_.apiKey;
            headers = curl_slist_append(headers, auth.c_str());
        }
    } else {
        addField(mime, "temperature", "0.0");
    }
    addField(mime, "response_format", "json");
    if (!options_.language.empty()) {
        addField(mime, "language", options_.language);
    }

    std::string endpoint = getEndpoint();
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.requestTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        utils::Logger::debug("Provider " + options_.name + " request failed: " + curl_easy_strerror(res));
        return ProviderResponse::failure(std::string("curl error: ") + curl_easy_strerror(res));
    }

    return parseResponse(http_status, response_body);
}

ProviderResponse HttpTranscriptionProvider::parseResponse(long httpStatus, const std::string& body) const {
    utils::JsonValue json;
    try {
        json = utils::JsonParser::parse(body);
    } catch (const std::exception& e) {
        if (httpStatus >= 400) {
            return ProviderResponse::failure("HTTP " + std::to_string(httpStatus));
        }
        return ProviderResponse::failure(std::string("JSON parse error: ") + e.what());
    }

    if (!json.isObject()) {
        return ProviderResponse::failure("unexpected response: " + body);
    }

    if (json.hasProperty("error")) {
        const auto& error = json.getProperty("error");
        // OpenAI nests the message in an object
        std::string message = error.isObject() ? error.getString("message", "unknown error")
                                               : (error.isString() ? error.asString() : "unknown error");
        return ProviderResponse::failure("server error: " + message);
    }
    if (httpStatus >= 400) {
        return ProviderResponse::failure("HTTP " + std::to_string(httpStatus));
    }
    if (!json.getProperty("text").isString()) {
        return ProviderResponse::failure("unexpected response: " + body);
    }

    float confidence = options_.defaultConfidence;
    if (json.getProperty("confidence").isNumber()) {
        confidence = static_cast<float>(json.getProperty("confidence").asNumber());
    }
    confidence = std::clamp(confidence, 0.0f, 1.0f);

    return ProviderResponse(trim(json.getString("text")), confidence);
}

} // namespace stt
} // namespace voicebridge
