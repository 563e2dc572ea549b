#include "stt/provider_factory.hpp"
#include "stt/http_transcription_provider.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace voicebridge {
namespace stt {

ProviderPtr createProvider(const utils::ProviderSettings& settings,
                           std::chrono::milliseconds requestTimeout) {
    if (settings.type == "http") {
        HttpTranscriptionProvider::Options options;
        options.name = settings.name;
        options.url = settings.url;
        options.apiFormat = settings.apiFormat;
        options.apiKey = settings.apiKey;
        options.model = settings.model;
        options.language = settings.language;
        options.defaultConfidence = settings.defaultConfidence;
        // Let the dispatcher's timeout fire first; curl only bounds the abandoned call
        options.requestTimeout = requestTimeout * 2;
        return std::make_shared<HttpTranscriptionProvider>(options);
    }
    throw utils::ConfigException("Unsupported provider type '" + settings.type + "' for " + settings.name);
}

std::vector<ProviderPtr> createProviders(const utils::Config& config) {
    std::vector<ProviderPtr> providers;
    for (const auto& settings : config.providers) {
        providers.push_back(createProvider(settings, config.dispatch.providerTimeout));
        utils::Logger::info("Registered provider " + settings.name + " (" + settings.apiFormat +
                            " at " + settings.url + ")");
    }
    return providers;
}

} // namespace stt
} // namespace voicebridge
