#pragma once

#include "stt/transcription_provider.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <vector>

namespace voicebridge {
namespace stt {

// Throws ConfigException for unsupported provider types
ProviderPtr createProvider(const utils::ProviderSettings& settings,
                           std::chrono::milliseconds requestTimeout);

// Providers in configured order: primary, secondary, fallback...
std::vector<ProviderPtr> createProviders(const utils::Config& config);

} // namespace stt
} // namespace voicebridge
